// Sealed sequences for the immutable IR
//
// ListBuilder is the only mutable form: it accepts appends and edits until
// seal() is called, then rejects every further change with
// ImmutabilityViolation. SealedList is what nodes store. It exposes reads
// only, so there is nothing to call that could change it.

#pragma once

#include "ir/ir_error.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace irkit::imm {

template <typename T> class ListBuilder;

template <typename T> class SealedList {
public:
    using value_type = T;
    using const_iterator = typename std::vector<T>::const_iterator;

    SealedList() = default;
    SealedList(const SealedList&) = default;
    SealedList(SealedList&&) noexcept = default;

    // Replacing a sealed list wholesale is a mutation too
    auto operator=(const SealedList&) -> SealedList& = delete;
    auto operator=(SealedList&&) -> SealedList& = delete;

    [[nodiscard]] auto size() const -> size_t {
        return items_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return items_.empty();
    }

    [[nodiscard]] auto operator[](size_t index) const -> const T& {
        return items_[index];
    }

    [[nodiscard]] auto at(size_t index) const -> const T& {
        return items_.at(index);
    }

    [[nodiscard]] auto front() const -> const T& {
        return items_.front();
    }

    [[nodiscard]] auto back() const -> const T& {
        return items_.back();
    }

    [[nodiscard]] auto begin() const -> const_iterator {
        return items_.begin();
    }

    [[nodiscard]] auto end() const -> const_iterator {
        return items_.end();
    }

    /// Copies the elements into a fresh, mutable vector.
    [[nodiscard]] auto to_vector() const -> std::vector<T> {
        return items_;
    }

private:
    friend class ListBuilder<T>;

    explicit SealedList(std::vector<T> items) : items_(std::move(items)) {}

    std::vector<T> items_;
};

template <typename T> class ListBuilder {
public:
    using value_type = T;

    ListBuilder() = default;
    explicit ListBuilder(std::vector<T> items) : items_(std::move(items)) {}

    void append(T item) {
        check_open("append");
        items_.push_back(std::move(item));
    }

    void extend(const std::vector<T>& items) {
        check_open("extend");
        items_.insert(items_.end(), items.begin(), items.end());
    }

    void insert(size_t index, T item) {
        check_open("insert");
        items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(index), std::move(item));
    }

    void remove(size_t index) {
        check_open("remove");
        items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
    }

    void pop_back() {
        check_open("pop_back");
        items_.pop_back();
    }

    void clear() {
        check_open("clear");
        items_.clear();
    }

    [[nodiscard]] auto size() const -> size_t {
        return items_.size();
    }

    [[nodiscard]] auto operator[](size_t index) const -> const T& {
        return items_[index];
    }

    [[nodiscard]] auto is_sealed() const -> bool {
        return sealed_;
    }

    /// Freezes the builder and returns the sealed contents. A builder can be
    /// sealed exactly once.
    [[nodiscard]] auto seal() -> SealedList<T> {
        check_open("seal");
        sealed_ = true;
        return SealedList<T>(items_);
    }

private:
    void check_open(const char* operation) const {
        if (sealed_) {
            throw ir::ImmutabilityViolation(std::string(operation) + " on a sealed list");
        }
    }

    std::vector<T> items_;
    bool sealed_ = false;
};

/// Seals a vector in one step.
template <typename T> [[nodiscard]] auto seal_list(std::vector<T> items) -> SealedList<T> {
    ListBuilder<T> builder(std::move(items));
    return builder.seal();
}

} // namespace irkit::imm
