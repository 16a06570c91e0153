#pragma once

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <utility>
#include <vector>

namespace tabula {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// A typed, owning columnar storage container.
///
/// Column<T> owns a contiguous vector of homogeneously typed values
/// and exposes span-based access for zero-copy interop.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;

    static_assert(ColumnElement<T>,
                  "Column<T> requires T to satisfy ColumnElement (regular + totally ordered).");

    Column() = default;

    explicit Column(std::vector<T> data) : data_(std::move(data)) {}

    Column(std::initializer_list<T> init) : data_(init) {}

    /// Number of elements.
    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }

    /// Whether the column is empty.
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    /// Bounds-checked element access.
    [[nodiscard]] auto at(size_type idx) const -> const T& { return data_.at(idx); }
    [[nodiscard]] auto at(size_type idx) -> T& { return data_.at(idx); }

    /// Unchecked element access.
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const T& { return data_[idx]; }
    [[nodiscard]] auto operator[](size_type idx) noexcept -> T& { return data_[idx]; }

    /// Zero-copy views of the underlying data.
    [[nodiscard]] auto span() const noexcept -> std::span<const T> { return data_; }
    [[nodiscard]] auto span() noexcept -> std::span<T> { return data_; }

    void push_back(const T& value) { data_.push_back(value); }
    void push_back(T&& value) { data_.push_back(std::move(value)); }

    template <typename... Args>
        requires std::constructible_from<T, Args...>
    auto emplace_back(Args&&... args) -> T& {
        return data_.emplace_back(std::forward<Args>(args)...);
    }

    /// Append every element of another column.
    void append(const Column<T>& other) {
        data_.insert(data_.end(), other.data_.begin(), other.data_.end());
    }

    void reserve(size_type capacity) { data_.reserve(capacity); }
    void clear() noexcept { data_.clear(); }
    void resize(size_type count) { data_.resize(count); }
    void resize(size_type count, const T& value) { data_.resize(count, value); }

    [[nodiscard]] auto data() noexcept -> T* { return data_.data(); }
    [[nodiscard]] auto data() const noexcept -> const T* { return data_.data(); }

    [[nodiscard]] auto operator==(const Column&) const -> bool = default;

    // Iterator support
    [[nodiscard]] auto begin() noexcept { return data_.begin(); }
    [[nodiscard]] auto end() noexcept { return data_.end(); }
    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

   private:
    std::vector<T> data_;
};

}  // namespace tabula
