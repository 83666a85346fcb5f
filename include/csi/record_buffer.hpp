#pragma once
#include <algorithm>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <map>
#include <numeric>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace csi {

using cdouble = std::complex<double>;

// One field of a decoded record, as seen through a RecordView. Spans borrow
// from the buffer and are invalidated by the next decode.
using FieldValue = std::variant<int64_t,
                                uint64_t,
                                double,
                                std::span<const uint8_t>,
                                std::span<const cdouble>>;

using RecordView = std::map<std::string, FieldValue>;

// Per-record shape of a column; empty for scalars.
using Shape = std::vector<std::size_t>;

// Storage for one field across all records. `shape` is the per-record
// shape (empty for scalars); rows are stored back to back.
template <class T>
class Column {
public:
    using value_type = T;

    Column() = default;
    explicit Column(Shape shape) : shape_(std::move(shape)) {
        stride_ = std::accumulate(shape_.begin(), shape_.end(), std::size_t{1},
                                  [](std::size_t a, std::size_t b) { return a * b; });
    }

    std::size_t size() const { return rows_; }
    std::size_t stride() const { return stride_; }
    const Shape& shape() const { return shape_; }

    // New rows are value-initialised, i.e. zero.
    void resize(std::size_t rows) { data_.resize(rows * stride_); rows_ = rows; }
    void reserve(std::size_t rows) { data_.reserve(rows * stride_); }
    void erase_front(std::size_t rows) {
        data_.erase(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(rows * stride_));
        rows_ -= rows;
    }
    void clear_row(std::size_t i) {
        std::fill(data_.begin() + i * stride_, data_.begin() + (i + 1) * stride_, T{});
    }

    T& operator[](std::size_t i) { return data_[i]; }
    const T& operator[](std::size_t i) const { return data_[i]; }

    std::span<T> row(std::size_t i) { return {data_.data() + i * stride_, stride_}; }
    std::span<const T> row(std::size_t i) const { return {data_.data() + i * stride_, stride_}; }

    std::vector<T>& data() { return data_; }
    const std::vector<T>& data() const { return data_; }

    FieldValue value(std::size_t i) const {
        if constexpr (std::is_same_v<T, cdouble>) {
            return std::span<const cdouble>(row(i));
        } else if constexpr (std::is_same_v<T, uint8_t>) {
            if (!shape_.empty()) return std::span<const uint8_t>(row(i));
            return int64_t(data_[i]);
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            return data_[i];
        } else if constexpr (std::is_floating_point_v<T>) {
            return double(data_[i]);
        } else {
            static_assert(std::is_integral_v<T>, "unsupported column type");
            return int64_t(data_[i]);
        }
    }

private:
    Shape shape_;
    std::size_t stride_{1};
    std::size_t rows_{0};
    std::vector<T> data_;
};

// Columnar record set. `Derived` lists its columns through
// `for_each_column(f)`, calling `f(name, column)` for every field; all
// columns always hold the same number of rows.
template <class Derived>
class ColumnStore {
public:
    std::size_t size() const {
        std::size_t n = 0;
        bool first = true;
        self().for_each_column([&](const char*, const auto& c) {
            if (first) { n = c.size(); first = false; }
        });
        return n;
    }

    void resize(std::size_t rows) {
        self().for_each_column([&](const char*, auto& c) { c.resize(rows); });
    }
    void reserve(std::size_t rows) {
        self().for_each_column([&](const char*, auto& c) { c.reserve(rows); });
    }
    void erase_front(std::size_t rows) {
        self().for_each_column([&](const char*, auto& c) { c.erase_front(rows); });
    }
    void clear_row(std::size_t i) {
        self().for_each_column([&](const char*, auto& c) { c.clear_row(i); });
    }

    RecordView view(std::size_t i) const {
        RecordView v;
        self().for_each_column([&](const char* name, const auto& c) { v.emplace(name, c.value(i)); });
        return v;
    }

private:
    Derived& self() { return static_cast<Derived&>(*this); }
    const Derived& self() const { return static_cast<const Derived&>(*this); }
};

} // namespace csi
