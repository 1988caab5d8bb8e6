#pragma once

#include <compare>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace framecheck {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// Tag type for dictionary-encoded categorical columns.
struct Categorical {};

/// Boolean element type.
///
/// Wraps `bool` so that Column<Bool> stores one element per byte and hands out
/// real references, which std::vector<bool> cannot.
struct Bool {
    bool value = false;

    constexpr Bool() = default;
    constexpr Bool(bool v) noexcept : value(v) {}  // NOLINT(google-explicit-constructor)

    constexpr explicit operator bool() const noexcept { return value; }
    auto operator<=>(const Bool&) const = default;
};

/// Owning storage for one column of homogeneously typed values.
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

    /// Unchecked element access.
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const T& { return data_[idx]; }
    /// Unchecked mutable element access.
    [[nodiscard]] auto operator[](size_type idx) noexcept -> T& { return data_[idx]; }

    /// Append a value.
    void push_back(const T& value) { data_.push_back(value); }
    void push_back(T&& value) { data_.push_back(std::move(value)); }

    /// Reserve capacity.
    void reserve(size_type capacity) { data_.reserve(capacity); }

    /// Iteration over the elements in row order.
    [[nodiscard]] auto begin() noexcept { return data_.begin(); }
    [[nodiscard]] auto end() noexcept { return data_.end(); }
    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

    auto operator==(const Column&) const -> bool = default;

   private:
    std::vector<T> data_;
};

/// Specialization for categorical columns (dictionary-encoded strings).
///
/// The dictionary is shared between copies; codes are per column.
template <>
class Column<Categorical> {
   public:
    using value_type = std::string_view;
    using size_type = std::size_t;
    using code_type = std::int32_t;

    Column()
        : dict_(std::make_shared<std::vector<std::string>>()),
          index_(std::make_shared<std::unordered_map<std::string, code_type>>()) {}

    /// Encode a sequence of labels, building the dictionary in first-seen order.
    Column(std::initializer_list<std::string_view> labels) : Column() {
        for (auto label : labels) {
            push_back(label);
        }
    }

    /// Adopt an existing dictionary and per-row codes into it.
    Column(std::vector<std::string> dict, std::vector<code_type> codes)
        : dict_(std::make_shared<std::vector<std::string>>(std::move(dict))),
          index_(std::make_shared<std::unordered_map<std::string, code_type>>()),
          codes_(std::move(codes)) {
        rebuild_index();
    }

    /// Number of rows.
    [[nodiscard]] auto size() const noexcept -> size_type { return codes_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return codes_.empty(); }

    /// Decoded label of row `idx`.
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> value_type {
        if (dict_ == nullptr || dict_->empty()) {
            return std::string_view{};
        }
        return (*dict_)[static_cast<std::size_t>(codes_[idx])];
    }

    /// Dictionary code of row `idx`.
    [[nodiscard]] auto code_at(size_type idx) const noexcept -> code_type { return codes_[idx]; }

    /// Append a label, extending the dictionary when it is new.
    void push_back(value_type value) { codes_.push_back(find_or_insert(value)); }

    void reserve(size_type capacity) { codes_.reserve(capacity); }

    /// Distinct labels in first-seen order.
    [[nodiscard]] auto dictionary() const noexcept -> const std::vector<std::string>& {
        return *dict_;
    }

    /// Label-wise equality; two columns with different dictionaries can be equal.
    [[nodiscard]] auto operator==(const Column& other) const -> bool {
        if (size() != other.size()) {
            return false;
        }
        for (size_type i = 0; i < size(); ++i) {
            if ((*this)[i] != other[i]) {
                return false;
            }
        }
        return true;
    }

   private:
    void rebuild_index() {
        index_->clear();
        index_->reserve(dict_->size());
        for (std::size_t i = 0; i < dict_->size(); ++i) {
            index_->emplace((*dict_)[i], static_cast<code_type>(i));
        }
    }

    auto find_or_insert(value_type value) -> code_type {
        auto it = index_->find(std::string(value));
        if (it != index_->end()) {
            return it->second;
        }
        code_type code = static_cast<code_type>(dict_->size());
        dict_->emplace_back(value);
        index_->emplace(dict_->back(), code);
        return code;
    }

    std::shared_ptr<std::vector<std::string>> dict_;
    std::shared_ptr<std::unordered_map<std::string, code_type>> index_;
    std::vector<code_type> codes_;
};

}  // namespace framecheck

template <>
struct std::hash<framecheck::Bool> {
    auto operator()(const framecheck::Bool& b) const noexcept -> std::size_t {
        return std::hash<bool>{}(b.value);
    }
};
