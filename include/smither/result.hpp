#pragma once

/**
 * @file result.hpp
 * @brief Query result types returned by a Connection
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "smither/status.hpp"

namespace smither {

/**
 * @brief A single value read from a result column
 */
class Value {
public:
    using ValueType = std::variant<
        std::monostate,  // NULL
        bool,
        int64_t,
        double,
        std::string
    >;

    /// Construct a NULL value
    Value() : value_(std::monostate{}) {}

    explicit Value(bool v) : value_(v) {}
    explicit Value(int64_t v) : value_(v) {}
    explicit Value(double v) : value_(v) {}
    explicit Value(std::string v) : value_(std::move(v)) {}
    explicit Value(const char* v) : value_(std::string(v)) {}

    [[nodiscard]] bool is_null() const noexcept {
        return std::holds_alternative<std::monostate>(value_);
    }

    /// Text content; nullopt for NULL and non-text values
    [[nodiscard]] std::optional<std::string_view> try_string() const noexcept;

    /**
     * @brief Interpret the value as a boolean
     *
     * Engines without a native boolean type report 0/1 integers, and some
     * drivers hand back 't'/'f' text, so all three shapes are accepted.
     */
    [[nodiscard]] std::optional<bool> try_bool() const noexcept;

    /// Rendering for diagnostics
    [[nodiscard]] std::string to_string() const;

private:
    ValueType value_;
};

/**
 * @brief One row of a query result, values in select-list order
 */
class Row {
public:
    Row() = default;
    explicit Row(std::vector<Value> values) : values_(std::move(values)) {}

    /// Value of column @p index; throws std::out_of_range past the end
    [[nodiscard]] const Value& operator[](size_t index) const { return values_.at(index); }

    [[nodiscard]] size_t size() const noexcept { return values_.size(); }

private:
    std::vector<Value> values_;
};

/**
 * @brief Result of a query issued through a Connection
 *
 * A Result is either a success carrying zero or more rows, or an error
 * carrying the Status reported by the underlying engine.
 */
class Result {
public:
    /// Create an error result
    explicit Result(Status status) : status_(std::move(status)) {}

    /// Create a success result
    explicit Result(std::vector<Row> rows) : rows_(std::move(rows)) {}

    [[nodiscard]] bool ok() const noexcept { return status_.ok(); }
    [[nodiscard]] const Status& status() const noexcept { return status_; }

    [[nodiscard]] const std::vector<Row>& rows() const noexcept { return rows_; }
    [[nodiscard]] size_t row_count() const noexcept { return rows_.size(); }

    [[nodiscard]] auto begin() const noexcept { return rows_.begin(); }
    [[nodiscard]] auto end() const noexcept { return rows_.end(); }

private:
    Status status_;
    std::vector<Row> rows_;
};

}  // namespace smither
