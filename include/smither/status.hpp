#pragma once

/**
 * @file status.hpp
 * @brief Public status and error codes for Smither
 */

#include <string>
#include <string_view>
#include <utility>

namespace smither {

/**
 * @brief Status codes for schema and catalog operations
 */
enum class StatusCode {
    kOk = 0,
    kError,
    kInvalidArgument,
    kIOError,
    kCorruption,
    kBusy,
    kInternal,
};

/**
 * @brief Status class for operation results
 *
 * Status carries either success or an error code with a message. Query
 * failures reported by a Connection travel through Smither unchanged.
 */
class Status {
public:
    /**
     * @brief Create a success status
     */
    Status() noexcept : code_(StatusCode::kOk) {}

    /**
     * @brief Create a status with the given code
     */
    explicit Status(StatusCode code) noexcept : code_(code) {}

    /**
     * @brief Create a status with code and message
     */
    Status(StatusCode code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    // Factory methods for common statuses
    [[nodiscard]] static Status Ok() noexcept { return Status(); }
    [[nodiscard]] static Status Error(std::string msg = "") { return Status(StatusCode::kError, std::move(msg)); }
    [[nodiscard]] static Status InvalidArgument(std::string msg = "") { return Status(StatusCode::kInvalidArgument, std::move(msg)); }
    [[nodiscard]] static Status IOError(std::string msg = "") { return Status(StatusCode::kIOError, std::move(msg)); }
    [[nodiscard]] static Status Corruption(std::string msg = "") { return Status(StatusCode::kCorruption, std::move(msg)); }
    [[nodiscard]] static Status Busy(std::string msg = "") { return Status(StatusCode::kBusy, std::move(msg)); }
    [[nodiscard]] static Status Internal(std::string msg = "") { return Status(StatusCode::kInternal, std::move(msg)); }

    // Query methods
    [[nodiscard]] bool ok() const noexcept { return code_ == StatusCode::kOk; }

    [[nodiscard]] StatusCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /**
     * @brief Get a human-readable string representation
     */
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Status& other) const noexcept {
        return code_ == other.code_ && message_ == other.message_;
    }

private:
    StatusCode code_;
    std::string message_;
};

}  // namespace smither
