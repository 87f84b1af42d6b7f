#ifndef TRACEDB_CORE_RESULT_H_
#define TRACEDB_CORE_RESULT_H_

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include "tracedb/core/error.h"

namespace tracedb {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * A Result owns an optional error next to its value. Batch reads use both
 * at once: a failed Result may still carry the items that were resolved
 * before or after the failures, see partial().
 *
 * Usage:
 * ```
 * Result<int> foo() {
 *     if (error_condition) {
 *         return Result<int>::error("error message");
 *     }
 *     return Result<int>(42);
 * }
 *
 * auto result = foo();
 * if (result.ok()) {
 *     int value = result.value();
 * } else {
 *     std::string error = result.error();
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}

    explicit Result(std::unique_ptr<Error> error) : value_(), error_(std::move(error)) {}

    Result(T value, std::unique_ptr<Error> error)
        : value_(std::move(value)), error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return error_ == nullptr; }
    std::string error() const {
        if (!error_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return error_->what();
    }
    Error::Code code() const { return error_ ? error_->code() : Error::Code::UNKNOWN; }
    const Error* cause() const { return error_.get(); }
    std::unique_ptr<Error> take_error() { return std::move(error_); }

    const T& value() const { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(const std::string& message) {
        return Result<T>(std::make_unique<Error>(message));
    }

    // Value and error together; a null error yields an ok result
    static Result<T> partial(T value, std::unique_ptr<Error> error) {
        return Result<T>(std::move(value), std::move(error));
    }

private:
    T value_;
    std::unique_ptr<Error> error_;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() = default;
    explicit Result(std::unique_ptr<Error> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept = default;
    Result& operator=(Result&& other) noexcept = default;
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return error_ == nullptr; }
    std::string error() const {
        if (!error_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return error_->what();
    }
    Error::Code code() const { return error_ ? error_->code() : Error::Code::UNKNOWN; }
    const Error* cause() const { return error_.get(); }
    std::unique_ptr<Error> take_error() { return std::move(error_); }

    static Result<void> error(const std::string& message) {
        return Result<void>(std::make_unique<Error>(message));
    }

private:
    std::unique_ptr<Error> error_;
};

} // namespace core
} // namespace tracedb

#endif // TRACEDB_CORE_RESULT_H_
