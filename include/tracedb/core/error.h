#ifndef TRACEDB_CORE_ERROR_H_
#define TRACEDB_CORE_ERROR_H_

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace tracedb {
namespace core {

/**
 * @brief Base class for all tracedb errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        ALREADY_EXISTS = 3,
        TIMEOUT = 4,
        RESOURCE_EXHAUSTED = 5,
        INTERNAL = 6,
        INVALID_TRACE_ID = 7,
        INVALID_KEY = 8,
        CHUNK_IDS_EMPTY = 9,
        PROJECTION_EMPTY = 10,
        FIELD_NOT_FOUND = 11,
        UNSUPPORTED_STATE = 12,
        CORRUPTED_RECORD = 13,
        MULTIPLE = 14
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

const char* CodeName(Error::Code code);

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating a key or record that does not exist
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
};

/**
 * @brief The trace ID handed to a fetch was empty
 */
class InvalidTraceIDError : public Error {
public:
    explicit InvalidTraceIDError(const std::string& message = "invalid trace id")
        : Error(message, Code::INVALID_TRACE_ID) {}
};

/**
 * @brief An index key or value did not match its binary layout
 */
class InvalidKeyError : public Error {
public:
    explicit InvalidKeyError(const std::string& message)
        : Error(message, Code::INVALID_KEY) {}
};

class ChunkIDsEmptyError : public Error {
public:
    explicit ChunkIDsEmptyError(const std::string& message = "chunk ids is empty")
        : Error(message, Code::CHUNK_IDS_EMPTY) {}
};

class ProjectionEmptyError : public Error {
public:
    explicit ProjectionEmptyError(const std::string& message = "projection is empty")
        : Error(message, Code::PROJECTION_EMPTY) {}
};

/**
 * @brief A projected field name is not part of the series schema
 */
class FieldNotFoundError : public Error {
public:
    explicit FieldNotFoundError(const std::string& message)
        : Error(message, Code::FIELD_NOT_FOUND) {}
};

/**
 * @brief An internal reference carried a state byte with no store pair
 */
class UnsupportedStateError : public Error {
public:
    explicit UnsupportedStateError(const std::string& message)
        : Error(message, Code::UNSUPPORTED_STATE) {}
};

/**
 * @brief A stored binary record could not be decoded
 */
class CorruptedRecordError : public Error {
public:
    explicit CorruptedRecordError(const std::string& message)
        : Error(message, Code::CORRUPTED_RECORD) {}
};

/**
 * @brief Aggregate of independent failures
 *
 * Batch operations keep going after a per-item failure and append the cause
 * here. Appending another MultiError flattens its causes, so every entry in
 * causes() is a leaf error with its own code and message.
 */
class MultiError : public Error {
public:
    MultiError();

    MultiError(const MultiError&) = delete;
    MultiError& operator=(const MultiError&) = delete;

    void append(std::unique_ptr<Error> cause);

    bool empty() const { return causes_.empty(); }
    size_t size() const { return causes_.size(); }
    const std::vector<std::unique_ptr<Error>>& causes() const { return causes_; }

    // Messages of all causes joined with "; "
    const char* what() const noexcept override;

    /**
     * @brief Collapse an accumulator into the error to hand back to callers
     *
     * Returns nullptr when nothing was recorded and the single cause itself
     * when exactly one was; otherwise the aggregate.
     */
    static std::unique_ptr<Error> Combine(std::unique_ptr<MultiError> errors);

private:
    std::vector<std::unique_ptr<Error>> causes_;
    std::string message_;
};

/**
 * @brief Leaf causes of an error returned by a batch operation
 *
 * Returns the causes of a MultiError, the error itself for any other error,
 * and nothing for nullptr.
 */
std::vector<const Error*> Errors(const Error* error);

/**
 * @brief Prefix an error message with context, keeping its code
 *
 * Aggregates are returned unchanged.
 */
std::unique_ptr<Error> Wrap(std::unique_ptr<Error> error, const std::string& context);

} // namespace core
} // namespace tracedb

#endif // TRACEDB_CORE_ERROR_H_
