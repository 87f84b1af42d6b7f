#include "tracedb/core/error.h"

namespace tracedb {
namespace core {

const char* CodeName(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "UNKNOWN";
        case Error::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case Error::Code::NOT_FOUND: return "NOT_FOUND";
        case Error::Code::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case Error::Code::TIMEOUT: return "TIMEOUT";
        case Error::Code::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
        case Error::Code::INTERNAL: return "INTERNAL";
        case Error::Code::INVALID_TRACE_ID: return "INVALID_TRACE_ID";
        case Error::Code::INVALID_KEY: return "INVALID_KEY";
        case Error::Code::CHUNK_IDS_EMPTY: return "CHUNK_IDS_EMPTY";
        case Error::Code::PROJECTION_EMPTY: return "PROJECTION_EMPTY";
        case Error::Code::FIELD_NOT_FOUND: return "FIELD_NOT_FOUND";
        case Error::Code::UNSUPPORTED_STATE: return "UNSUPPORTED_STATE";
        case Error::Code::CORRUPTED_RECORD: return "CORRUPTED_RECORD";
        case Error::Code::MULTIPLE: return "MULTIPLE";
    }
    return "UNKNOWN";
}

MultiError::MultiError() : Error("no errors", Code::MULTIPLE) {}

void MultiError::append(std::unique_ptr<Error> cause) {
    if (!cause) {
        return;
    }
    if (auto* nested = dynamic_cast<MultiError*>(cause.get())) {
        for (auto& inner : nested->causes_) {
            append(std::move(inner));
        }
        return;
    }
    if (!message_.empty()) {
        message_ += "; ";
    }
    message_ += cause->what();
    causes_.push_back(std::move(cause));
}

const char* MultiError::what() const noexcept {
    if (message_.empty()) {
        return Error::what();
    }
    return message_.c_str();
}

std::unique_ptr<Error> MultiError::Combine(std::unique_ptr<MultiError> errors) {
    if (!errors || errors->empty()) {
        return nullptr;
    }
    if (errors->size() == 1) {
        return std::move(errors->causes_.front());
    }
    return std::unique_ptr<Error>(std::move(errors));
}

std::vector<const Error*> Errors(const Error* error) {
    std::vector<const Error*> result;
    if (error == nullptr) {
        return result;
    }
    if (const auto* multi = dynamic_cast<const MultiError*>(error)) {
        result.reserve(multi->size());
        for (const auto& cause : multi->causes()) {
            result.push_back(cause.get());
        }
        return result;
    }
    result.push_back(error);
    return result;
}

std::unique_ptr<Error> Wrap(std::unique_ptr<Error> error, const std::string& context) {
    if (!error || dynamic_cast<const MultiError*>(error.get()) != nullptr) {
        return error;
    }
    return std::make_unique<Error>(context + ": " + error->what(), error->code());
}

} // namespace core
} // namespace tracedb
