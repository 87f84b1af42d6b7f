#include "tracedb/core/types.h"

namespace tracedb {
namespace core {

bool Entity::operator==(const Entity& other) const {
    return entity_id == other.entity_id &&
           timestamp_nanoseconds == other.timestamp_nanoseconds &&
           fields == other.fields &&
           data_binary == other.data_binary;
}

std::string StateName(State state) {
    switch (state) {
        case State::SUCCESS: return "success";
        case State::ERROR: return "error";
    }
    return "state(" + std::to_string(static_cast<int>(state)) + ")";
}

} // namespace core
} // namespace tracedb
