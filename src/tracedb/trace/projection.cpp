#include "tracedb/trace/projection.h"
#include "tracedb/common/logger.h"

namespace tracedb {
namespace trace {

ProjectionPlanner::ProjectionPlanner(const std::vector<std::string>& fields) {
    field_index_.reserve(fields.size());
    for (size_t i = 0; i < fields.size(); ++i) {
        field_index_.emplace(fields[i], static_cast<int>(i));
    }
}

core::Result<FetchPlan> ProjectionPlanner::plan(const std::vector<std::string>& projection) const {
    FetchPlan plan;
    plan.fields.reserve(projection.size());
    for (const auto& name : projection) {
        if (name == core::kDataBinaryFieldName) {
            plan.fetch_data_binary = true;
            TRACEDB_DEBUG("to fetch data binary");
            continue;
        }
        auto it = field_index_.find(name);
        if (it == field_index_.end()) {
            return core::Result<FetchPlan>(std::make_unique<core::FieldNotFoundError>(
                "field not found: field name:" + name));
        }
        plan.fields.push_back(core::FieldEntry{name, it->second});
        TRACEDB_DEBUG("to fetch the field name={} index={}", name, it->second);
    }
    return plan;
}

} // namespace trace
} // namespace tracedb
