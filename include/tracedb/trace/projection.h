#ifndef TRACEDB_TRACE_PROJECTION_H_
#define TRACEDB_TRACE_PROJECTION_H_

#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "tracedb/core/result.h"
#include "tracedb/core/types.h"

namespace tracedb {
namespace trace {

/**
 * @brief What to read for each materialized entity
 */
struct FetchPlan {
    bool fetch_data_binary = false;
    std::vector<core::FieldEntry> fields;  // Requested order

    bool empty() const { return !fetch_data_binary && fields.empty(); }
};

/**
 * @brief Resolves projected field names against the series schema
 *
 * Built once from the configured field list; immutable afterwards and safe
 * to share between concurrent queries.
 */
class ProjectionPlanner {
public:
    explicit ProjectionPlanner(const std::vector<std::string>& fields);

    /**
     * @brief Resolve a projection into a fetch plan
     *
     * kDataBinaryFieldName turns on the payload fetch. Any other name must be
     * in the schema, otherwise the whole plan fails with FIELD_NOT_FOUND.
     * An empty plan is returned as is; callers decide whether that is an error.
     */
    core::Result<FetchPlan> plan(const std::vector<std::string>& projection) const;

    bool has_field(const std::string& name) const { return field_index_.contains(name); }
    size_t num_fields() const { return field_index_.size(); }

private:
    absl::flat_hash_map<std::string, int> field_index_;
};

} // namespace trace
} // namespace tracedb

#endif // TRACEDB_TRACE_PROJECTION_H_
