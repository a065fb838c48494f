#pragma once

#include "rynamo/common/attribute_value.hpp"
#include "rynamo/common/error.hpp"
#include "rynamo/executor/executor_telemetry.hpp"
#include "rynamo/executor/key_condition.hpp"
#include "rynamo/expression/ast.hpp"
#include "rynamo/expression/bindings.hpp"
#include "rynamo/storage/item_store.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rynamo::executor {

inline constexpr std::size_t kDefaultMaxPageBytes = 1024U * 1024U;

struct PageOptions final {
    const expression::Condition* filter = nullptr;
    const expression::PlaceholderBindings* bindings = nullptr;
    bool scan_forward = true;
    std::optional<std::size_t> limit{};
    std::optional<storage::PrimaryKey> exclusive_start_key{};
    std::size_t max_page_bytes = kDefaultMaxPageBytes;
    bool count_only = false;
    std::vector<std::string> attributes_to_get{};
    ExecutorTelemetry* telemetry = nullptr;
};

struct QueryPage final {
    std::vector<Item> items{};
    std::uint64_t count = 0U;
    std::uint64_t scanned_count = 0U;
    std::optional<Item> last_evaluated_key{};
};

// Reads one page of a partition range. The store's read lock is held for the
// whole page.
OperationResult<QueryPage> run_query(const storage::ItemStore& store,
                                     const KeyConditionPlan& plan,
                                     const PageOptions& options);

// Reads one page of the whole table in partition-map order.
OperationResult<QueryPage> run_scan(const storage::ItemStore& store, const PageOptions& options);

// Copies the named top-level attributes; an empty list keeps the whole item.
Item project_item(const Item& item, const std::vector<std::string>& attributes);

}  // namespace rynamo::executor
