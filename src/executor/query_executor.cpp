#include "rynamo/executor/query_executor.hpp"

#include "rynamo/executor/executor_context.hpp"
#include "rynamo/executor/filter_executor.hpp"
#include "rynamo/executor/range_scan_executor.hpp"
#include "rynamo/expression/evaluator.hpp"

#include <memory>
#include <utility>

namespace rynamo::executor {

namespace {

OperationResult<QueryPage> run_page(const storage::ItemStore& store,
                                    std::optional<KeyConditionPlan> plan,
                                    const PageOptions& options)
{
    if (options.limit && *options.limit < 1U) {
        return make_failure<QueryPage>(make_error_code(Errc::ValidationError),
                                       "1 validation error detected: Value '0' at 'limit' failed to satisfy constraint: "
                                       "Member must have value greater than or equal to 1");
    }
    if (options.filter != nullptr && options.bindings != nullptr) {
        std::string message;
        if (auto ec = expression::verify_bindings(*options.filter, *options.bindings, message)) {
            return make_failure<QueryPage>(ec, std::move(message));
        }
    }

    const auto view = store.read();
    ExecutorContext context{ExecutorContextConfig{.bindings = options.bindings}};

    RangeScanExecutor::Config scan_config{
        .partitions = &view.partitions(),
        .key_plan = std::move(plan),
        .scan_forward = options.scan_forward,
        .exclusive_start_key = options.exclusive_start_key,
        .row_limit = options.limit,
        .byte_limit = options.max_page_bytes == 0U ? std::nullopt : std::optional<std::size_t>{options.max_page_bytes},
        .telemetry = options.telemetry,
        .telemetry_identifier = view.schema().table_name,
    };
    ExecutorNodePtr root = std::make_unique<RangeScanExecutor>(std::move(scan_config));

    if (options.filter != nullptr) {
        const auto* filter = options.filter;
        FilterExecutor::Config filter_config{
            .predicate = [filter](const ItemRow& row, ExecutorContext& ctx) {
                const auto result = expression::evaluate_verified(*filter, *row.item, ctx.bindings());
                if (!result.success()) {
                    ctx.record_error(result.error, result.message);
                    return false;
                }
                return result.matched;
            },
            .telemetry = options.telemetry,
            .telemetry_identifier = view.schema().table_name,
        };
        root = std::make_unique<FilterExecutor>(std::move(root), std::move(filter_config));
    }

    QueryPage page{};
    ItemRow row{};
    root->open(context);
    while (root->next(context, row)) {
        ++page.count;
        if (!options.count_only) {
            page.items.push_back(project_item(*row.item, options.attributes_to_get));
        }
    }
    root->close(context);

    if (context.failed()) {
        return make_failure<QueryPage>(context.error(), context.error_message());
    }

    page.scanned_count = context.examined_count();
    if (context.truncated() && context.last_examined()) {
        const auto& last = *context.last_examined();
        page.last_evaluated_key = store.key_attributes(storage::PrimaryKey{*last.partition, *last.sort});
    }
    return make_success(std::move(page));
}

}  // namespace

OperationResult<QueryPage> run_query(const storage::ItemStore& store,
                                     const KeyConditionPlan& plan,
                                     const PageOptions& options)
{
    if (options.exclusive_start_key && !(options.exclusive_start_key->partition == plan.partition)) {
        return make_failure<QueryPage>(make_error_code(Errc::ValidationError),
                                       "The provided starting key is invalid: the partition key does not match the query");
    }
    return run_page(store, plan, options);
}

OperationResult<QueryPage> run_scan(const storage::ItemStore& store, const PageOptions& options)
{
    auto scan_options = options;
    scan_options.scan_forward = true;
    return run_page(store, std::nullopt, scan_options);
}

Item project_item(const Item& item, const std::vector<std::string>& attributes)
{
    if (attributes.empty()) {
        return item;
    }
    Item projected;
    for (const auto& name : attributes) {
        const auto it = item.find(name);
        if (it != item.end()) {
            projected.emplace(it->first, it->second);
        }
    }
    return projected;
}

}  // namespace rynamo::executor
