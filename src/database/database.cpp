#include "rynamo/database/database.hpp"

#include "rynamo/common/validation.hpp"
#include "rynamo/executor/key_condition.hpp"
#include "rynamo/expression/evaluator.hpp"
#include "rynamo/expression/grammar.hpp"
#include "rynamo/expression/update_applier.hpp"

#include <algorithm>
#include <initializer_list>
#include <set>
#include <utility>

namespace rynamo::database {

namespace {

std::error_code invalid(std::string& message, std::string text)
{
    message = std::move(text);
    return make_error_code(Errc::ValidationError);
}

std::error_code parse_condition(std::string_view label,
                                const std::optional<std::string>& text,
                                expression::ConditionParseResult& parsed,
                                std::string& message)
{
    if (!text) {
        return {};
    }
    if (text->empty()) {
        return invalid(message, "Invalid " + std::string{label} + ": The expression can not be empty;");
    }
    parsed = expression::parse_condition_expression(*text);
    if (!parsed.success()) {
        message = "Invalid " + std::string{label} + ": " + expression::summarize_diagnostics(parsed.diagnostics);
        return parsed.error ? parsed.error : make_error_code(Errc::ParseError);
    }
    return {};
}

std::error_code parse_update(const std::optional<std::string>& text,
                             expression::UpdateParseResult& parsed,
                             std::string& message)
{
    if (!text) {
        return {};
    }
    if (text->empty()) {
        return invalid(message, "Invalid UpdateExpression: The expression can not be empty;");
    }
    parsed = expression::parse_update_expression(*text);
    if (!parsed.success()) {
        message = "Invalid UpdateExpression: " + expression::summarize_diagnostics(parsed.diagnostics);
        return parsed.error ? parsed.error : make_error_code(Errc::ParseError);
    }
    return {};
}

template <typename Container>
std::string join_keys(const Container& keys)
{
    std::string text = "{";
    bool first = true;
    for (const auto& key : keys) {
        if (!first) {
            text += ", ";
        }
        text += key;
        first = false;
    }
    text += "}";
    return text;
}

// Every placeholder an expression uses must be bound, and every binding must
// be used by some expression of the request.
std::error_code check_bindings(const expression::PlaceholderBindings& bindings,
                               std::initializer_list<const expression::Condition*> conditions,
                               const expression::UpdateExpression* update,
                               std::string& message)
{
    expression::PlaceholderUsage usage{};
    for (const auto* condition : conditions) {
        if (condition == nullptr) {
            continue;
        }
        if (auto ec = expression::verify_bindings(*condition, bindings, message)) {
            return ec;
        }
        expression::collect_placeholders(*condition, usage);
    }
    if (update != nullptr) {
        if (auto ec = expression::verify_bindings(*update, bindings, message)) {
            return ec;
        }
        expression::collect_placeholders(*update, usage);
    }

    std::vector<std::string> unused_names;
    for (const auto& [name, _] : bindings.names) {
        if (!usage.names.contains(name)) {
            unused_names.push_back(name);
        }
    }
    if (!unused_names.empty()) {
        return invalid(message, "Value provided in ExpressionAttributeNames unused in expressions: keys: " + join_keys(unused_names));
    }

    std::vector<std::string> unused_values;
    for (const auto& [name, _] : bindings.values) {
        if (!usage.values.contains(name)) {
            unused_values.push_back(name);
        }
    }
    if (!unused_values.empty()) {
        return invalid(message, "Value provided in ExpressionAttributeValues unused in expressions: keys: " + join_keys(unused_values));
    }
    return {};
}

// Collects the top-level attribute names a condition reads.
class AttributeNameCollector final : public expression::ConditionVisitor, public expression::OperandVisitor {
public:
    explicit AttributeNameCollector(const expression::PlaceholderBindings& bindings)
        : bindings_{bindings}
    {
    }

    [[nodiscard]] const std::set<std::string>& names() const noexcept { return names_; }

    void visit(const expression::ComparisonCondition& condition) override
    {
        condition.left->accept(*this);
        condition.right->accept(*this);
    }

    void visit(const expression::BetweenCondition& condition) override
    {
        condition.value->accept(*this);
        condition.lower->accept(*this);
        condition.upper->accept(*this);
    }

    void visit(const expression::FunctionCondition& condition) override
    {
        for (const auto* argument : condition.arguments) {
            argument->accept(*this);
        }
    }

    void visit(const expression::AndCondition& condition) override
    {
        condition.left->accept(*this);
        condition.right->accept(*this);
    }

    void visit(const expression::PathExpression& operand) override
    {
        if (operand.segments.empty() || operand.segments.front().kind != expression::PathSegment::Kind::Name) {
            return;
        }
        const auto& segment = operand.segments.front();
        if (!segment.is_placeholder()) {
            names_.insert(segment.name);
            return;
        }
        const auto it = bindings_.names.find(segment.name);
        if (it != bindings_.names.end()) {
            names_.insert(it->second);
        }
    }

    void visit(const expression::ValueReference&) override {}

    void visit(const expression::SizeFunction& operand) override { operand.argument->accept(*this); }

    void visit(const expression::IfNotExistsFunction& operand) override
    {
        visit(*operand.path);
        operand.fallback->accept(*this);
    }

    void visit(const expression::ListAppendFunction& operand) override
    {
        operand.left->accept(*this);
        operand.right->accept(*this);
    }

    void visit(const expression::ArithmeticExpression& operand) override
    {
        operand.left->accept(*this);
        operand.right->accept(*this);
    }

private:
    const expression::PlaceholderBindings& bindings_;
    std::set<std::string> names_{};
};

std::error_code reject_key_attributes(const expression::Condition& filter,
                                      const catalog::TableSchema& schema,
                                      const expression::PlaceholderBindings& bindings,
                                      std::string& message)
{
    AttributeNameCollector collector{bindings};
    filter.accept(collector);
    for (const auto& name : collector.names()) {
        if (schema.is_key_attribute(name)) {
            return invalid(message, "Filter Expression can only contain non-primary key attributes: Primary key attribute: " + name);
        }
    }
    return {};
}

std::error_code parse_start_key(const storage::ItemStore& store,
                                const std::optional<Item>& start,
                                std::optional<storage::PrimaryKey>& key,
                                std::string& message)
{
    key.reset();
    if (!start) {
        return {};
    }
    storage::PrimaryKey parsed{};
    if (auto ec = store.parse_key(*start, parsed, message)) {
        message = "The provided starting key is invalid: " + message;
        return ec;
    }
    key = std::move(parsed);
    return {};
}

std::optional<std::size_t> to_limit(const std::optional<std::uint32_t>& limit)
{
    if (!limit) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(*limit);
}

std::error_code check_projection(bool count_only, const std::vector<std::string>& attributes, std::string& message)
{
    if (count_only && !attributes.empty()) {
        return invalid(message, "Cannot specify the AttributesToGet when choosing to get only the Count");
    }
    return {};
}

template <typename Map>
std::string joined_table_names(const Map& request_items)
{
    std::string names;
    for (const auto& [name, _] : request_items) {
        if (!names.empty()) {
            names += ",";
        }
        names += name;
    }
    return names;
}

}  // namespace

Database::Database()
    : Database(Config{})
{
}

Database::Database(Config config)
    : config_{std::move(config)}
    , catalog_{catalog::TableCatalog::Config{
          .region = config_.region,
          .account_id = config_.account_id,
          .clock = config_.clock,
          .id_generator = config_.id_generator,
      }}
{
}

template <typename T, typename Handler>
OperationResult<T> Database::instrument(Operation operation, std::string_view table_name, Handler&& handler)
{
    telemetry_.record_attempt(operation);
    const auto started = std::chrono::steady_clock::now();
    OperationResult<T> result = handler();
    const auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - started);
    telemetry_.record_duration(operation, duration.count() > 0 ? static_cast<std::uint64_t>(duration.count()) : 0ULL);

    if (result.success()) {
        telemetry_.record_success(operation);
    } else {
        telemetry_.record_failure(operation, result.error);
    }

    if (config_.operation_logger) {
        OperationTrace trace{};
        trace.operation = operation;
        trace.table_name = std::string{table_name};
        trace.success = result.success();
        trace.error = result.error;
        trace.message = result.message;
        trace.duration = duration;
        config_.operation_logger(trace);
    }
    return result;
}

OperationResult<catalog::TableDescription> Database::create_table(const catalog::CreateTableRequest& request)
{
    return instrument<catalog::TableDescription>(Operation::CreateTable, request.table_name, [&] {
        return catalog_.create_table(request);
    });
}

OperationResult<catalog::TableDescription> Database::describe_table(const TableRequest& request)
{
    return instrument<catalog::TableDescription>(Operation::DescribeTable, request.table_name, [&] {
        return catalog_.describe_table(request.table_name);
    });
}

OperationResult<catalog::TableDescription> Database::delete_table(const TableRequest& request)
{
    return instrument<catalog::TableDescription>(Operation::DeleteTable, request.table_name, [&] {
        return catalog_.delete_table(request.table_name);
    });
}

OperationResult<catalog::ListTablesResponse> Database::list_tables(const catalog::ListTablesRequest& request)
{
    return instrument<catalog::ListTablesResponse>(Operation::ListTables, {}, [&] {
        return catalog_.list_tables(request);
    });
}

OperationResult<WriteItemResponse> Database::put_item(const PutItemRequest& request)
{
    return instrument<WriteItemResponse>(Operation::PutItem, request.table_name, [&]() -> OperationResult<WriteItemResponse> {
        std::string message;
        if (request.return_values == ReturnValues::AllNew) {
            return make_failure<WriteItemResponse>(make_error_code(Errc::ValidationError),
                                                   "ReturnValues can only be ALL_OLD or NONE");
        }
        auto table = catalog_.open_table(request.table_name);
        if (!table.success()) {
            return forward_failure<WriteItemResponse>(table);
        }

        expression::ConditionParseResult condition{};
        if (auto ec = parse_condition("ConditionExpression", request.condition_expression, condition, message)) {
            return make_failure<WriteItemResponse>(ec, std::move(message));
        }
        if (auto ec = check_bindings(request.bindings, {condition.condition}, nullptr, message)) {
            return make_failure<WriteItemResponse>(ec, std::move(message));
        }

        storage::WriteOptions options{
            .condition = condition.condition,
            .bindings = &request.bindings,
            .return_values = request.return_values,
        };
        auto stored = (*table.value)->store().put_item(request.item, options);
        if (!stored.success()) {
            return forward_failure<WriteItemResponse>(stored);
        }
        return make_success(WriteItemResponse{.attributes = std::move(*stored.value)});
    });
}

OperationResult<GetItemResponse> Database::get_item(const GetItemRequest& request)
{
    return instrument<GetItemResponse>(Operation::GetItem, request.table_name, [&]() -> OperationResult<GetItemResponse> {
        auto table = catalog_.open_table(request.table_name);
        if (!table.success()) {
            return forward_failure<GetItemResponse>(table);
        }
        auto found = (*table.value)->store().get_item(request.key);
        if (!found.success()) {
            return forward_failure<GetItemResponse>(found);
        }

        GetItemResponse response{};
        if (*found.value) {
            response.item = executor::project_item(**found.value, request.attributes_to_get);
        }
        return make_success(std::move(response));
    });
}

OperationResult<WriteItemResponse> Database::delete_item(const DeleteItemRequest& request)
{
    return instrument<WriteItemResponse>(Operation::DeleteItem, request.table_name, [&]() -> OperationResult<WriteItemResponse> {
        std::string message;
        if (request.return_values == ReturnValues::AllNew) {
            return make_failure<WriteItemResponse>(make_error_code(Errc::ValidationError),
                                                   "ReturnValues can only be ALL_OLD or NONE");
        }
        auto table = catalog_.open_table(request.table_name);
        if (!table.success()) {
            return forward_failure<WriteItemResponse>(table);
        }

        expression::ConditionParseResult condition{};
        if (auto ec = parse_condition("ConditionExpression", request.condition_expression, condition, message)) {
            return make_failure<WriteItemResponse>(ec, std::move(message));
        }
        if (auto ec = check_bindings(request.bindings, {condition.condition}, nullptr, message)) {
            return make_failure<WriteItemResponse>(ec, std::move(message));
        }

        storage::WriteOptions options{
            .condition = condition.condition,
            .bindings = &request.bindings,
            .return_values = request.return_values,
        };
        auto removed = (*table.value)->store().delete_item(request.key, options);
        if (!removed.success()) {
            return forward_failure<WriteItemResponse>(removed);
        }
        return make_success(WriteItemResponse{.attributes = std::move(*removed.value)});
    });
}

OperationResult<WriteItemResponse> Database::update_item(const UpdateItemRequest& request)
{
    return instrument<WriteItemResponse>(Operation::UpdateItem, request.table_name, [&]() -> OperationResult<WriteItemResponse> {
        std::string message;
        auto table = catalog_.open_table(request.table_name);
        if (!table.success()) {
            return forward_failure<WriteItemResponse>(table);
        }

        expression::UpdateParseResult update{};
        if (auto ec = parse_update(request.update_expression, update, message)) {
            return make_failure<WriteItemResponse>(ec, std::move(message));
        }
        expression::ConditionParseResult condition{};
        if (auto ec = parse_condition("ConditionExpression", request.condition_expression, condition, message)) {
            return make_failure<WriteItemResponse>(ec, std::move(message));
        }
        if (auto ec = check_bindings(request.bindings, {condition.condition}, update.expression, message)) {
            return make_failure<WriteItemResponse>(ec, std::move(message));
        }

        storage::WriteOptions options{
            .condition = condition.condition,
            .bindings = &request.bindings,
            .return_values = request.return_values,
        };
        auto updated = (*table.value)->store().update_item(request.key, update.expression, options);
        if (!updated.success()) {
            return forward_failure<WriteItemResponse>(updated);
        }
        return make_success(WriteItemResponse{.attributes = std::move(*updated.value)});
    });
}

OperationResult<QueryResponse> Database::query(const QueryRequest& request)
{
    return instrument<QueryResponse>(Operation::Query, request.table_name, [&]() -> OperationResult<QueryResponse> {
        std::string message;
        auto table = catalog_.open_table(request.table_name);
        if (!table.success()) {
            return forward_failure<QueryResponse>(table);
        }
        const auto& store = (*table.value)->store();
        const auto& schema = store.schema();

        if (request.key_condition_expression.empty()) {
            return make_failure<QueryResponse>(
                make_error_code(Errc::ValidationError),
                "Either the KeyConditions or KeyConditionExpression parameter must be specified in the request.");
        }
        if (auto ec = check_projection(request.count_only, request.attributes_to_get, message)) {
            return make_failure<QueryResponse>(ec, std::move(message));
        }

        expression::ConditionParseResult key_condition{};
        if (auto ec = parse_condition("KeyConditionExpression", request.key_condition_expression, key_condition, message)) {
            return make_failure<QueryResponse>(ec, std::move(message));
        }
        expression::ConditionParseResult filter{};
        if (auto ec = parse_condition("FilterExpression", request.filter_expression, filter, message)) {
            return make_failure<QueryResponse>(ec, std::move(message));
        }
        if (auto ec = check_bindings(request.bindings, {key_condition.condition, filter.condition}, nullptr, message)) {
            return make_failure<QueryResponse>(ec, std::move(message));
        }

        executor::KeyConditionPlan plan{};
        if (auto ec = executor::plan_key_condition(*key_condition.condition, schema, request.bindings, plan, message)) {
            return make_failure<QueryResponse>(ec, std::move(message));
        }
        if (filter.condition != nullptr) {
            if (auto ec = reject_key_attributes(*filter.condition, schema, request.bindings, message)) {
                return make_failure<QueryResponse>(ec, std::move(message));
            }
        }

        executor::PageOptions options{
            .filter = filter.condition,
            .bindings = &request.bindings,
            .scan_forward = request.scan_forward,
            .limit = to_limit(request.limit),
            .exclusive_start_key = std::nullopt,
            .max_page_bytes = config_.max_page_bytes,
            .count_only = request.count_only,
            .attributes_to_get = request.attributes_to_get,
            .telemetry = &executor_telemetry_,
        };
        if (auto ec = parse_start_key(store, request.exclusive_start_key, options.exclusive_start_key, message)) {
            return make_failure<QueryResponse>(ec, std::move(message));
        }
        return executor::run_query(store, plan, options);
    });
}

OperationResult<QueryResponse> Database::scan(const ScanRequest& request)
{
    return instrument<QueryResponse>(Operation::Scan, request.table_name, [&]() -> OperationResult<QueryResponse> {
        std::string message;
        auto table = catalog_.open_table(request.table_name);
        if (!table.success()) {
            return forward_failure<QueryResponse>(table);
        }
        const auto& store = (*table.value)->store();

        if (auto ec = check_projection(request.count_only, request.attributes_to_get, message)) {
            return make_failure<QueryResponse>(ec, std::move(message));
        }
        expression::ConditionParseResult filter{};
        if (auto ec = parse_condition("FilterExpression", request.filter_expression, filter, message)) {
            return make_failure<QueryResponse>(ec, std::move(message));
        }
        if (auto ec = check_bindings(request.bindings, {filter.condition}, nullptr, message)) {
            return make_failure<QueryResponse>(ec, std::move(message));
        }

        executor::PageOptions options{
            .filter = filter.condition,
            .bindings = &request.bindings,
            .scan_forward = true,
            .limit = to_limit(request.limit),
            .exclusive_start_key = std::nullopt,
            .max_page_bytes = config_.max_page_bytes,
            .count_only = request.count_only,
            .attributes_to_get = request.attributes_to_get,
            .telemetry = &executor_telemetry_,
        };
        if (auto ec = parse_start_key(store, request.exclusive_start_key, options.exclusive_start_key, message)) {
            return make_failure<QueryResponse>(ec, std::move(message));
        }
        return executor::run_scan(store, options);
    });
}

OperationResult<BatchWriteItemResponse> Database::batch_write_item(const BatchWriteItemRequest& request)
{
    const auto table_names = joined_table_names(request.request_items);
    return instrument<BatchWriteItemResponse>(Operation::BatchWriteItem, table_names, [&]() -> OperationResult<BatchWriteItemResponse> {
        std::string message;
        std::size_t total = 0U;
        for (const auto& [_, writes] : request.request_items) {
            total += writes.size();
        }
        if (total == 0U) {
            return make_failure<BatchWriteItemResponse>(make_error_code(Errc::ValidationError),
                                                        "The batch must contain at least one write request");
        }
        if (total > kMaxBatchWriteRequests) {
            return make_failure<BatchWriteItemResponse>(make_error_code(Errc::ValidationError),
                                                        "Too many items requested for the BatchWriteItem call");
        }

        BatchWriteItemResponse response{};
        std::vector<std::pair<catalog::TablePtr, const std::vector<WriteRequest>*>> targets;
        for (const auto& [name, writes] : request.request_items) {
            auto table = catalog_.find_table(name);
            if (!table) {
                response.unprocessed_items.emplace(name, writes);
                continue;
            }

            std::vector<storage::PrimaryKey> seen;
            for (const auto& write : writes) {
                if (write.put_item.has_value() == write.delete_key.has_value()) {
                    return make_failure<BatchWriteItemResponse>(
                        make_error_code(Errc::ValidationError),
                        "A write request must contain exactly one of PutRequest or DeleteRequest");
                }
                storage::PrimaryKey key{};
                if (write.put_item) {
                    if (auto ec = validate_item(*write.put_item, message)) {
                        return make_failure<BatchWriteItemResponse>(ec, std::move(message));
                    }
                    if (auto ec = table->store().extract_key(*write.put_item, key, message)) {
                        return make_failure<BatchWriteItemResponse>(ec, std::move(message));
                    }
                } else if (auto ec = table->store().parse_key(*write.delete_key, key, message)) {
                    return make_failure<BatchWriteItemResponse>(ec, std::move(message));
                }
                if (std::find(seen.begin(), seen.end(), key) != seen.end()) {
                    return make_failure<BatchWriteItemResponse>(make_error_code(Errc::ValidationError),
                                                                "Provided list of item keys contains duplicates");
                }
                seen.push_back(std::move(key));
            }
            targets.emplace_back(std::move(table), &writes);
        }

        for (const auto& [table, writes] : targets) {
            for (const auto& write : *writes) {
                auto result = write.put_item ? table->store().put_item(*write.put_item)
                                             : table->store().delete_item(*write.delete_key);
                if (!result.success()) {
                    return forward_failure<BatchWriteItemResponse>(result);
                }
            }
        }
        return make_success(std::move(response));
    });
}

OperationResult<BatchGetItemResponse> Database::batch_get_item(const BatchGetItemRequest& request)
{
    const auto table_names = joined_table_names(request.request_items);
    return instrument<BatchGetItemResponse>(Operation::BatchGetItem, table_names, [&]() -> OperationResult<BatchGetItemResponse> {
        std::string message;
        std::size_t total = 0U;
        for (const auto& [_, keys] : request.request_items) {
            total += keys.keys.size();
        }
        if (total == 0U) {
            return make_failure<BatchGetItemResponse>(make_error_code(Errc::ValidationError),
                                                      "The batch must contain at least one key");
        }
        if (total > kMaxBatchGetKeys) {
            return make_failure<BatchGetItemResponse>(make_error_code(Errc::ValidationError),
                                                      "Too many items requested for the BatchGetItem call");
        }

        BatchGetItemResponse response{};
        std::vector<std::pair<catalog::TablePtr, const KeysAndAttributes*>> targets;
        for (const auto& [name, keys] : request.request_items) {
            auto table = catalog_.find_table(name);
            if (!table) {
                response.unprocessed_keys.emplace(name, keys);
                continue;
            }
            std::vector<storage::PrimaryKey> seen;
            for (const auto& key_attributes : keys.keys) {
                storage::PrimaryKey key{};
                if (auto ec = table->store().parse_key(key_attributes, key, message)) {
                    return make_failure<BatchGetItemResponse>(ec, std::move(message));
                }
                if (std::find(seen.begin(), seen.end(), key) != seen.end()) {
                    return make_failure<BatchGetItemResponse>(make_error_code(Errc::ValidationError),
                                                              "Provided list of item keys contains duplicates");
                }
                seen.push_back(std::move(key));
            }
            targets.emplace_back(std::move(table), &keys);
        }

        for (const auto& [table, keys] : targets) {
            auto& items = response.responses[table->name()];
            for (const auto& key_attributes : keys->keys) {
                auto found = table->store().get_item(key_attributes);
                if (!found.success()) {
                    return forward_failure<BatchGetItemResponse>(found);
                }
                if (*found.value) {
                    items.push_back(executor::project_item(**found.value, keys->attributes_to_get));
                }
            }
        }
        return make_success(std::move(response));
    });
}

const catalog::TableCatalog& Database::catalog() const noexcept
{
    return catalog_;
}

const OperationTelemetry& Database::telemetry() const noexcept
{
    return telemetry_;
}

const executor::ExecutorTelemetry& Database::executor_telemetry() const noexcept
{
    return executor_telemetry_;
}

const Database::Config& Database::config() const noexcept
{
    return config_;
}

}  // namespace rynamo::database
