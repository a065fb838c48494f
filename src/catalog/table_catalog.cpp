#include "rynamo/catalog/table_catalog.hpp"

#include "rynamo/common/validation.hpp"

#include <array>
#include <cstdio>
#include <mutex>
#include <random>
#include <utility>

namespace rynamo::catalog {

namespace {

std::string not_found_message(std::string_view name)
{
    return "Requested resource not found: Table: " + std::string{name} + " not found";
}

}  // namespace

std::string generate_table_id()
{
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> distribution;
    std::array<std::uint8_t, 16> bytes{};
    for (std::size_t offset = 0U; offset < bytes.size(); offset += 8U) {
        auto word = distribution(engine);
        for (std::size_t index = 0U; index < 8U; ++index) {
            bytes[offset + index] = static_cast<std::uint8_t>(word & 0xFFU);
            word >>= 8U;
        }
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0FU) | 0x40U);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3FU) | 0x80U);

    std::array<char, 37> text{};
    std::snprintf(text.data(),
                  text.size(),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                  bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string{text.data()};
}

Table::Table(TableDescription description)
    : description_{std::move(description)}
    , status_{description_.status}
    , store_{description_.schema}
{
}

const std::string& Table::name() const noexcept
{
    return description_.schema.table_name;
}

const TableSchema& Table::schema() const noexcept
{
    return description_.schema;
}

TableStatus Table::status() const noexcept
{
    return status_.load(std::memory_order_acquire);
}

void Table::set_status(TableStatus status) noexcept
{
    status_.store(status, std::memory_order_release);
}

storage::ItemStore& Table::store() noexcept
{
    return store_;
}

const storage::ItemStore& Table::store() const noexcept
{
    return store_;
}

TableDescription Table::describe() const
{
    auto description = description_;
    description.status = status();
    const auto statistics = store_.statistics();
    description.item_count = statistics.item_count;
    description.table_size_bytes = statistics.size_bytes;
    return description;
}

TableCatalog::TableCatalog()
    : TableCatalog(Config{})
{
}

TableCatalog::TableCatalog(Config config)
    : config_{std::move(config)}
{
    if (!config_.clock) {
        config_.clock = [] { return std::chrono::system_clock::now(); };
    }
    if (!config_.id_generator) {
        config_.id_generator = generate_table_id;
    }
}

OperationResult<TableDescription> TableCatalog::create_table(const CreateTableRequest& request)
{
    std::string message;
    TableSchema schema{};
    if (auto ec = build_table_schema(request, schema, message)) {
        return make_failure<TableDescription>(ec, std::move(message));
    }

    std::unique_lock lock{mutex_};
    if (auto ec = ensure_absent(tables_.contains(request.table_name), Errc::TableAlreadyExists)) {
        return make_failure<TableDescription>(ec, "Table already exists: " + request.table_name);
    }

    TableDescription description{};
    description.schema = std::move(schema);
    description.status = TableStatus::Active;
    description.table_id = config_.id_generator();
    description.table_arn = table_arn(request.table_name);
    description.creation_time = config_.clock();
    description.billing_mode = request.billing_mode;
    if (request.billing_mode == BillingMode::Provisioned) {
        description.provisioned_throughput = request.provisioned_throughput;
    }

    auto table = std::make_shared<Table>(std::move(description));
    auto snapshot = table->describe();
    tables_.emplace(request.table_name, std::move(table));
    return make_success(std::move(snapshot));
}

OperationResult<TableDescription> TableCatalog::describe_table(std::string_view name) const
{
    auto table = find_table(name);
    if (auto ec = ensure_exists(table != nullptr, Errc::ResourceNotFound)) {
        return make_failure<TableDescription>(ec, not_found_message(name));
    }
    return make_success(table->describe());
}

OperationResult<TableDescription> TableCatalog::delete_table(std::string_view name)
{
    TablePtr table;
    {
        std::unique_lock lock{mutex_};
        const auto it = tables_.find(name);
        if (auto ec = ensure_exists(it != tables_.end(), Errc::ResourceNotFound)) {
            return make_failure<TableDescription>(ec, not_found_message(name));
        }
        table = std::move(it->second);
        tables_.erase(it);
    }
    table->set_status(TableStatus::Deleting);
    return make_success(table->describe());
}

OperationResult<ListTablesResponse> TableCatalog::list_tables(const ListTablesRequest& request) const
{
    const auto limit = request.limit.value_or(kMaxListTablesLimit);
    if (limit < 1U || limit > kMaxListTablesLimit) {
        return make_failure<ListTablesResponse>(make_error_code(Errc::ValidationError),
                                                "1 validation error detected: Value '" + std::to_string(limit)
                                                    + "' at 'limit' failed to satisfy constraint: Member must have value "
                                                      "less than or equal to 100 and greater than or equal to 1");
    }

    ListTablesResponse response{};
    std::shared_lock lock{mutex_};
    auto it = request.exclusive_start_table_name ? tables_.upper_bound(*request.exclusive_start_table_name)
                                                  : tables_.begin();
    for (; it != tables_.end() && response.table_names.size() < limit; ++it) {
        response.table_names.push_back(it->first);
    }
    if (it != tables_.end() && !response.table_names.empty()) {
        response.last_evaluated_table_name = response.table_names.back();
    }
    return make_success(std::move(response));
}

TablePtr TableCatalog::find_table(std::string_view name) const
{
    std::shared_lock lock{mutex_};
    const auto it = tables_.find(name);
    return it == tables_.end() ? nullptr : it->second;
}

OperationResult<TablePtr> TableCatalog::open_table(std::string_view name) const
{
    auto table = find_table(name);
    if (auto ec = ensure_exists(table != nullptr, Errc::ResourceNotFound)) {
        return make_failure<TablePtr>(ec, not_found_message(name));
    }
    return make_success(std::move(table));
}

std::size_t TableCatalog::table_count() const
{
    std::shared_lock lock{mutex_};
    return tables_.size();
}

const TableCatalog::Config& TableCatalog::config() const noexcept
{
    return config_;
}

std::string TableCatalog::table_arn(std::string_view name) const
{
    return "arn:aws:dynamodb:" + config_.region + ":" + config_.account_id + ":table/" + std::string{name};
}

}  // namespace rynamo::catalog
