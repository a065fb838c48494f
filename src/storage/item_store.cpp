#include "rynamo/storage/item_store.hpp"

#include "rynamo/common/validation.hpp"
#include "rynamo/expression/evaluator.hpp"
#include "rynamo/expression/update_applier.hpp"

#include <utility>

namespace rynamo::storage {

namespace {

const expression::PlaceholderBindings& empty_bindings() noexcept
{
    static const expression::PlaceholderBindings bindings{};
    return bindings;
}

std::error_code key_mismatch(std::string& message)
{
    message = "The provided key element does not match the schema";
    return make_error_code(Errc::ValidationError);
}

std::error_code read_key_attribute(const Item& item,
                                   const catalog::KeyAttribute& attribute,
                                   KeyValue& out,
                                   std::string& message)
{
    const auto it = item.find(attribute.name);
    if (it == item.end()) {
        message = "One or more parameter values were invalid: Missing the key " + attribute.name + " in the item";
        return make_error_code(Errc::ValidationError);
    }
    if (!catalog::matches(attribute.type, it->second.type())) {
        message = "One or more parameter values were invalid: Type mismatch for key " + attribute.name + " expected: "
                  + catalog::to_string(attribute.type) + " actual: " + type_tag(it->second.type());
        return make_error_code(Errc::ValidationError);
    }

    auto key = KeyValue::from_attribute(it->second);
    if (!key) {
        return key_mismatch(message);
    }
    if (key->type() != catalog::ScalarAttributeType::Number && key->bytes().empty()) {
        message = std::string{"One or more parameter values are not valid. The AttributeValue for a key attribute cannot contain an empty "}
                  + (key->type() == catalog::ScalarAttributeType::String ? "string" : "binary") + " value. Key: " + attribute.name;
        return make_error_code(Errc::ValidationError);
    }
    out = std::move(*key);
    return {};
}

}  // namespace

ItemStore::ReadView::ReadView(const ItemStore& store)
    : store_{&store}
    , lock_{store.mutex_}
{
}

const ItemStore::PartitionMap& ItemStore::ReadView::partitions() const noexcept
{
    return store_->partitions_;
}

const catalog::TableSchema& ItemStore::ReadView::schema() const noexcept
{
    return store_->schema_;
}

ItemStore::ItemStore(catalog::TableSchema schema)
    : schema_{std::move(schema)}
{
}

OperationResult<std::optional<Item>> ItemStore::put_item(Item item, const WriteOptions& options)
{
    std::string message;
    if (auto ec = validate_item(item, message)) {
        return make_failure<std::optional<Item>>(ec, std::move(message));
    }
    PrimaryKey key{};
    if (auto ec = extract_key(item, key, message)) {
        return make_failure<std::optional<Item>>(ec, std::move(message));
    }

    std::unique_lock lock{mutex_};
    const auto* existing = find_locked(key);
    if (auto ec = check_condition(existing, options, message)) {
        return make_failure<std::optional<Item>>(ec, std::move(message));
    }

    std::optional<Item> previous;
    if (existing != nullptr && options.return_values == ReturnValues::AllOld) {
        previous = *existing;
    }
    store_locked(key, std::move(item));
    return make_success(std::move(previous));
}

OperationResult<std::optional<Item>> ItemStore::get_item(const Item& key_attributes) const
{
    std::string message;
    PrimaryKey key{};
    if (auto ec = parse_key(key_attributes, key, message)) {
        return make_failure<std::optional<Item>>(ec, std::move(message));
    }

    std::shared_lock lock{mutex_};
    const auto* existing = find_locked(key);
    if (existing == nullptr) {
        return make_success(std::optional<Item>{});
    }
    return make_success(std::optional<Item>{*existing});
}

OperationResult<std::optional<Item>> ItemStore::delete_item(const Item& key_attributes, const WriteOptions& options)
{
    std::string message;
    PrimaryKey key{};
    if (auto ec = parse_key(key_attributes, key, message)) {
        return make_failure<std::optional<Item>>(ec, std::move(message));
    }

    std::unique_lock lock{mutex_};
    const auto* existing = find_locked(key);
    if (auto ec = check_condition(existing, options, message)) {
        return make_failure<std::optional<Item>>(ec, std::move(message));
    }
    if (existing == nullptr) {
        return make_success(std::optional<Item>{});
    }

    std::optional<Item> previous;
    if (options.return_values == ReturnValues::AllOld) {
        previous = *existing;
    }
    erase_locked(key);
    return make_success(std::move(previous));
}

OperationResult<std::optional<Item>> ItemStore::update_item(const Item& key_attributes,
                                                            const expression::UpdateExpression* update,
                                                            const WriteOptions& options)
{
    std::string message;
    PrimaryKey key{};
    if (auto ec = parse_key(key_attributes, key, message)) {
        return make_failure<std::optional<Item>>(ec, std::move(message));
    }

    std::unique_lock lock{mutex_};
    const auto* existing = find_locked(key);
    if (auto ec = check_condition(existing, options, message)) {
        return make_failure<std::optional<Item>>(ec, std::move(message));
    }

    Item working = existing != nullptr ? *existing : key_attributes;
    if (update != nullptr) {
        const auto& bindings = options.bindings != nullptr ? *options.bindings : empty_bindings();
        if (auto ec = expression::apply_update(*update, bindings, working, message)) {
            return make_failure<std::optional<Item>>(ec, std::move(message));
        }
    }

    for (const auto& [name, value] : key_attributes) {
        const auto it = working.find(name);
        if (it == working.end() || !(it->second == value)) {
            message = "One or more parameter values were invalid: Cannot update attribute " + name
                      + ". This attribute is part of the key";
            return make_failure<std::optional<Item>>(make_error_code(Errc::ValidationError), std::move(message));
        }
    }
    if (auto ec = validate_item(working, message)) {
        return make_failure<std::optional<Item>>(ec, std::move(message));
    }

    std::optional<Item> returned;
    if (options.return_values == ReturnValues::AllOld && existing != nullptr) {
        returned = *existing;
    } else if (options.return_values == ReturnValues::AllNew) {
        returned = working;
    }
    store_locked(key, std::move(working));
    return make_success(std::move(returned));
}

std::error_code ItemStore::extract_key(const Item& item, PrimaryKey& key, std::string& message) const
{
    if (auto ec = read_key_attribute(item, schema_.partition_key, key.partition, message)) {
        return ec;
    }
    key.sort.reset();
    if (schema_.sort_key) {
        KeyValue sort{};
        if (auto ec = read_key_attribute(item, *schema_.sort_key, sort, message)) {
            return ec;
        }
        key.sort = std::move(sort);
    }
    return {};
}

std::error_code ItemStore::parse_key(const Item& attributes, PrimaryKey& key, std::string& message) const
{
    const std::size_t expected = schema_.sort_key ? 2U : 1U;
    if (attributes.size() != expected) {
        return key_mismatch(message);
    }
    for (const auto& [name, value] : attributes) {
        if (!schema_.is_key_attribute(name)) {
            return key_mismatch(message);
        }
    }
    return extract_key(attributes, key, message);
}

Item ItemStore::key_attributes(const PrimaryKey& key) const
{
    Item attributes;
    attributes.emplace(schema_.partition_key.name, key.partition.to_attribute());
    if (schema_.sort_key && key.sort) {
        attributes.emplace(schema_.sort_key->name, key.sort->to_attribute());
    }
    return attributes;
}

ItemStore::ReadView ItemStore::read() const
{
    return ReadView{*this};
}

const catalog::TableSchema& ItemStore::schema() const noexcept
{
    return schema_;
}

StoreStatistics ItemStore::statistics() const noexcept
{
    StoreStatistics statistics{};
    statistics.item_count = item_count_.load(std::memory_order_relaxed);
    statistics.size_bytes = size_bytes_.load(std::memory_order_relaxed);
    return statistics;
}

std::error_code ItemStore::check_condition(const Item* existing, const WriteOptions& options, std::string& message) const
{
    if (options.condition == nullptr) {
        return {};
    }

    static const Item empty_item{};
    const auto& bindings = options.bindings != nullptr ? *options.bindings : empty_bindings();
    const auto result = expression::evaluate(*options.condition, existing != nullptr ? *existing : empty_item, bindings);
    if (!result.success()) {
        message = result.message;
        return result.error;
    }
    if (!result.matched) {
        message = "The conditional request failed";
        return make_error_code(Errc::ConditionalCheckFailed);
    }
    return {};
}

const Item* ItemStore::find_locked(const PrimaryKey& key) const
{
    const auto partition = partitions_.find(key.partition);
    if (partition == partitions_.end()) {
        return nullptr;
    }
    const auto row = partition->second.find(key.sort);
    return row == partition->second.end() ? nullptr : &row->second;
}

void ItemStore::store_locked(const PrimaryKey& key, Item item)
{
    const auto new_size = static_cast<std::uint64_t>(item_size(item));
    auto& partition = partitions_[key.partition];
    auto row = partition.find(key.sort);
    if (row == partition.end()) {
        partition.emplace(key.sort, std::move(item));
        item_count_.fetch_add(1U, std::memory_order_relaxed);
    } else {
        size_bytes_.fetch_sub(static_cast<std::uint64_t>(item_size(row->second)), std::memory_order_relaxed);
        row->second = std::move(item);
    }
    size_bytes_.fetch_add(new_size, std::memory_order_relaxed);
}

void ItemStore::erase_locked(const PrimaryKey& key)
{
    const auto partition = partitions_.find(key.partition);
    if (partition == partitions_.end()) {
        return;
    }
    const auto row = partition->second.find(key.sort);
    if (row == partition->second.end()) {
        return;
    }
    size_bytes_.fetch_sub(static_cast<std::uint64_t>(item_size(row->second)), std::memory_order_relaxed);
    item_count_.fetch_sub(1U, std::memory_order_relaxed);
    partition->second.erase(row);
    if (partition->second.empty()) {
        partitions_.erase(partition);
    }
}

}  // namespace rynamo::storage
