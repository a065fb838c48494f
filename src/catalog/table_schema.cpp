#include "rynamo/catalog/table_schema.hpp"

#include "rynamo/common/error.hpp"
#include "rynamo/common/validation.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace rynamo::catalog {

namespace {

std::error_code invalid(std::string& message, std::string text)
{
    message = std::move(text);
    return make_error_code(Errc::ValidationError);
}

const AttributeDefinition* find_definition(const CreateTableRequest& request, std::string_view name) noexcept
{
    const auto it = std::find_if(request.attribute_definitions.begin(),
                                 request.attribute_definitions.end(),
                                 [name](const AttributeDefinition& definition) { return definition.attribute_name == name; });
    return it == request.attribute_definitions.end() ? nullptr : &*it;
}

}  // namespace

bool TableSchema::is_key_attribute(std::string_view name) const noexcept
{
    return partition_key.name == name || (sort_key && sort_key->name == name);
}

const char* to_string(ScalarAttributeType type) noexcept
{
    switch (type) {
    case ScalarAttributeType::String:
        return "S";
    case ScalarAttributeType::Number:
        return "N";
    case ScalarAttributeType::Binary:
        return "B";
    }
    return "?";
}

const char* to_string(KeyType type) noexcept
{
    return type == KeyType::Hash ? "HASH" : "RANGE";
}

const char* to_string(TableStatus status) noexcept
{
    switch (status) {
    case TableStatus::Creating:
        return "CREATING";
    case TableStatus::Active:
        return "ACTIVE";
    case TableStatus::Deleting:
        return "DELETING";
    }
    return "UNKNOWN";
}

const char* to_string(BillingMode mode) noexcept
{
    return mode == BillingMode::Provisioned ? "PROVISIONED" : "PAY_PER_REQUEST";
}

std::optional<ScalarAttributeType> parse_scalar_attribute_type(std::string_view text) noexcept
{
    if (text == "S") {
        return ScalarAttributeType::String;
    }
    if (text == "N") {
        return ScalarAttributeType::Number;
    }
    if (text == "B") {
        return ScalarAttributeType::Binary;
    }
    return std::nullopt;
}

bool matches(ScalarAttributeType expected, AttributeType actual) noexcept
{
    switch (expected) {
    case ScalarAttributeType::String:
        return actual == AttributeType::String;
    case ScalarAttributeType::Number:
        return actual == AttributeType::Number;
    case ScalarAttributeType::Binary:
        return actual == AttributeType::Binary;
    }
    return false;
}

std::error_code build_table_schema(const CreateTableRequest& request, TableSchema& schema, std::string& message)
{
    if (auto ec = validate_table_name(request.table_name, message)) {
        return ec;
    }

    if (request.key_schema.empty() || request.key_schema.size() > 2U) {
        return invalid(message, "1 validation error detected: Value at 'keySchema' failed to satisfy constraint: "
                                "Member must have length less than or equal to 2 and greater than or equal to 1");
    }
    if (request.key_schema.front().key_type != KeyType::Hash) {
        return invalid(message, "Invalid KeySchema: The first KeySchemaElement is not a HASH key type");
    }
    if (request.key_schema.size() == 2U) {
        if (request.key_schema[1].key_type != KeyType::Range) {
            return invalid(message, "Invalid KeySchema: The second KeySchemaElement is not a RANGE key type");
        }
        if (request.key_schema[0].attribute_name == request.key_schema[1].attribute_name) {
            return invalid(message, "Invalid KeySchema: Both the Hash Key and the Range Key element in the KeySchema have the same name");
        }
    }

    std::set<std::string_view> seen;
    for (const auto& definition : request.attribute_definitions) {
        if (definition.attribute_name.empty()) {
            return invalid(message, "One or more parameter values were invalid: An attribute name cannot be empty");
        }
        if (!seen.insert(definition.attribute_name).second) {
            return invalid(message, "Cannot have two attributes with the same name: " + definition.attribute_name);
        }
    }

    for (const auto& element : request.key_schema) {
        if (find_definition(request, element.attribute_name) == nullptr) {
            return invalid(message, "One or more parameter values were invalid: Some index key attributes are not defined in "
                                    "AttributeDefinitions. Keys: ["
                                        + element.attribute_name + "]");
        }
    }
    if (request.attribute_definitions.size() != request.key_schema.size()) {
        return invalid(message, "One or more parameter values were invalid: Number of attributes in KeySchema does not exactly "
                                "match number of attributes defined in AttributeDefinitions");
    }

    if (request.billing_mode == BillingMode::Provisioned
        && (request.provisioned_throughput.read_capacity_units == 0U
            || request.provisioned_throughput.write_capacity_units == 0U)) {
        return invalid(message, "One or more parameter values were invalid: ReadCapacityUnits and WriteCapacityUnits must both be "
                                "specified and greater than 0 when BillingMode is PROVISIONED");
    }

    TableSchema built{};
    built.table_name = request.table_name;
    const auto* hash = find_definition(request, request.key_schema[0].attribute_name);
    built.partition_key = KeyAttribute{hash->attribute_name, hash->attribute_type};
    if (request.key_schema.size() == 2U) {
        const auto* range = find_definition(request, request.key_schema[1].attribute_name);
        built.sort_key = KeyAttribute{range->attribute_name, range->attribute_type};
    }
    built.attribute_definitions = request.attribute_definitions;
    schema = std::move(built);
    return {};
}

}  // namespace rynamo::catalog
