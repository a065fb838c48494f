#pragma once

#include "rynamo/common/attribute_value.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rynamo::catalog {

enum class ScalarAttributeType : std::uint8_t {
    String = 0,
    Number,
    Binary
};

enum class KeyType : std::uint8_t {
    Hash = 0,
    Range
};

enum class TableStatus : std::uint8_t {
    Creating = 0,
    Active,
    Deleting
};

enum class BillingMode : std::uint8_t {
    Provisioned = 0,
    PayPerRequest
};

struct AttributeDefinition final {
    std::string attribute_name{};
    ScalarAttributeType attribute_type = ScalarAttributeType::String;
};

struct KeySchemaElement final {
    std::string attribute_name{};
    KeyType key_type = KeyType::Hash;
};

struct ProvisionedThroughput final {
    std::uint64_t read_capacity_units = 0U;
    std::uint64_t write_capacity_units = 0U;
};

struct KeyAttribute final {
    std::string name{};
    ScalarAttributeType type = ScalarAttributeType::String;
};

struct CreateTableRequest final {
    std::string table_name{};
    std::vector<AttributeDefinition> attribute_definitions{};
    std::vector<KeySchemaElement> key_schema{};
    BillingMode billing_mode = BillingMode::PayPerRequest;
    ProvisionedThroughput provisioned_throughput{};
};

struct TableSchema final {
    std::string table_name{};
    KeyAttribute partition_key{};
    std::optional<KeyAttribute> sort_key{};
    std::vector<AttributeDefinition> attribute_definitions{};

    [[nodiscard]] bool is_key_attribute(std::string_view name) const noexcept;
};

struct TableDescription final {
    TableSchema schema{};
    TableStatus status = TableStatus::Creating;
    std::string table_id{};
    std::string table_arn{};
    std::chrono::system_clock::time_point creation_time{};
    BillingMode billing_mode = BillingMode::PayPerRequest;
    ProvisionedThroughput provisioned_throughput{};
    std::uint64_t item_count = 0U;
    std::uint64_t table_size_bytes = 0U;
};

const char* to_string(ScalarAttributeType type) noexcept;
const char* to_string(KeyType type) noexcept;
const char* to_string(TableStatus status) noexcept;
const char* to_string(BillingMode mode) noexcept;

std::optional<ScalarAttributeType> parse_scalar_attribute_type(std::string_view text) noexcept;

bool matches(ScalarAttributeType expected, AttributeType actual) noexcept;

// Validates a CreateTable request and derives the key layout from it.
std::error_code build_table_schema(const CreateTableRequest& request, TableSchema& schema, std::string& message);

}  // namespace rynamo::catalog
