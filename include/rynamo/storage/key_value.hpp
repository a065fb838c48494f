#pragma once

#include "rynamo/catalog/table_schema.hpp"
#include "rynamo/common/attribute_value.hpp"
#include "rynamo/common/decimal.hpp"

#include <compare>
#include <optional>
#include <string>

namespace rynamo::storage {

// A key attribute value (S, N or B) with the natural ordering of its type:
// numeric for N, unsigned bytewise for S and B.
class KeyValue final {
public:
    KeyValue() = default;

    static std::optional<KeyValue> from_attribute(const AttributeValue& value);

    [[nodiscard]] AttributeValue to_attribute() const;
    [[nodiscard]] catalog::ScalarAttributeType type() const noexcept;
    [[nodiscard]] const std::string& bytes() const noexcept;
    [[nodiscard]] const Decimal& number() const noexcept;

    friend std::strong_ordering operator<=>(const KeyValue& lhs, const KeyValue& rhs) noexcept;
    friend bool operator==(const KeyValue& lhs, const KeyValue& rhs) noexcept;

private:
    catalog::ScalarAttributeType type_ = catalog::ScalarAttributeType::String;
    std::string bytes_{};
    Decimal number_{};
};

using SortKey = std::optional<KeyValue>;

struct PrimaryKey final {
    KeyValue partition{};
    SortKey sort{};

    friend bool operator==(const PrimaryKey& lhs, const PrimaryKey& rhs) noexcept = default;
};

}  // namespace rynamo::storage
