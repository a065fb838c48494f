#include "rynamo/storage/key_value.hpp"

namespace rynamo::storage {

std::optional<KeyValue> KeyValue::from_attribute(const AttributeValue& value)
{
    KeyValue key{};
    switch (value.type()) {
    case AttributeType::String:
        key.type_ = catalog::ScalarAttributeType::String;
        key.bytes_ = value.as_string();
        return key;
    case AttributeType::Number:
        key.type_ = catalog::ScalarAttributeType::Number;
        key.number_ = value.as_number();
        return key;
    case AttributeType::Binary:
        key.type_ = catalog::ScalarAttributeType::Binary;
        key.bytes_ = value.as_binary();
        return key;
    default:
        return std::nullopt;
    }
}

AttributeValue KeyValue::to_attribute() const
{
    switch (type_) {
    case catalog::ScalarAttributeType::Number:
        return AttributeValue::number(number_);
    case catalog::ScalarAttributeType::Binary:
        return AttributeValue::binary(bytes_);
    case catalog::ScalarAttributeType::String:
    default:
        return AttributeValue::string(bytes_);
    }
}

catalog::ScalarAttributeType KeyValue::type() const noexcept
{
    return type_;
}

const std::string& KeyValue::bytes() const noexcept
{
    return bytes_;
}

const Decimal& KeyValue::number() const noexcept
{
    return number_;
}

std::strong_ordering operator<=>(const KeyValue& lhs, const KeyValue& rhs) noexcept
{
    if (lhs.type_ != rhs.type_) {
        return lhs.type_ <=> rhs.type_;
    }
    if (lhs.type_ == catalog::ScalarAttributeType::Number) {
        return lhs.number_ <=> rhs.number_;
    }
    return lhs.bytes_.compare(rhs.bytes_) <=> 0;
}

bool operator==(const KeyValue& lhs, const KeyValue& rhs) noexcept
{
    return (lhs <=> rhs) == std::strong_ordering::equal;
}

}  // namespace rynamo::storage
