#include "rynamo/common/attribute_value.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace rynamo {

namespace {

template <typename T>
std::vector<T> sorted_unique(std::vector<T> values)
{
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

constexpr std::array<const char*, 10> kTypeTags{"S", "N", "B", "BOOL", "NULL", "L", "M", "SS", "NS", "BS"};

std::size_t number_size(const Decimal& value) noexcept
{
    return (value.significant_digits() + 1U) / 2U + 1U;
}

}  // namespace

AttributeValue::AttributeValue()
    : storage_{std::in_place_index<4>, NullValue{}}
{
}

AttributeValue::AttributeValue(Storage storage)
    : storage_{std::move(storage)}
{
}

AttributeValue AttributeValue::string(std::string value)
{
    return AttributeValue{Storage{std::in_place_index<0>, std::move(value)}};
}

AttributeValue AttributeValue::number(Decimal value)
{
    return AttributeValue{Storage{std::in_place_index<1>, std::move(value)}};
}

AttributeValue AttributeValue::binary(std::string bytes)
{
    return AttributeValue{Storage{std::in_place_index<2>, std::move(bytes)}};
}

AttributeValue AttributeValue::boolean(bool value)
{
    return AttributeValue{Storage{std::in_place_index<3>, value}};
}

AttributeValue AttributeValue::null()
{
    return AttributeValue{};
}

AttributeValue AttributeValue::list(AttributeList values)
{
    return AttributeValue{Storage{std::in_place_index<5>, std::move(values)}};
}

AttributeValue AttributeValue::map(AttributeMap values)
{
    return AttributeValue{Storage{std::in_place_index<6>, std::move(values)}};
}

AttributeValue AttributeValue::string_set(std::vector<std::string> values)
{
    return AttributeValue{Storage{std::in_place_index<7>, sorted_unique(std::move(values))}};
}

AttributeValue AttributeValue::number_set(std::vector<Decimal> values)
{
    return AttributeValue{Storage{std::in_place_index<8>, sorted_unique(std::move(values))}};
}

AttributeValue AttributeValue::binary_set(std::vector<std::string> values)
{
    return AttributeValue{Storage{std::in_place_index<9>, sorted_unique(std::move(values))}};
}

AttributeType AttributeValue::type() const noexcept
{
    return static_cast<AttributeType>(storage_.index());
}

bool AttributeValue::is_set() const noexcept
{
    const auto kind = type();
    return kind == AttributeType::StringSet || kind == AttributeType::NumberSet || kind == AttributeType::BinarySet;
}

const std::string& AttributeValue::as_string() const
{
    return std::get<0>(storage_);
}

const Decimal& AttributeValue::as_number() const
{
    return std::get<1>(storage_);
}

const std::string& AttributeValue::as_binary() const
{
    return std::get<2>(storage_);
}

bool AttributeValue::as_bool() const
{
    return std::get<3>(storage_);
}

const AttributeList& AttributeValue::as_list() const
{
    return std::get<5>(storage_);
}

AttributeList& AttributeValue::as_list()
{
    return std::get<5>(storage_);
}

const AttributeMap& AttributeValue::as_map() const
{
    return std::get<6>(storage_);
}

AttributeMap& AttributeValue::as_map()
{
    return std::get<6>(storage_);
}

const std::vector<std::string>& AttributeValue::as_string_set() const
{
    return std::get<7>(storage_);
}

const std::vector<Decimal>& AttributeValue::as_number_set() const
{
    return std::get<8>(storage_);
}

const std::vector<std::string>& AttributeValue::as_binary_set() const
{
    return std::get<9>(storage_);
}

std::size_t AttributeValue::cardinality() const noexcept
{
    switch (type()) {
    case AttributeType::List:
        return std::get<5>(storage_).size();
    case AttributeType::Map:
        return std::get<6>(storage_).size();
    case AttributeType::StringSet:
        return std::get<7>(storage_).size();
    case AttributeType::NumberSet:
        return std::get<8>(storage_).size();
    case AttributeType::BinarySet:
        return std::get<9>(storage_).size();
    default:
        return 0U;
    }
}

bool operator==(const AttributeValue& lhs, const AttributeValue& rhs)
{
    return lhs.storage_ == rhs.storage_;
}

const char* type_tag(AttributeType type) noexcept
{
    const auto index = static_cast<std::size_t>(type);
    return index < kTypeTags.size() ? kTypeTags[index] : "?";
}

std::optional<AttributeType> parse_type_tag(std::string_view tag) noexcept
{
    for (std::size_t index = 0; index < kTypeTags.size(); ++index) {
        if (tag == kTypeTags[index]) {
            return static_cast<AttributeType>(index);
        }
    }
    return std::nullopt;
}

std::size_t encoded_size(const AttributeValue& value) noexcept
{
    switch (value.type()) {
    case AttributeType::String:
        return value.as_string().size();
    case AttributeType::Number:
        return number_size(value.as_number());
    case AttributeType::Binary:
        return value.as_binary().size();
    case AttributeType::Boolean:
    case AttributeType::Null:
        return 1U;
    case AttributeType::List: {
        std::size_t total = 3U;
        for (const auto& element : value.as_list()) {
            total += 1U + encoded_size(element);
        }
        return total;
    }
    case AttributeType::Map: {
        std::size_t total = 3U;
        for (const auto& [name, element] : value.as_map()) {
            total += 1U + name.size() + encoded_size(element);
        }
        return total;
    }
    case AttributeType::StringSet:
    case AttributeType::BinarySet: {
        const auto& elements = value.type() == AttributeType::StringSet ? value.as_string_set() : value.as_binary_set();
        std::size_t total = 0U;
        for (const auto& element : elements) {
            total += element.size();
        }
        return total;
    }
    case AttributeType::NumberSet: {
        std::size_t total = 0U;
        for (const auto& element : value.as_number_set()) {
            total += number_size(element);
        }
        return total;
    }
    }
    return 0U;
}

std::size_t item_size(const Item& item) noexcept
{
    std::size_t total = 0U;
    for (const auto& [name, value] : item) {
        total += name.size() + encoded_size(value);
    }
    return total;
}

}  // namespace rynamo
