#pragma once

#include "rynamo/common/decimal.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rynamo {

enum class AttributeType : std::uint8_t {
    String = 0,
    Number,
    Binary,
    Boolean,
    Null,
    List,
    Map,
    StringSet,
    NumberSet,
    BinarySet
};

class AttributeValue;

using AttributeList = std::vector<AttributeValue>;
using AttributeMap = std::map<std::string, AttributeValue>;
using Item = AttributeMap;

struct NullValue final {
    friend bool operator==(const NullValue&, const NullValue&) noexcept = default;
};

// Closed sum of the supported value types. Alternative order matches AttributeType.
// Sets are kept sorted and free of duplicates so equality is structural.
class AttributeValue final {
public:
    using Storage = std::variant<std::string,
                                 Decimal,
                                 std::string,
                                 bool,
                                 NullValue,
                                 AttributeList,
                                 AttributeMap,
                                 std::vector<std::string>,
                                 std::vector<Decimal>,
                                 std::vector<std::string>>;

    AttributeValue();

    static AttributeValue string(std::string value);
    static AttributeValue number(Decimal value);
    static AttributeValue binary(std::string bytes);
    static AttributeValue boolean(bool value);
    static AttributeValue null();
    static AttributeValue list(AttributeList values);
    static AttributeValue map(AttributeMap values);
    static AttributeValue string_set(std::vector<std::string> values);
    static AttributeValue number_set(std::vector<Decimal> values);
    static AttributeValue binary_set(std::vector<std::string> values);

    [[nodiscard]] AttributeType type() const noexcept;
    [[nodiscard]] bool is_set() const noexcept;

    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const Decimal& as_number() const;
    [[nodiscard]] const std::string& as_binary() const;
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] const AttributeList& as_list() const;
    [[nodiscard]] AttributeList& as_list();
    [[nodiscard]] const AttributeMap& as_map() const;
    [[nodiscard]] AttributeMap& as_map();
    [[nodiscard]] const std::vector<std::string>& as_string_set() const;
    [[nodiscard]] const std::vector<Decimal>& as_number_set() const;
    [[nodiscard]] const std::vector<std::string>& as_binary_set() const;

    // Element count for sets, lists and maps; zero otherwise.
    [[nodiscard]] std::size_t cardinality() const noexcept;

    friend bool operator==(const AttributeValue& lhs, const AttributeValue& rhs);

private:
    explicit AttributeValue(Storage storage);

    Storage storage_;
};

const char* type_tag(AttributeType type) noexcept;
std::optional<AttributeType> parse_type_tag(std::string_view tag) noexcept;

std::size_t encoded_size(const AttributeValue& value) noexcept;
std::size_t item_size(const Item& item) noexcept;

}  // namespace rynamo
