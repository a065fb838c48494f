#pragma once

#include "rynamo/catalog/table_schema.hpp"
#include "rynamo/common/attribute_value.hpp"
#include "rynamo/expression/bindings.hpp"
#include "rynamo/expression/grammar.hpp"
#include "rynamo/storage/item_store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rynamo::shell {

enum class CommandKind : std::uint8_t {
    CreateTable = 0,
    DescribeTable,
    DropTable,
    ListTables,
    Put,
    Get,
    Delete,
    Update,
    Query,
    Scan
};

const char* to_string(CommandKind kind) noexcept;

// One parsed shell statement. `item` holds the full item for PUT and the key
// for GET, DELETE and UPDATE. `expression` holds the update expression for
// UPDATE and the key condition for QUERY.
struct ShellCommand final {
    CommandKind kind = CommandKind::ListTables;
    std::string table_name{};
    std::optional<catalog::KeyAttribute> hash_key{};
    std::optional<catalog::KeyAttribute> range_key{};
    std::optional<std::uint32_t> limit{};
    std::optional<std::string> from_table{};
    Item item{};
    std::optional<Item> start_key{};
    std::optional<std::string> expression{};
    std::optional<std::string> condition{};
    std::optional<std::string> filter{};
    expression::PlaceholderBindings bindings{};
    storage::ReturnValues return_values = storage::ReturnValues::None;
    bool scan_forward = true;
};

struct CommandParseResult final {
    std::optional<ShellCommand> command{};
    std::error_code error{};
    std::vector<expression::ParserDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return command.has_value(); }
};

CommandParseResult parse_command(std::string_view text);

}  // namespace rynamo::shell
