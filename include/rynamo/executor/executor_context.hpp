#pragma once

#include "rynamo/executor/executor_node.hpp"
#include "rynamo/expression/bindings.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace rynamo::executor {

struct ExecutorContextConfig final {
    const expression::PlaceholderBindings* bindings = nullptr;
};

// Per-page execution state shared by every node of a pipeline.
class ExecutorContext final {
public:
    ExecutorContext();
    explicit ExecutorContext(ExecutorContextConfig config);

    [[nodiscard]] const expression::PlaceholderBindings& bindings() const noexcept;

    // Called by the scan for every item it reads, before any filter.
    void record_examined(const ItemRow& row) noexcept;
    [[nodiscard]] std::uint64_t examined_count() const noexcept;
    [[nodiscard]] const std::optional<ItemRow>& last_examined() const noexcept;

    // Set when a scan stopped on a budget while more items remain in range.
    void mark_truncated() noexcept;
    [[nodiscard]] bool truncated() const noexcept;

    void record_error(std::error_code error, std::string message);
    [[nodiscard]] bool failed() const noexcept;
    [[nodiscard]] std::error_code error() const noexcept;
    [[nodiscard]] const std::string& error_message() const noexcept;

private:
    ExecutorContextConfig config_{};
    std::uint64_t examined_ = 0U;
    std::optional<ItemRow> last_examined_{};
    bool truncated_ = false;
    std::error_code error_{};
    std::string error_message_{};
};

}  // namespace rynamo::executor
