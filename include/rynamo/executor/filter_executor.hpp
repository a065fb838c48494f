#pragma once

#include "rynamo/executor/executor_node.hpp"
#include "rynamo/executor/executor_telemetry.hpp"

#include <functional>
#include <string>

namespace rynamo::executor {

class FilterExecutor final : public ExecutorNode {
public:
    using Predicate = std::function<bool(const ItemRow&, ExecutorContext&)>;

    struct Config final {
        Predicate predicate;
        ExecutorTelemetry* telemetry = nullptr;
        std::string telemetry_identifier{};
    };

    FilterExecutor(ExecutorNodePtr child, Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, ItemRow& row) override;
    void close(ExecutorContext& context) override;

private:
    ExecutorNodePtr child_{};
    Config config_{};
};

}  // namespace rynamo::executor
