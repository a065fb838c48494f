#include "rynamo/executor/filter_executor.hpp"

#include "rynamo/executor/executor_context.hpp"

#include <stdexcept>
#include <utility>

namespace rynamo::executor {

FilterExecutor::FilterExecutor(ExecutorNodePtr child, Config config)
    : child_{std::move(child)}
    , config_{std::move(config)}
{
    if (!config_.predicate) {
        throw std::invalid_argument{"FilterExecutor requires a predicate"};
    }
    if (!child_) {
        throw std::invalid_argument{"FilterExecutor requires a child executor"};
    }
}

void FilterExecutor::open(ExecutorContext& context)
{
    child_->open(context);
}

bool FilterExecutor::next(ExecutorContext& context, ItemRow& row)
{
    ExecutorTelemetry::LatencyScope latency{config_.telemetry, ExecutorTelemetry::Operator::Filter};
    while (child_->next(context, row)) {
        const bool passed = config_.predicate(row, context);
        if (context.failed()) {
            return false;
        }
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_filter_row(passed);
        }
        if (passed) {
            return true;
        }
    }
    return false;
}

void FilterExecutor::close(ExecutorContext& context)
{
    child_->close(context);
}

}  // namespace rynamo::executor
