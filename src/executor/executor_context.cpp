#include "rynamo/executor/executor_context.hpp"

#include <utility>

namespace rynamo::executor {

namespace {

const expression::PlaceholderBindings& empty_bindings() noexcept
{
    static const expression::PlaceholderBindings bindings{};
    return bindings;
}

}  // namespace

ExecutorContext::ExecutorContext() = default;

ExecutorContext::ExecutorContext(ExecutorContextConfig config)
    : config_{config}
{
}

const expression::PlaceholderBindings& ExecutorContext::bindings() const noexcept
{
    return config_.bindings != nullptr ? *config_.bindings : empty_bindings();
}

void ExecutorContext::record_examined(const ItemRow& row) noexcept
{
    ++examined_;
    last_examined_ = row;
}

std::uint64_t ExecutorContext::examined_count() const noexcept
{
    return examined_;
}

const std::optional<ItemRow>& ExecutorContext::last_examined() const noexcept
{
    return last_examined_;
}

void ExecutorContext::mark_truncated() noexcept
{
    truncated_ = true;
}

bool ExecutorContext::truncated() const noexcept
{
    return truncated_;
}

void ExecutorContext::record_error(std::error_code error, std::string message)
{
    if (error_) {
        return;
    }
    error_ = error;
    error_message_ = std::move(message);
}

bool ExecutorContext::failed() const noexcept
{
    return static_cast<bool>(error_);
}

std::error_code ExecutorContext::error() const noexcept
{
    return error_;
}

const std::string& ExecutorContext::error_message() const noexcept
{
    return error_message_;
}

}  // namespace rynamo::executor
