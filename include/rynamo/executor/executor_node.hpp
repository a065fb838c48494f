#pragma once

#include "rynamo/common/attribute_value.hpp"
#include "rynamo/storage/key_value.hpp"

#include <memory>

namespace rynamo::executor {

class ExecutorContext;

// A row flowing through the pipeline. Pointers refer into the item store and
// stay valid while the read view that produced them is held.
struct ItemRow final {
    const storage::KeyValue* partition = nullptr;
    const storage::SortKey* sort = nullptr;
    const Item* item = nullptr;
};

class ExecutorNode;
using ExecutorNodePtr = std::unique_ptr<ExecutorNode>;

class ExecutorNode {
public:
    virtual ~ExecutorNode() = default;

    ExecutorNode(const ExecutorNode&) = delete;
    ExecutorNode& operator=(const ExecutorNode&) = delete;
    ExecutorNode(ExecutorNode&&) = default;
    ExecutorNode& operator=(ExecutorNode&&) = default;

    virtual void open(ExecutorContext& context) = 0;
    virtual bool next(ExecutorContext& context, ItemRow& row) = 0;
    virtual void close(ExecutorContext& context) = 0;

protected:
    ExecutorNode() = default;
};

}  // namespace rynamo::executor
