#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace rynamo::expression {

class AstArena {
public:
    AstArena() = default;
    AstArena(const AstArena&) = delete;
    AstArena& operator=(const AstArena&) = delete;
    AstArena(AstArena&&) noexcept = default;
    AstArena& operator=(AstArena&&) noexcept = default;
    ~AstArena() noexcept;

    template <typename T, typename... Args>
    T& make(Args&&... args)
    {
        void* storage = allocate(sizeof(T), alignof(T));
        auto* object = std::construct_at(static_cast<T*>(storage), std::forward<Args>(args)...);
        register_destructor(object);
        return *object;
    }

    void reset() noexcept;

private:
    struct Chunk final {
        std::unique_ptr<std::byte[]> data{};
        std::size_t capacity = 0U;
        std::size_t used = 0U;
    };

    struct Destructor final {
        void (*destroy)(void*) noexcept = nullptr;
        void* pointer = nullptr;
    };

    static constexpr std::size_t kDefaultChunkSize = 4096U;

    static std::size_t align_up(std::size_t value, std::size_t alignment) noexcept;
    void* allocate(std::size_t size, std::size_t alignment);
    void add_chunk(std::size_t minimum_capacity);

    template <typename T>
    void register_destructor(T* pointer)
    {
        Destructor entry{};
        entry.pointer = pointer;
        entry.destroy = [](void* storage) noexcept {
            std::destroy_at(static_cast<T*>(storage));
        };
        destructors_.push_back(entry);
    }

    std::vector<Chunk> chunks_{};
    std::vector<Destructor> destructors_{};
};

enum class NodeKind : std::uint8_t {
    PathExpression = 0,
    ValueReference,
    SizeFunction,
    IfNotExistsFunction,
    ListAppendFunction,
    ArithmeticExpression,
    ComparisonCondition,
    BetweenCondition,
    FunctionCondition,
    AndCondition,
    SetAction,
    RemoveAction,
    AddAction,
    DeleteAction,
    UpdateExpression
};

enum class ComparisonOperator : std::uint8_t {
    Equal = 0,
    NotEqual,
    Less,
    LessOrEqual,
    Greater,
    GreaterOrEqual
};

enum class ArithmeticOperator : std::uint8_t {
    Add = 0,
    Subtract
};

enum class ConditionFunction : std::uint8_t {
    AttributeExists = 0,
    AttributeNotExists,
    AttributeType,
    BeginsWith,
    Contains
};

// One step of a document path. Name segments hold either a literal attribute
// name or a #placeholder that is resolved against the request bindings.
struct PathSegment final {
    enum class Kind : std::uint8_t {
        Name = 0,
        Index
    };

    Kind kind = Kind::Name;
    std::string name{};
    std::size_t index = 0U;

    [[nodiscard]] bool is_placeholder() const noexcept
    {
        return kind == Kind::Name && !name.empty() && name.front() == '#';
    }
};

struct Node {
    explicit Node(NodeKind kind) noexcept : kind(kind) {}
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;
    Node(Node&&) = delete;
    Node& operator=(Node&&) = delete;
    virtual ~Node() = default;

    NodeKind kind;
};

struct PathExpression;
struct ValueReference;
struct SizeFunction;
struct IfNotExistsFunction;
struct ListAppendFunction;
struct ArithmeticExpression;
struct ComparisonCondition;
struct BetweenCondition;
struct FunctionCondition;
struct AndCondition;

class OperandVisitor {
public:
    virtual ~OperandVisitor() = default;
    virtual void visit(const PathExpression& operand) = 0;
    virtual void visit(const ValueReference& operand) = 0;
    virtual void visit(const SizeFunction& operand) = 0;
    virtual void visit(const IfNotExistsFunction& operand) = 0;
    virtual void visit(const ListAppendFunction& operand) = 0;
    virtual void visit(const ArithmeticExpression& operand) = 0;
};

class ConditionVisitor {
public:
    virtual ~ConditionVisitor() = default;
    virtual void visit(const ComparisonCondition& condition) = 0;
    virtual void visit(const BetweenCondition& condition) = 0;
    virtual void visit(const FunctionCondition& condition) = 0;
    virtual void visit(const AndCondition& condition) = 0;
};

struct Operand : Node {
    explicit Operand(NodeKind kind) noexcept : Node(kind) {}
    ~Operand() override = default;

    void accept(OperandVisitor& visitor) const;
};

struct PathExpression final : Operand {
    PathExpression() noexcept : Operand(NodeKind::PathExpression) {}

    std::vector<PathSegment> segments{};
};

struct ValueReference final : Operand {
    ValueReference() noexcept : Operand(NodeKind::ValueReference) {}

    std::string placeholder{};
};

struct SizeFunction final : Operand {
    SizeFunction() noexcept : Operand(NodeKind::SizeFunction) {}

    Operand* argument = nullptr;
};

struct IfNotExistsFunction final : Operand {
    IfNotExistsFunction() noexcept : Operand(NodeKind::IfNotExistsFunction) {}

    PathExpression* path = nullptr;
    Operand* fallback = nullptr;
};

struct ListAppendFunction final : Operand {
    ListAppendFunction() noexcept : Operand(NodeKind::ListAppendFunction) {}

    Operand* left = nullptr;
    Operand* right = nullptr;
};

struct ArithmeticExpression final : Operand {
    ArithmeticExpression() noexcept : Operand(NodeKind::ArithmeticExpression) {}

    ArithmeticOperator op = ArithmeticOperator::Add;
    Operand* left = nullptr;
    Operand* right = nullptr;
};

struct Condition : Node {
    explicit Condition(NodeKind kind) noexcept : Node(kind) {}
    ~Condition() override = default;

    void accept(ConditionVisitor& visitor) const;
};

struct ComparisonCondition final : Condition {
    ComparisonCondition() noexcept : Condition(NodeKind::ComparisonCondition) {}

    Operand* left = nullptr;
    ComparisonOperator op = ComparisonOperator::Equal;
    Operand* right = nullptr;
};

struct BetweenCondition final : Condition {
    BetweenCondition() noexcept : Condition(NodeKind::BetweenCondition) {}

    Operand* value = nullptr;
    Operand* lower = nullptr;
    Operand* upper = nullptr;
};

struct FunctionCondition final : Condition {
    FunctionCondition() noexcept : Condition(NodeKind::FunctionCondition) {}

    ConditionFunction function = ConditionFunction::AttributeExists;
    std::vector<Operand*> arguments{};
};

struct AndCondition final : Condition {
    AndCondition() noexcept : Condition(NodeKind::AndCondition) {}

    Condition* left = nullptr;
    Condition* right = nullptr;
};

struct UpdateAction : Node {
    explicit UpdateAction(NodeKind kind) noexcept : Node(kind) {}
    ~UpdateAction() override = default;

    PathExpression* path = nullptr;
};

struct SetAction final : UpdateAction {
    SetAction() noexcept : UpdateAction(NodeKind::SetAction) {}

    Operand* value = nullptr;
};

struct RemoveAction final : UpdateAction {
    RemoveAction() noexcept : UpdateAction(NodeKind::RemoveAction) {}
};

struct AddAction final : UpdateAction {
    AddAction() noexcept : UpdateAction(NodeKind::AddAction) {}

    ValueReference* value = nullptr;
};

struct DeleteAction final : UpdateAction {
    DeleteAction() noexcept : UpdateAction(NodeKind::DeleteAction) {}

    ValueReference* value = nullptr;
};

struct UpdateExpression final : Node {
    UpdateExpression() noexcept : Node(NodeKind::UpdateExpression) {}

    std::vector<SetAction*> set_actions{};
    std::vector<RemoveAction*> remove_actions{};
    std::vector<AddAction*> add_actions{};
    std::vector<DeleteAction*> delete_actions{};
};

struct PlaceholderUsage final {
    std::set<std::string> names{};
    std::set<std::string> values{};
};

const char* comparator_symbol(ComparisonOperator op) noexcept;
const char* function_name(ConditionFunction function) noexcept;

std::string describe(const PathExpression& path);
std::string describe(const Operand& operand);
std::string describe(const Condition& condition);
std::string describe(const UpdateExpression& update);

void collect_placeholders(const Operand& operand, PlaceholderUsage& usage);
void collect_placeholders(const Condition& condition, PlaceholderUsage& usage);
void collect_placeholders(const UpdateExpression& update, PlaceholderUsage& usage);

}  // namespace rynamo::expression

namespace rynamo::expression {

inline AstArena::~AstArena() noexcept
{
    reset();
}

inline std::size_t AstArena::align_up(std::size_t value, std::size_t alignment) noexcept
{
    const auto mask = alignment - 1U;
    return (value + mask) & ~mask;
}

inline void AstArena::reset() noexcept
{
    for (auto it = destructors_.rbegin(); it != destructors_.rend(); ++it) {
        if (it->destroy && it->pointer) {
            it->destroy(it->pointer);
        }
    }
    destructors_.clear();
    for (auto& chunk : chunks_) {
        chunk.used = 0U;
    }
}

inline void* AstArena::allocate(std::size_t size, std::size_t alignment)
{
    if (alignment == 0U) {
        alignment = alignof(std::max_align_t);
    }

    const auto adjusted_size = align_up(size, alignment);

    while (chunks_.empty() || align_up(chunks_.back().used, alignment) + adjusted_size > chunks_.back().capacity) {
        add_chunk(std::max(kDefaultChunkSize, adjusted_size));
    }

    auto& chunk = chunks_.back();
    const auto offset = align_up(chunk.used, alignment);
    chunk.used = offset + adjusted_size;
    return chunk.data.get() + offset;
}

inline void AstArena::add_chunk(std::size_t minimum_capacity)
{
    Chunk chunk{};
    chunk.capacity = align_up(minimum_capacity, alignof(std::max_align_t));
    chunk.data = std::unique_ptr<std::byte[]>(new std::byte[chunk.capacity]);
    chunk.used = 0U;
    chunks_.push_back(std::move(chunk));
}

inline void Operand::accept(OperandVisitor& visitor) const
{
    switch (kind) {
    case NodeKind::PathExpression:
        visitor.visit(static_cast<const PathExpression&>(*this));
        break;
    case NodeKind::ValueReference:
        visitor.visit(static_cast<const ValueReference&>(*this));
        break;
    case NodeKind::SizeFunction:
        visitor.visit(static_cast<const SizeFunction&>(*this));
        break;
    case NodeKind::IfNotExistsFunction:
        visitor.visit(static_cast<const IfNotExistsFunction&>(*this));
        break;
    case NodeKind::ListAppendFunction:
        visitor.visit(static_cast<const ListAppendFunction&>(*this));
        break;
    case NodeKind::ArithmeticExpression:
        visitor.visit(static_cast<const ArithmeticExpression&>(*this));
        break;
    default:
        break;
    }
}

inline void Condition::accept(ConditionVisitor& visitor) const
{
    switch (kind) {
    case NodeKind::ComparisonCondition:
        visitor.visit(static_cast<const ComparisonCondition&>(*this));
        break;
    case NodeKind::BetweenCondition:
        visitor.visit(static_cast<const BetweenCondition&>(*this));
        break;
    case NodeKind::FunctionCondition:
        visitor.visit(static_cast<const FunctionCondition&>(*this));
        break;
    case NodeKind::AndCondition:
        visitor.visit(static_cast<const AndCondition&>(*this));
        break;
    default:
        break;
    }
}

}  // namespace rynamo::expression
