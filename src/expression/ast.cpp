#include "rynamo/expression/ast.hpp"

#include <iterator>
#include <sstream>
#include <string_view>

namespace rynamo::expression {
namespace {

class OperandPrinter final : public OperandVisitor {
public:
    void visit(const PathExpression& operand) override
    {
        result_ = describe(operand);
    }

    void visit(const ValueReference& operand) override
    {
        result_ = operand.placeholder;
    }

    void visit(const SizeFunction& operand) override
    {
        result_ = "size(" + describe_child(operand.argument) + ")";
    }

    void visit(const IfNotExistsFunction& operand) override
    {
        std::ostringstream stream;
        stream << "if_not_exists(" << (operand.path ? describe(*operand.path) : "<null>") << ", "
               << describe_child(operand.fallback) << ')';
        result_ = stream.str();
    }

    void visit(const ListAppendFunction& operand) override
    {
        result_ = "list_append(" + describe_child(operand.left) + ", " + describe_child(operand.right) + ")";
    }

    void visit(const ArithmeticExpression& operand) override
    {
        result_ = describe_child(operand.left) + (operand.op == ArithmeticOperator::Add ? " + " : " - ")
                  + describe_child(operand.right);
    }

    [[nodiscard]] std::string take()
    {
        return std::move(result_);
    }

private:
    static std::string describe_child(const Operand* operand)
    {
        return operand ? describe(*operand) : std::string{"<null>"};
    }

    std::string result_{};
};

class ConditionPrinter final : public ConditionVisitor {
public:
    void visit(const ComparisonCondition& condition) override
    {
        std::ostringstream stream;
        stream << operand_text(condition.left) << ' ' << comparator_symbol(condition.op) << ' '
               << operand_text(condition.right);
        result_ = stream.str();
    }

    void visit(const BetweenCondition& condition) override
    {
        std::ostringstream stream;
        stream << operand_text(condition.value) << " BETWEEN " << operand_text(condition.lower) << " AND "
               << operand_text(condition.upper);
        result_ = stream.str();
    }

    void visit(const FunctionCondition& condition) override
    {
        std::ostringstream stream;
        stream << function_name(condition.function) << '(';
        for (std::size_t index = 0; index < condition.arguments.size(); ++index) {
            if (index > 0U) {
                stream << ", ";
            }
            stream << operand_text(condition.arguments[index]);
        }
        stream << ')';
        result_ = stream.str();
    }

    void visit(const AndCondition& condition) override
    {
        std::ostringstream stream;
        stream << '(' << condition_text(condition.left) << " AND " << condition_text(condition.right) << ')';
        result_ = stream.str();
    }

    [[nodiscard]] std::string take()
    {
        return std::move(result_);
    }

private:
    static std::string operand_text(const Operand* operand)
    {
        return operand ? describe(*operand) : std::string{"<null>"};
    }

    static std::string condition_text(const Condition* condition)
    {
        return condition ? describe(*condition) : std::string{"<null>"};
    }

    std::string result_{};
};

class PlaceholderCollector final : public OperandVisitor, public ConditionVisitor {
public:
    explicit PlaceholderCollector(PlaceholderUsage& usage) noexcept
        : usage_{usage}
    {
    }

    void visit(const PathExpression& operand) override
    {
        for (const auto& segment : operand.segments) {
            if (segment.is_placeholder()) {
                usage_.names.insert(segment.name);
            }
        }
    }

    void visit(const ValueReference& operand) override
    {
        usage_.values.insert(operand.placeholder);
    }

    void visit(const SizeFunction& operand) override
    {
        walk(operand.argument);
    }

    void visit(const IfNotExistsFunction& operand) override
    {
        walk(operand.path);
        walk(operand.fallback);
    }

    void visit(const ListAppendFunction& operand) override
    {
        walk(operand.left);
        walk(operand.right);
    }

    void visit(const ArithmeticExpression& operand) override
    {
        walk(operand.left);
        walk(operand.right);
    }

    void visit(const ComparisonCondition& condition) override
    {
        walk(condition.left);
        walk(condition.right);
    }

    void visit(const BetweenCondition& condition) override
    {
        walk(condition.value);
        walk(condition.lower);
        walk(condition.upper);
    }

    void visit(const FunctionCondition& condition) override
    {
        for (const auto* argument : condition.arguments) {
            walk(argument);
        }
    }

    void visit(const AndCondition& condition) override
    {
        if (condition.left) {
            condition.left->accept(*this);
        }
        if (condition.right) {
            condition.right->accept(*this);
        }
    }

    void walk(const Operand* operand)
    {
        if (operand) {
            operand->accept(*this);
        }
    }

private:
    PlaceholderUsage& usage_;
};

}  // namespace

const char* comparator_symbol(ComparisonOperator op) noexcept
{
    static constexpr std::string_view symbols[] = {"=", "<>", "<", "<=", ">", ">="};
    const auto index = static_cast<std::size_t>(op);
    return index < std::size(symbols) ? symbols[index].data() : "?";
}

const char* function_name(ConditionFunction function) noexcept
{
    static constexpr std::string_view names[] = {
        "attribute_exists",
        "attribute_not_exists",
        "attribute_type",
        "begins_with",
        "contains"
    };
    const auto index = static_cast<std::size_t>(function);
    return index < std::size(names) ? names[index].data() : "?";
}

std::string describe(const PathExpression& path)
{
    std::string text;
    for (const auto& segment : path.segments) {
        if (segment.kind == PathSegment::Kind::Index) {
            text += '[' + std::to_string(segment.index) + ']';
            continue;
        }
        if (!text.empty()) {
            text.push_back('.');
        }
        text += segment.name;
    }
    return text;
}

std::string describe(const Operand& operand)
{
    OperandPrinter printer;
    operand.accept(printer);
    return printer.take();
}

std::string describe(const Condition& condition)
{
    ConditionPrinter printer;
    condition.accept(printer);
    return printer.take();
}

std::string describe(const UpdateExpression& update)
{
    std::ostringstream stream;
    const auto section = [&stream](std::string_view keyword, const auto& actions, const auto& render) {
        if (actions.empty()) {
            return;
        }
        if (stream.tellp() > 0) {
            stream << ' ';
        }
        stream << keyword << ' ';
        for (std::size_t index = 0; index < actions.size(); ++index) {
            if (index > 0U) {
                stream << ", ";
            }
            stream << describe(*actions[index]->path) << render(*actions[index]);
        }
    };

    section("SET", update.set_actions, [](const SetAction& action) { return " = " + describe(*action.value); });
    section("REMOVE", update.remove_actions, [](const RemoveAction&) { return std::string{}; });
    section("ADD", update.add_actions, [](const AddAction& action) { return ' ' + action.value->placeholder; });
    section("DELETE", update.delete_actions, [](const DeleteAction& action) { return ' ' + action.value->placeholder; });
    return stream.str();
}

void collect_placeholders(const Operand& operand, PlaceholderUsage& usage)
{
    PlaceholderCollector collector{usage};
    operand.accept(collector);
}

void collect_placeholders(const Condition& condition, PlaceholderUsage& usage)
{
    PlaceholderCollector collector{usage};
    condition.accept(collector);
}

void collect_placeholders(const UpdateExpression& update, PlaceholderUsage& usage)
{
    PlaceholderCollector collector{usage};
    for (const auto* action : update.set_actions) {
        collector.walk(action->path);
        collector.walk(action->value);
    }
    for (const auto* action : update.remove_actions) {
        collector.walk(action->path);
    }
    for (const auto* action : update.add_actions) {
        collector.walk(action->path);
        collector.walk(action->value);
    }
    for (const auto* action : update.delete_actions) {
        collector.walk(action->path);
        collector.walk(action->value);
    }
}

}  // namespace rynamo::expression
