#include "rollexpr/ast.hpp"
#include <algorithm>
#include <utility>

namespace rollexpr {

NodePtr make_number(double value, std::size_t pos) {
    auto n = std::make_unique<Node>();
    n->expr = NumberLiteral{value};
    n->pos = pos;
    return n;
}

NodePtr make_dice(DiceRoll roll, std::size_t pos) {
    auto n = std::make_unique<Node>();
    n->expr = std::move(roll);
    n->pos = pos;
    return n;
}

NodePtr make_call(std::string name, std::vector<NodePtr> args, std::size_t pos) {
    int h = 0;
    for (const auto& a : args) h = std::max(h, a->height);

    auto n = std::make_unique<Node>();
    n->expr = FunctionCall{std::move(name), std::move(args)};
    n->pos = pos;
    n->height = h + 1;
    return n;
}

NodePtr make_binary(BinOp op, NodePtr lhs, NodePtr rhs, std::size_t pos) {
    int h = std::max(lhs->height, rhs->height) + 1;

    auto n = std::make_unique<Node>();
    n->expr = BinaryOp{op, std::move(lhs), std::move(rhs)};
    n->pos = pos;
    n->height = h;
    return n;
}

NodePtr make_unary(UnOp op, NodePtr operand, std::size_t pos) {
    int h = operand->height + 1;

    auto n = std::make_unique<Node>();
    n->expr = UnaryOp{op, std::move(operand)};
    n->pos = pos;
    n->height = h;
    return n;
}

std::size_t node_count(const Node& n) {
    struct Counter {
        std::size_t operator()(const NumberLiteral&) const { return 1; }
        std::size_t operator()(const DiceRoll&) const { return 1; }
        std::size_t operator()(const FunctionCall& c) const {
            std::size_t k = 1;
            for (const auto& a : c.args) k += node_count(*a);
            return k;
        }
        std::size_t operator()(const BinaryOp& b) const { return 1 + node_count(*b.lhs) + node_count(*b.rhs); }
        std::size_t operator()(const UnaryOp& u) const { return 1 + node_count(*u.operand); }
    };
    return std::visit(Counter{}, n.expr);
}

} // namespace rollexpr
