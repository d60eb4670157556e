#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "rollexpr/token.hpp"

namespace rollexpr {

enum class BinOp {
    Add, Sub, Mul, Div, FloorDiv, Mod, Pow,
    BitAnd, BitOr, BitXor, Shl, Shr,
    Lt, Le, Gt, Ge, Eq, Ne,
    And, Or,
};

enum class UnOp { Neg, Pos, Invert, Not };

struct Node;
using NodePtr = std::unique_ptr<Node>;

struct NumberLiteral {
    double value{0.0};
};

/// A validated dice term. Standard dice have low == 1, pool dice are 1..10.
struct DiceRoll {
    DiceKind kind{DiceKind::Standard};
    std::int64_t count{1};
    std::int64_t low{1};
    std::int64_t high{6};
    int threshold{0};    // Pool only
    std::string label{}; // source text, e.g. "3d6"
};

struct FunctionCall {
    std::string name;
    std::vector<NodePtr> args;
};

struct BinaryOp {
    BinOp op{BinOp::Add};
    NodePtr lhs;
    NodePtr rhs;
};

struct UnaryOp {
    UnOp op{UnOp::Neg};
    NodePtr operand;
};

struct Node {
    std::variant<NumberLiteral, DiceRoll, FunctionCall, BinaryOp, UnaryOp> expr;
    std::size_t pos{0}; // source offset of the node's first token
    int height{1};      // 1 for leaves
};

NodePtr make_number(double value, std::size_t pos);
NodePtr make_dice(DiceRoll roll, std::size_t pos);
NodePtr make_call(std::string name, std::vector<NodePtr> args, std::size_t pos);
NodePtr make_binary(BinOp op, NodePtr lhs, NodePtr rhs, std::size_t pos);
NodePtr make_unary(UnOp op, NodePtr operand, std::size_t pos);

/// Number of nodes in the tree rooted at n.
std::size_t node_count(const Node& n);

} // namespace rollexpr
