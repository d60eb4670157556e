#include "rollexpr/parser.hpp"
#include "rollexpr/dice.hpp"
#include "rollexpr/errors.hpp"
#include "rollexpr/lexer.hpp"
#include "rollexpr/registry.hpp"

#include <string>
#include <utility>

namespace rollexpr {

namespace {

// Precedence climbing. Every recursive descent goes through expression(),
// which is where nesting depth is counted.
class Parser {
public:
    Parser(const std::vector<Token>& toks, const Budget& budget, int pool_threshold)
        : toks_(toks), budget_(budget), pool_threshold_(pool_threshold) {}

    NodePtr parse_all() {
        if (cur().kind == TokKind::End) throw SyntaxError(cur().pos, "expression", "end of input");
        NodePtr root = expression(0);
        if (cur().kind != TokKind::End) throw SyntaxError(cur().pos, "operator or end of input", describe(cur()));
        return root;
    }

private:
    struct DepthGuard {
        DepthGuard(Parser& p, std::size_t pos) : p_(p) {
            if (++p_.depth_ > p_.budget_.max_ast_depth) throw DepthExceededError(p_.budget_.max_ast_depth, pos);
        }
        ~DepthGuard() { --p_.depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

        Parser& p_;
    };

    const Token& cur() const { return toks_[i_]; }

    const Token& advance() {
        const Token& t = toks_[i_];
        if (t.kind != TokKind::End) ++i_;
        return t;
    }

    void expect(TokKind k) {
        if (cur().kind != k) throw SyntaxError(cur().pos, kind_name(k), describe(cur()));
        advance();
    }

    // Every node passes through here: enforces height and node-count limits.
    NodePtr admit(NodePtr n) {
        if (n->height > budget_.max_ast_depth) throw DepthExceededError(budget_.max_ast_depth, n->pos);
        if (++nodes_ > budget_.max_expansion_count) {
            throw BudgetExceededError("max_expansion_count", budget_.max_expansion_count, nodes_);
        }
        return n;
    }

    NodePtr expression(int min_prec) {
        DepthGuard guard(*this, cur().pos);

        NodePtr lhs;
        if (const UnaryOpInfo* u = unary_operator(cur().kind)) {
            // 'not' sits below comparisons; arithmetic prefixes are allowed anywhere (2 ** -1)
            if (u->op == UnOp::Not && min_prec > prec::Not) {
                throw SyntaxError(cur().pos, "operand", describe(cur()));
            }
            std::size_t pos = advance().pos;
            NodePtr operand = expression(u->precedence);
            lhs = admit(make_unary(u->op, std::move(operand), pos));
        } else {
            lhs = primary();
        }

        while (const BinaryOpInfo* b = binary_operator(cur().kind)) {
            if (b->precedence < min_prec) break;
            std::size_t pos = advance().pos;
            int next_min = b->right_assoc ? b->precedence : b->precedence + 1;
            NodePtr rhs = expression(next_min);
            lhs = admit(make_binary(b->op, std::move(lhs), std::move(rhs), pos));
        }
        return lhs;
    }

    NodePtr primary() {
        const Token& t = cur();
        switch (t.kind) {
            case TokKind::Number:
                advance();
                return admit(make_number(t.number, t.pos));

            case TokKind::Dice: {
                DiceRoll d = recognize_dice(t, budget_, pool_threshold_);
                advance();
                return admit(make_dice(std::move(d), t.pos));
            }

            case TokKind::LParen: {
                advance();
                NodePtr inner = expression(0);
                expect(TokKind::RParen);
                return inner;
            }

            case TokKind::Ident:
                return identifier();

            default:
                throw SyntaxError(t.pos, "operand", describe(t));
        }
    }

    NodePtr identifier() {
        const Token& name = advance();

        if (cur().kind != TokKind::LParen) {
            if (const ConstantInfo* c = find_constant(name.text)) return admit(make_number(c->value, name.pos));
            throw UnknownFunctionError(name.text, name.pos);
        }

        // resolve before looking at the arguments
        const FunctionInfo* fn = find_function(name.text);
        if (!fn) throw UnknownFunctionError(name.text, name.pos);
        advance(); // '('

        std::vector<NodePtr> args;
        if (cur().kind != TokKind::RParen) {
            for (;;) {
                args.push_back(expression(0));
                if (cur().kind == TokKind::Comma) {
                    advance();
                    continue;
                }
                if (cur().kind == TokKind::RParen) break;
                throw SyntaxError(cur().pos, "',' or ')'", describe(cur()));
            }
        }
        advance(); // ')'

        const int argc = static_cast<int>(args.size());
        if (!fn->accepts(argc)) throw ArityError(name.text, fn->min_args, fn->max_args, argc);
        return admit(make_call(name.text, std::move(args), name.pos));
    }

    const std::vector<Token>& toks_;
    const Budget& budget_;
    int pool_threshold_;
    std::size_t i_{0};
    int depth_{0};
    int nodes_{0};
};

} // namespace

NodePtr parse(const std::vector<Token>& tokens, const Budget& budget, int default_pool_threshold) {
    if (tokens.empty() || tokens.back().kind != TokKind::End) {
        throw SyntaxError(0, "token stream terminated by end of input", "unterminated stream");
    }
    Parser p(tokens, budget, default_pool_threshold);
    return p.parse_all();
}

NodePtr parse(std::string_view input, const Budget& budget, int default_pool_threshold) {
    return parse(tokenize(input), budget, default_pool_threshold);
}

} // namespace rollexpr
