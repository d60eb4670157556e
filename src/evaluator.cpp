#include "rollexpr/evaluator.hpp"
#include "rollexpr/errors.hpp"
#include "rollexpr/registry.hpp"

#include <cmath>
#include <utility>

namespace rollexpr {

namespace {

// Largest magnitude below which every integer is exactly representable.
constexpr double kExactIntegerLimit = 9007199254740992.0; // 2^53

class Evaluator {
public:
    Evaluator(RandomSource& src, const Budget& budget) : src_(src), budget_(budget) {}

    double eval(const Node& n) {
        pos_ = n.pos;
        return std::visit([this](const auto& e) { return (*this)(e); }, n.expr);
    }

    double operator()(const NumberLiteral& lit) {
        if (!std::isfinite(lit.value)) throw DomainError("number literal");
        return lit.value;
    }

    double operator()(const DiceRoll& d) {
        // checked before the first draw of the term
        if (d.count > budget_.max_total_dice - total_dice_) {
            throw BudgetExceededError("max_total_dice", budget_.max_total_dice, total_dice_ + d.count);
        }
        total_dice_ += d.count;

        RollEvent ev = roll_dice(d, src_);
        double v = static_cast<double>(ev.subtotal);
        result_.events.push_back(std::move(ev));
        return note(v);
    }

    double operator()(const FunctionCall& c) {
        const FunctionInfo* fn = find_function(c.name);
        if (!fn) throw UnknownFunctionError(c.name, pos_);

        std::vector<double> args;
        args.reserve(c.args.size());
        for (const auto& a : c.args) args.push_back(eval(*a));
        return note(call(*fn, args));
    }

    double operator()(const BinaryOp& b) {
        // both sides always run, so every dice term leaves its event
        double x = eval(*b.lhs);
        double y = eval(*b.rhs);
        return note(apply(b.op, x, y));
    }

    double operator()(const UnaryOp& u) {
        double x = eval(*u.operand);
        return note(apply(u.op, x));
    }

    EvalResult finish(double value) {
        result_.value = value;
        return std::move(result_);
    }

private:
    double note(double v) {
        if (!warned_precision_ && std::fabs(v) > kExactIntegerLimit) {
            result_.warnings.push_back("intermediate value exceeds 2^53; integer precision may be lost");
            warned_precision_ = true;
        }
        return v;
    }

    RandomSource& src_;
    const Budget& budget_;
    std::size_t pos_{0}; // node being visited
    std::int64_t total_dice_{0};
    bool warned_precision_{false};
    EvalResult result_{};
};

} // namespace

EvalResult evaluate(const Node& ast, RandomSource& src, const Budget& budget) {
    Evaluator ev(src, budget);
    double v = ev.eval(ast);
    return ev.finish(v);
}

} // namespace rollexpr
