#include "rollexpr/dice.hpp"
#include "rollexpr/errors.hpp"

#include <algorithm>
#include <limits>

namespace rollexpr {

// Digit strings saturate instead of overflowing; the budget check rejects them.
static std::int64_t to_int(const std::string& s) {
    constexpr std::int64_t max = std::numeric_limits<std::int64_t>::max();
    std::size_t i = 0;
    bool neg = false;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
        neg = s[i] == '-';
        ++i;
    }
    std::int64_t v = 0;
    for (; i < s.size(); ++i) {
        int digit = s[i] - '0';
        if (v > (max - digit) / 10) {
            v = max;
            break;
        }
        v = v * 10 + digit;
    }
    return neg ? -v : v;
}

static std::int64_t magnitude(std::int64_t v) { return v < 0 ? -v : v; }

static std::int64_t dice_count(const Token& t, const Budget& budget) {
    std::int64_t count = t.dice.count.empty() ? 1 : to_int(t.dice.count);
    if (count <= 0) throw DiceTermError("dice count must be positive in '" + t.text + "'", t.pos);
    if (count > budget.max_total_dice) throw BudgetExceededError("max_total_dice", budget.max_total_dice, count);
    return count;
}

DiceRoll recognize_dice(const Token& t, const Budget& budget, int default_pool_threshold) {
    DiceRoll d;
    d.kind = t.dice.kind;
    d.label = t.text;
    d.count = dice_count(t, budget);

    switch (t.dice.kind) {
        case DiceKind::Standard: {
            if (t.dice.sides.empty()) throw DiceTermError("missing number of sides in '" + t.text + "'", t.pos);
            std::int64_t sides = to_int(t.dice.sides);
            if (sides <= 0) throw DiceTermError("dice need at least one side in '" + t.text + "'", t.pos);
            if (sides > budget.max_sides) throw BudgetExceededError("max_sides", budget.max_sides, sides);
            d.low = 1;
            d.high = sides;
        } break;

        case DiceKind::Ranged: {
            // an explicit sides count next to a range is only part of the label
            std::int64_t lo = to_int(t.dice.lo);
            std::int64_t hi = to_int(t.dice.hi);
            if (lo > hi) throw DiceTermError("range lower bound exceeds upper bound in '" + t.text + "'", t.pos);
            std::int64_t widest = std::max(magnitude(lo), magnitude(hi));
            if (widest > budget.max_sides) throw BudgetExceededError("max_sides", budget.max_sides, widest);
            d.low = lo;
            d.high = hi;
        } break;

        case DiceKind::Pool: {
            std::int64_t threshold = t.dice.sides.empty() ? default_pool_threshold : to_int(t.dice.sides);
            if (threshold < 2 || threshold > kPoolSides) {
                throw DiceTermError("pool threshold must be between 2 and 10 in '" + t.text + "'", t.pos);
            }
            d.low = 1;
            d.high = kPoolSides;
            d.threshold = static_cast<int>(threshold);
        } break;
    }
    return d;
}

RollEvent roll_dice(const DiceRoll& d, RandomSource& src) {
    RollEvent ev;
    ev.label = d.label;
    ev.kind = d.kind;
    ev.low = d.low;
    ev.high = d.high;
    ev.threshold = d.threshold;
    ev.raw.reserve(static_cast<std::size_t>(d.count));

    for (std::int64_t i = 0; i < d.count; ++i) {
        std::int64_t v = src.uniform(d.low, d.high);
        ev.raw.push_back(v);

        if (d.kind != DiceKind::Pool) {
            ev.kept.push_back(v);
            ev.subtotal += v;
        } else if (v == 1) {
            ev.penalties.push_back(v);
            ev.subtotal -= 1;
        } else if (v >= d.threshold) {
            ev.kept.push_back(v);
            ev.subtotal += 1;
        } else {
            ev.dropped.push_back(v);
        }
    }
    return ev;
}

} // namespace rollexpr
