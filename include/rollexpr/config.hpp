#pragma once
#include <cstdint>

namespace rollexpr {

/// Request-scoped limits bounding the work one expression may cause.
struct Budget {
    std::int64_t max_total_dice{1000};    // dice drawn over the whole expression
    std::int64_t max_sides{100000};       // faces of one die, or |bound| of a range
    int max_ast_depth{64};                // nesting depth of the tree (and of the parser)
    int max_expansion_count{512};         // AST nodes one expression may expand to
};

inline constexpr int kDefaultPoolThreshold = 8;
inline constexpr int kDefaultPrecision = 2;

/// Host-facing knobs: limits plus the defaults the surface syntax leaves open.
struct Config {
    Budget budget{};
    int default_pool_threshold{kDefaultPoolThreshold}; // for "Xwod" with no threshold
    int precision{kDefaultPrecision};                  // decimals shown by format()
};

} // namespace rollexpr
