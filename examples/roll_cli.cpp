// roll_cli: roll a dice expression from the command line.
// Usage examples:
//   ./rollexpr_cli 2d20 + 5
//   ./rollexpr_cli --seed 42 "4wod8 + 1d{-2,2}"
//   ./rollexpr_cli --max-dice 50 --threshold 7 "10wod"
//   ./rollexpr_cli                      (one six-sided die)

#include <rollexpr/roll.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

struct Options {
    rollexpr::Config config{};
    std::optional<std::uint64_t> seed{};
    bool verbose{false};
    std::string expression{};
};

void usage(std::ostream& os) {
    os << "Usage: rollexpr_cli [--seed N] [--max-dice N] [--max-sides N] [--max-depth N] [--max-nodes N]\n"
          "                    [--threshold N] [--precision N] [--verbose] [expression...]\n";
}

std::int64_t to_number(const std::string& flag, const std::string& s) {
    std::size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(s, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("bad value for " + flag + ": " + s);
    }
    if (used != s.size() || v < 0) throw std::invalid_argument("bad value for " + flag + ": " + s);
    return v;
}

Options parse_args(int argc, char** argv) {
    Options o;
    auto need = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw std::invalid_argument("missing value for " + flag);
        return argv[++i];
    };

    bool only_expression = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (only_expression || a.size() < 3 || a.compare(0, 2, "--") != 0) {
            if (a == "--") {
                only_expression = true;
                continue;
            }
            if (!o.expression.empty()) o.expression += ' ';
            o.expression += a;
            continue;
        }

        if (a == "--help") {
            usage(std::cout);
            std::exit(0);
        } else if (a == "--verbose") {
            o.verbose = true;
        } else if (a == "--seed") {
            o.seed = static_cast<std::uint64_t>(to_number(a, need(i, a)));
        } else if (a == "--max-dice") {
            o.config.budget.max_total_dice = to_number(a, need(i, a));
        } else if (a == "--max-sides") {
            o.config.budget.max_sides = to_number(a, need(i, a));
        } else if (a == "--max-depth") {
            o.config.budget.max_ast_depth = static_cast<int>(to_number(a, need(i, a)));
        } else if (a == "--max-nodes") {
            o.config.budget.max_expansion_count = static_cast<int>(to_number(a, need(i, a)));
        } else if (a == "--threshold") {
            o.config.default_pool_threshold = static_cast<int>(to_number(a, need(i, a)));
        } else if (a == "--precision") {
            o.config.precision = static_cast<int>(to_number(a, need(i, a)));
        } else {
            throw std::invalid_argument("unknown option " + a);
        }
    }
    return o;
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n";
        usage(std::cerr);
        return 2;
    }

    rollexpr::EngineSource<> rng = opts.seed ? rollexpr::EngineSource<>(*opts.seed) : rollexpr::EngineSource<>();

    if (opts.verbose) {
        std::cerr << "debug: handling `" << (opts.expression.empty() ? "(default roll)" : opts.expression) << "`\n";
    }

    try {
        rollexpr::EvalResult r = opts.expression.empty()
            ? rollexpr::roll_default(rng)
            : rollexpr::roll(opts.expression, opts.config, rng);

        if (opts.verbose) {
            std::cerr << "debug: " << r.events.size() << " dice term(s), " << r.warnings.size() << " warning(s)\n";
        }
        std::cout << rollexpr::format(r, opts.config.precision) << "\n";
    } catch (const rollexpr::Error& e) {
        std::cerr << "Bad pattern: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
