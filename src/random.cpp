#include "rollexpr/random.hpp"
#include <stdexcept>
#include <string>

namespace rollexpr {

std::int64_t ScriptedSource::uniform(std::int64_t lo, std::int64_t hi) {
    if (next_ >= draws_.size()) {
        throw std::out_of_range("Scripted draws exhausted after " + std::to_string(draws_.size()) + " draws");
    }
    std::int64_t v = draws_[next_];
    if (v < lo || v > hi) {
        throw std::out_of_range("Scripted draw " + std::to_string(v) + " outside [" + std::to_string(lo) + ", " +
                                std::to_string(hi) + "]");
    }
    ++next_;
    return v;
}

} // namespace rollexpr
