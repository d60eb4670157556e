#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace rollexpr {

/// Source of uniformly distributed integers, injected into every evaluation.
/// One instance must not be shared by concurrent evaluations.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Uniform integer in [lo, hi]; callers guarantee lo <= hi.
    virtual std::int64_t uniform(std::int64_t lo, std::int64_t hi) = 0;
};

/// Adapts any standard random engine.
template <class Engine = std::mt19937_64>
class EngineSource : public RandomSource {
public:
    EngineSource() : engine_(std::random_device{}()) {}
    explicit EngineSource(typename Engine::result_type seed) : engine_(seed) {}

    std::int64_t uniform(std::int64_t lo, std::int64_t hi) override {
        std::uniform_int_distribution<std::int64_t> dist(lo, hi);
        return dist(engine_);
    }

private:
    Engine engine_;
};

/// Replays a fixed list of draws, in order. Throws std::out_of_range when the
/// list runs out or a draw lies outside the requested range.
class ScriptedSource : public RandomSource {
public:
    explicit ScriptedSource(std::vector<std::int64_t> draws) : draws_(std::move(draws)) {}

    std::int64_t uniform(std::int64_t lo, std::int64_t hi) override;

    std::size_t consumed() const { return next_; }
    std::size_t remaining() const { return draws_.size() - next_; }

private:
    std::vector<std::int64_t> draws_;
    std::size_t next_{0};
};

} // namespace rollexpr
