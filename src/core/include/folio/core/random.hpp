#pragma once

#include "types.hpp"
#include <random>
#include <vector>

namespace folio {

// ============================================================================
// Random - explicit, seedable random source
// ============================================================================

/// Owned by the caller and threaded through every stage that draws.
/// Two instances built from the same seed produce the same sequence.
class Random {
public:
    explicit Random(u32 seed);

    /// Seeded from std::random_device, for renders that need no replay
    [[nodiscard]] static Random from_entropy();

    [[nodiscard]] u32 seed() const noexcept { return m_seed; }

    /// Uniform integer in [lo, hi]; returns lo when hi < lo
    [[nodiscard]] i32 uniform_int(i32 lo, i32 hi);

    /// Uniform real in [lo, hi)
    [[nodiscard]] f64 uniform_real(f64 lo, f64 hi);

    [[nodiscard]] bool coin();

    /// Uniform index in [0, count); count must be non-zero
    [[nodiscard]] usize index(usize count);

    template<typename T>
    [[nodiscard]] const T& pick(const std::vector<T>& items) {
        return items[index(items.size())];
    }

private:
    u32 m_seed;
    std::mt19937 m_engine;
};

} // namespace folio
