#include "folio/core/random.hpp"

namespace folio {

Random::Random(u32 seed)
    : m_seed(seed)
    , m_engine(seed)
{
}

Random Random::from_entropy() {
    std::random_device device;
    return Random(static_cast<u32>(device()));
}

i32 Random::uniform_int(i32 lo, i32 hi) {
    if (hi <= lo) {
        return lo;
    }
    std::uniform_int_distribution<i32> dist(lo, hi);
    return dist(m_engine);
}

f64 Random::uniform_real(f64 lo, f64 hi) {
    if (hi <= lo) {
        return lo;
    }
    std::uniform_real_distribution<f64> dist(lo, hi);
    return dist(m_engine);
}

bool Random::coin() {
    return uniform_int(0, 1) == 1;
}

usize Random::index(usize count) {
    if (count <= 1) {
        return 0;
    }
    std::uniform_int_distribution<usize> dist(0, count - 1);
    return dist(m_engine);
}

} // namespace folio
