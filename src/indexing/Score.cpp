#include "indexing/Score.hpp"
#include <cmath>
#include <stdexcept>

namespace indexing {

using boost::multiprecision::cpp_int;

static cpp_int pow10(uint32_t n) {
    return boost::multiprecision::pow(cpp_int(10), n);
}

Score::Score(cpp_int unscaled, uint32_t scale)
    : m_unscaled(std::move(unscaled)), m_scale(scale) {
    canonicalize();
}

void Score::canonicalize() {
    if (m_unscaled == 0) {
        m_scale = 0;
        return;
    }
    while (m_scale > 0 && m_unscaled % 10 == 0) {
        m_unscaled /= 10;
        --m_scale;
    }
}

Score Score::from_double(double v) {
    if (!std::isfinite(v)) {
        throw std::domain_error("score is not a finite number");
    }
    if (v == 0.0) return Score();

    // v = mant * 2^exp with mant an integer of at most 53 bits
    int exp = 0;
    double frac = std::frexp(v, &exp);
    int64_t mant = (int64_t)std::ldexp(frac, 53);
    exp -= 53;

    cpp_int unscaled(mant);
    if (exp >= 0) {
        unscaled <<= exp;
        return Score(std::move(unscaled), 0);
    }

    // m / 2^k == m * 5^k / 10^k
    const uint32_t k = (uint32_t)(-exp);
    unscaled *= boost::multiprecision::pow(cpp_int(5), k);
    return Score(std::move(unscaled), k);
}

int Score::compare(const Score& other) const {
    if (m_scale == other.m_scale) return m_unscaled.compare(other.m_unscaled);

    if (m_scale < other.m_scale) {
        const cpp_int lhs = m_unscaled * pow10(other.m_scale - m_scale);
        return lhs.compare(other.m_unscaled);
    }
    const cpp_int rhs = other.m_unscaled * pow10(m_scale - other.m_scale);
    return m_unscaled.compare(rhs);
}

std::string Score::to_string() const {
    const bool neg = m_unscaled < 0;
    std::string digits = (neg ? cpp_int(-m_unscaled) : m_unscaled).str();

    if (m_scale > 0) {
        if (digits.size() <= m_scale) {
            digits.insert(0, m_scale - digits.size() + 1, '0');
        }
        digits.insert(digits.size() - m_scale, 1, '.');
    }
    return neg ? "-" + digits : digits;
}

}
