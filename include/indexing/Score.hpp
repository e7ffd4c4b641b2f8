#pragma once
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <string>

namespace indexing {

// Exact decimal: value = unscaled / 10^scale.
// Kept canonical (no trailing fractional zeros), so equal values have equal
// representations and compare equal.
class Score {
public:
    Score() = default;

    // exact for every finite double; throws std::domain_error otherwise
    static Score from_double(double v);

    int compare(const Score& other) const;

    bool operator==(const Score& o) const { return compare(o) == 0; }
    bool operator!=(const Score& o) const { return compare(o) != 0; }
    bool operator<(const Score& o) const  { return compare(o) < 0; }
    bool operator>(const Score& o) const  { return compare(o) > 0; }
    bool operator<=(const Score& o) const { return compare(o) <= 0; }
    bool operator>=(const Score& o) const { return compare(o) >= 0; }

    // exact decimal expansion, e.g. 0.1 -> "0.1000000000000000055511151231257827021181583404541015625"
    std::string to_string() const;

private:
    Score(boost::multiprecision::cpp_int unscaled, uint32_t scale);
    void canonicalize();

    boost::multiprecision::cpp_int m_unscaled = 0;
    uint32_t m_scale = 0;
};

}
