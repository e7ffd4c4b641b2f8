#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace textutil {

// Fixed set of ASCII bytes stripped from tokens. Built once, never mutated.
class PunctuationSet {
public:
    // throws std::invalid_argument on a non-ASCII byte
    explicit PunctuationSet(const std::string& chars);

    // the 32 ASCII punctuation symbols: !"#$%&'()*+,-./:;<=>?@[\]^_`{|}~
    static const PunctuationSet& ascii_default();

    bool contains(unsigned char c) const { return c < m_bits.size() && m_bits[c]; }

    // members in ascending byte order
    std::string chars() const;

private:
    std::array<bool, 128> m_bits{};
};

using TermCounts = std::unordered_map<std::string, uint64_t>;

// Unicode lowercase, then drop every byte found in punct.
// Invalid UTF-8 in token is replaced first.
std::string normalize_term(const std::string& token, const PunctuationSet& punct);

// split on Unicode White_Space, normalize each token, count occurrences.
// all-punctuation tokens become "" and are counted like any other term.
TermCounts count_terms(const std::string& text, const PunctuationSet& punct);

// replace invalid UTF-8 sequences with U+FFFD
std::string decode_utf8_lossy(const std::string& bytes);

}
