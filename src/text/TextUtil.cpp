#include "text/TextUtil.hpp"

#include <locale>
#include <stdexcept>

#include <boost/locale/conversion.hpp>
#include <boost/locale/generator.hpp>
#include <boost/locale/utf.hpp>

namespace textutil {

namespace utf = boost::locale::utf;

static const char* kReplacement = "\xEF\xBF\xBD";

// Unicode White_Space property
static bool is_white_space(utf::code_point c) {
    switch (c) {
        case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D: case 0x20:
        case 0x85: case 0xA0: case 0x1680:
        case 0x2000: case 0x2001: case 0x2002: case 0x2003: case 0x2004: case 0x2005:
        case 0x2006: case 0x2007: case 0x2008: case 0x2009: case 0x200A:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return false;
    }
}

static const std::locale& unicode_locale() {
    static const std::locale loc = [] {
        boost::locale::generator gen;
        return gen("en_US.UTF-8");
    }();
    return loc;
}

static bool is_ascii(const std::string& s) {
    for (unsigned char c : s) {
        if (c >= 0x80) return false;
    }
    return true;
}

static std::string to_lower(const std::string& token) {
    if (!is_ascii(token)) {
        return boost::locale::to_lower(decode_utf8_lossy(token), unicode_locale());
    }

    std::string out = token;
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

PunctuationSet::PunctuationSet(const std::string& chars) {
    for (unsigned char c : chars) {
        if (c >= m_bits.size()) throw std::invalid_argument("punctuation must be ASCII");
        m_bits[c] = true;
    }
}

const PunctuationSet& PunctuationSet::ascii_default() {
    static const PunctuationSet punct("!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~");
    return punct;
}

std::string PunctuationSet::chars() const {
    std::string out;
    for (size_t i = 0; i < m_bits.size(); ++i) {
        if (m_bits[i]) out.push_back(static_cast<char>(i));
    }
    return out;
}

std::string normalize_term(const std::string& token, const PunctuationSet& punct) {
    const std::string lowered = to_lower(token);

    std::string out;
    out.reserve(lowered.size());
    for (unsigned char c : lowered) {
        if (punct.contains(c)) continue;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

TermCounts count_terms(const std::string& text, const PunctuationSet& punct) {
    TermCounts counts;

    auto it = text.begin();
    const auto end = text.end();
    auto token_start = end;

    while (it != end) {
        const auto cp_start = it;
        utf::code_point cp = utf::utf_traits<char>::decode(it, end);
        if (cp == utf::illegal || cp == utf::incomplete) {
            // a bad byte is part of a token, never a delimiter
            it = cp_start + 1;
            cp = 0xFFFD;
        }

        if (is_white_space(cp)) {
            if (token_start != end) {
                counts[normalize_term(std::string(token_start, cp_start), punct)] += 1;
                token_start = end;
            }
        } else if (token_start == end) {
            token_start = cp_start;
        }
    }
    if (token_start != end) counts[normalize_term(std::string(token_start, end), punct)] += 1;

    return counts;
}

// Length of the valid UTF-8 sequence starting at s[i], or the length of the
// maximal invalid prefix (negated) when the sequence is malformed.
static int utf8_sequence(const std::string& s, size_t i) {
    const unsigned char c0 = static_cast<unsigned char>(s[i]);
    if (c0 < 0x80) return 1;

    int need = 0;
    unsigned char lo = 0x80, hi = 0xBF;

    if (c0 >= 0xC2 && c0 <= 0xDF) {
        need = 1;
    } else if (c0 == 0xE0) {
        need = 2; lo = 0xA0;
    } else if ((c0 >= 0xE1 && c0 <= 0xEC) || c0 == 0xEE || c0 == 0xEF) {
        need = 2;
    } else if (c0 == 0xED) {
        need = 2; hi = 0x9F;   // no surrogates
    } else if (c0 == 0xF0) {
        need = 3; lo = 0x90;
    } else if (c0 >= 0xF1 && c0 <= 0xF3) {
        need = 3;
    } else if (c0 == 0xF4) {
        need = 3; hi = 0x8F;   // <= U+10FFFF
    } else {
        return -1;
    }

    for (int k = 1; k <= need; ++k) {
        if (i + k >= s.size()) return -k;
        const unsigned char c = static_cast<unsigned char>(s[i + k]);
        if (k == 1 ? (c < lo || c > hi) : (c < 0x80 || c > 0xBF)) return -k;
    }
    return need + 1;
}

std::string decode_utf8_lossy(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        int n = utf8_sequence(bytes, i);
        if (n > 0) {
            out.append(bytes, i, static_cast<size_t>(n));
            i += static_cast<size_t>(n);
        } else {
            out += kReplacement;
            i += static_cast<size_t>(-n);
        }
    }
    return out;
}

}
