#pragma once
#include "indexing/PrefixTrie.hpp"
#include "scoring/Tfidf.hpp"
#include <cstddef>
#include <vector>

namespace indexing {

struct IndexStats {
    size_t documents = 0;
    size_t terms = 0;
    size_t postings = 0;    // entries kept after collisions
    size_t collisions = 0;  // entries overwritten by an identical score under the same term
};

// term -> score-ordered documents, reachable by prefix. Read-only once built.
class InvertedIndex {
public:
    // Documents are inserted in the given order. When two documents share a
    // term with exactly equal scores, the later one keeps the slot.
    static InvertedIndex build(const std::vector<scoring::DocumentVector>& vectors);

    const PrefixTrie& trie() const { return m_trie; }
    const IndexStats& stats() const { return m_stats; }
    bool empty() const { return m_trie.empty(); }

private:
    PrefixTrie m_trie;
    IndexStats m_stats;
};

}
