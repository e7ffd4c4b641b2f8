#include "indexing/InvertedIndex.hpp"
#include <unordered_map>

namespace indexing {

InvertedIndex InvertedIndex::build(const std::vector<scoring::DocumentVector>& vectors) {
    InvertedIndex idx;
    idx.m_stats.documents = vectors.size();

    std::unordered_map<std::string, PostingList> by_term;

    for (const auto& dv : vectors) {
        for (const auto& kv : dv.weights) {
            Score s = Score::from_double(kv.second);
            auto res = by_term[kv.first].insert_or_assign(std::move(s), dv.doc_id);
            if (!res.second) ++idx.m_stats.collisions;
        }
    }

    for (auto& kv : by_term) {
        idx.m_stats.postings += kv.second.size();
        idx.m_trie.insert(kv.first, std::move(kv.second));
    }
    idx.m_stats.terms = idx.m_trie.size();

    return idx;
}

}
