#include "search/PrefixSearch.hpp"
#include <algorithm>

namespace search {

void rank_hits(std::vector<SearchHit>& hits) {
    std::stable_sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b){
        if (a.exact != b.exact) return b.exact;
        return a.score < b.score;
    });
    std::reverse(hits.begin(), hits.end());
}

PrefixSearch::PrefixSearch(const indexing::InvertedIndex& index,
                           const textutil::PunctuationSet& punct,
                           SearchOptions opts)
    : m_index(index), m_punct(punct), m_opts(opts) {}

SearchResult PrefixSearch::search(const std::string& query) const {
    SearchResult res;
    res.normalized_query = textutil::normalize_term(query, m_punct);

    const std::string& q = res.normalized_query;
    std::vector<SearchHit>& hits = res.hits;

    m_index.trie().for_each_with_prefix(q, [&](const std::string& term, const indexing::PostingList& postings) {
        const bool exact = (term == q);
        size_t taken = 0;
        for (auto it = postings.rbegin(); it != postings.rend() && taken < m_opts.per_term_limit; ++it, ++taken) {
            hits.push_back({it->second, term, it->first, exact});
        }
    });

    rank_hits(hits);
    if (hits.size() > m_opts.max_results) hits.resize(m_opts.max_results);
    return res;
}

}
