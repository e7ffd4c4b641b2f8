#pragma once
#include "indexing/InvertedIndex.hpp"
#include "indexing/Score.hpp"
#include "text/TextUtil.hpp"
#include <string>
#include <vector>

namespace search {

struct SearchHit {
    std::string doc_id;
    std::string term;       // indexed term that matched the prefix
    indexing::Score score;
    bool exact = false;     // term == normalized query
};

struct SearchOptions {
    size_t per_term_limit = 9;   // best documents pulled from each matching term
    size_t max_results = 100;
};

struct SearchResult {
    std::string normalized_query;
    std::vector<SearchHit> hits;

    bool no_matches() const { return hits.empty(); }
};

// Orders candidates in place: sort ascending by (exact match, score), then
// reverse the whole list. Exact matches end up first, each group by
// descending score; equal keys come out in reverse enumeration order.
void rank_hits(std::vector<SearchHit>& hits);

class PrefixSearch {
public:
    PrefixSearch(const indexing::InvertedIndex& index,
                 const textutil::PunctuationSet& punct,
                 SearchOptions opts = {});

    SearchResult search(const std::string& query) const;

private:
    const indexing::InvertedIndex& m_index;
    const textutil::PunctuationSet& m_punct;
    SearchOptions m_opts;
};

}
