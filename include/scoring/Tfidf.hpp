#pragma once
#include "corpus/Corpus.hpp"
#include "text/TextUtil.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace scoring {

using TermCounts = textutil::TermCounts;
using TermWeights = std::unordered_map<std::string, double>;

// tf = count / total count in the document. An empty document yields an
// empty map; no division happens.
TermWeights term_frequency(const TermCounts& counts);

// smooth: idf = ln((N + 1) / (df + 1)) + 1, df = documents containing the term
TermWeights inverse_document_frequency(const std::vector<TermCounts>& docs);

// unknown term -> 0
double weight_of(const TermWeights& weights, const std::string& term);

TermWeights tfidf(const TermWeights& tf, const TermWeights& idf);

// divide by the euclidean norm. empty or all-zero vectors come back unchanged.
TermWeights l2_normalize(const TermWeights& v);

struct DocumentVector {
    std::string doc_id;
    TermWeights weights;  // l2-normalized tf-idf
};

class TfidfModel {
public:
    TfidfModel(const corpus::Corpus& corpus, const textutil::PunctuationSet& punct);

    size_t num_documents() const { return m_num_docs; }
    size_t vocabulary_size() const { return m_idf.size(); }

    double idf(const std::string& term) const { return weight_of(m_idf, term); }
    uint32_t document_frequency(const std::string& term) const;

    // one entry per document, corpus order
    const std::vector<DocumentVector>& vectors() const { return m_vectors; }

private:
    size_t m_num_docs = 0;
    TermWeights m_idf;
    std::unordered_map<std::string, uint32_t> m_df;
    std::vector<DocumentVector> m_vectors;
};

}
