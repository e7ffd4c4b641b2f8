#include "scoring/Tfidf.hpp"
#include <cmath>

namespace scoring {

static std::unordered_map<std::string, uint32_t> document_frequencies(const std::vector<TermCounts>& docs) {
    std::unordered_map<std::string, uint32_t> df;
    for (const auto& counts : docs) {
        // keys are unique per document, so each term counts once
        for (const auto& kv : counts) df[kv.first] += 1;
    }
    return df;
}

static double smooth_idf(size_t num_docs, uint32_t df) {
    return std::log(((double)num_docs + 1.0) / ((double)df + 1.0)) + 1.0;
}

TermWeights term_frequency(const TermCounts& counts) {
    uint64_t total = 0;
    for (const auto& kv : counts) total += kv.second;

    TermWeights tf;
    tf.reserve(counts.size());
    for (const auto& kv : counts) {
        tf.emplace(kv.first, (double)kv.second / (double)total);
    }
    return tf;
}

TermWeights inverse_document_frequency(const std::vector<TermCounts>& docs) {
    const auto df = document_frequencies(docs);

    TermWeights idf;
    idf.reserve(df.size());
    for (const auto& kv : df) {
        idf.emplace(kv.first, smooth_idf(docs.size(), kv.second));
    }
    return idf;
}

double weight_of(const TermWeights& weights, const std::string& term) {
    auto it = weights.find(term);
    return it == weights.end() ? 0.0 : it->second;
}

TermWeights tfidf(const TermWeights& tf, const TermWeights& idf) {
    TermWeights out;
    out.reserve(tf.size());
    for (const auto& kv : tf) {
        out.emplace(kv.first, kv.second * weight_of(idf, kv.first));
    }
    return out;
}

TermWeights l2_normalize(const TermWeights& v) {
    double norm2 = 0.0;
    for (const auto& kv : v) norm2 += kv.second * kv.second;

    const double norm = std::sqrt(norm2);
    if (norm == 0.0) return v;

    TermWeights out;
    out.reserve(v.size());
    for (const auto& kv : v) out.emplace(kv.first, kv.second / norm);
    return out;
}

TfidfModel::TfidfModel(const corpus::Corpus& corpus, const textutil::PunctuationSet& punct) {
    const auto& docs = corpus.documents();
    m_num_docs = docs.size();

    // Pass 1: raw counts per document
    std::vector<TermCounts> counts;
    counts.reserve(docs.size());
    for (const auto& d : docs) counts.push_back(textutil::count_terms(d.text, punct));

    // corpus-wide weights, computed once
    m_df = document_frequencies(counts);
    m_idf.reserve(m_df.size());
    for (const auto& kv : m_df) m_idf.emplace(kv.first, smooth_idf(m_num_docs, kv.second));

    // Pass 2: normalized tf-idf per document
    m_vectors.reserve(docs.size());
    for (size_t i = 0; i < docs.size(); ++i) {
        DocumentVector dv;
        dv.doc_id = docs[i].id;
        dv.weights = l2_normalize(tfidf(term_frequency(counts[i]), m_idf));
        m_vectors.push_back(std::move(dv));
    }
}

uint32_t TfidfModel::document_frequency(const std::string& term) const {
    auto it = m_df.find(term);
    return it == m_df.end() ? 0 : it->second;
}

}
