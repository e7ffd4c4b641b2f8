#include "search/ResultsArtifact.hpp"

#include <fstream>
#include <stdexcept>

namespace search {

static nlohmann::json hit_to_json(const SearchHit& h, size_t rank) {
    nlohmann::json j;
    j["rank"] = rank;
    j["document"] = h.doc_id;
    j["term"] = h.term;
    // exact decimal; a json number would round it
    j["score"] = h.score.to_string();
    j["exact"] = h.exact;
    return j;
}

nlohmann::json ResultsArtifact::to_json() const {
    nlohmann::json j;
    j["query"] = query;
    j["normalized_query"] = result.normalized_query;
    j["corpus_dir"] = corpus_dir;
    j["num_documents"] = num_documents;
    j["num_results"] = result.hits.size();

    nlohmann::json arr = nlohmann::json::array();
    for (size_t i = 0; i < result.hits.size(); ++i) {
        arr.push_back(hit_to_json(result.hits[i], i + 1));
    }
    j["results"] = arr;

    return j;
}

void ResultsArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    // query and paths come from argv and the filesystem and may not be UTF-8
    out << to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

}  // namespace search
