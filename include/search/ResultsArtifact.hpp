#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "search/PrefixSearch.hpp"

namespace search {

struct ResultsArtifact {
    std::string query;
    std::string corpus_dir;
    size_t num_documents = 0;

    SearchResult result;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace search
