#pragma once
#include <cstddef>
#include <string>

#include "text/TextUtil.hpp"

namespace io {

struct SearchConfig {
    std::string corpus_dir = "data/corpus";
    std::string punctuation = textutil::PunctuationSet::ascii_default().chars();
    size_t per_term_limit = 9;
    size_t max_results = 100;
};

// Reads a JSON object; absent fields keep their defaults.
// Throws std::runtime_error on unreadable files, bad JSON or bad field types.
SearchConfig load_search_config(const std::string& path);

SearchConfig parse_search_config(const std::string& json_text, const std::string& where = "config");

}
