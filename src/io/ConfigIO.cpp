#include "io/ConfigIO.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace io {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void read_string(const json& j, const char* key, const std::string& where, std::string& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    out = j.at(key).get<std::string>();
}

static void read_count(const json& j, const char* key, const std::string& where, size_t& out) {
    if (!j.contains(key)) return;
    const json& v = j.at(key);
    if (!v.is_number_unsigned() || v.get<size_t>() == 0) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a positive integer");
    }
    out = v.get<size_t>();
}

static SearchConfig parse_config(const json& j, const std::string& where) {
    require_object(j, where);

    SearchConfig cfg;
    read_string(j, "corpus_dir", where, cfg.corpus_dir);
    read_string(j, "punctuation", where, cfg.punctuation);
    for (unsigned char c : cfg.punctuation) {
        if (c >= 0x80) throw std::runtime_error(where + ".punctuation must be ASCII");
    }
    read_count(j, "per_term_limit", where, cfg.per_term_limit);
    read_count(j, "max_results", where, cfg.max_results);

    for (const auto& kv : j.items()) {
        const std::string& k = kv.key();
        if (k != "corpus_dir" && k != "punctuation" && k != "per_term_limit" && k != "max_results") {
            throw std::runtime_error(where + " has unknown field: " + k);
        }
    }
    return cfg;
}

SearchConfig parse_search_config(const std::string& json_text, const std::string& where) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    return parse_config(j, where);
}

SearchConfig load_search_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open config file: " + path);
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_search_config(ss.str(), path);
}

}
