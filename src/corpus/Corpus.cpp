#include "corpus/Corpus.hpp"
#include "text/TextUtil.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace corpus {

static std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open: " + p.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) throw std::runtime_error("failed to read: " + p.string());
    return ss.str();
}

Corpus Corpus::load_from_dir(const std::string& dir) {
    fs::path root(dir);
    if (!fs::exists(root)) throw std::runtime_error("dir not found: " + dir);
    if (!fs::is_directory(root)) throw std::runtime_error("not a directory: " + dir);

    std::map<std::string, std::string> texts;
    try {
        for (const auto& entry : fs::recursive_directory_iterator(root)) {
            if (!entry.is_regular_file()) continue;
            const auto& p = entry.path();
            texts[p.string()] = textutil::decode_utf8_lossy(read_all(p));
        }
    } catch (const fs::filesystem_error& e) {
        throw std::runtime_error(std::string("failed to walk corpus: ") + e.what());
    }

    return from_texts(texts);
}

Corpus Corpus::from_texts(const std::map<std::string, std::string>& texts) {
    Corpus c;
    c.m_docs.reserve(texts.size());
    for (const auto& [id, text] : texts) {
        c.m_docs.push_back({id, text});
    }
    return c;
}

}
