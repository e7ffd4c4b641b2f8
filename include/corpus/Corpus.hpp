#pragma once
#include "corpus/Document.hpp"
#include <map>
#include <string>
#include <vector>

namespace corpus {

class Corpus {
public:
    // recursive walk, every regular file; id = path string
    static Corpus load_from_dir(const std::string& dir);
    static Corpus from_texts(const std::map<std::string, std::string>& texts);

    // sorted by id
    const std::vector<Document>& documents() const { return m_docs; }
    size_t size() const { return m_docs.size(); }
    bool empty() const { return m_docs.empty(); }

private:
    std::vector<Document> m_docs;
};

}
