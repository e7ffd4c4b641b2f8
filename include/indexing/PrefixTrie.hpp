#pragma once
#include "indexing/Score.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace indexing {

// score -> document id, ascending; the best documents sit at the back
using PostingList = std::map<Score, std::string>;

// Byte-keyed trie over normalized terms. Children are ordered, so prefix
// enumeration visits terms in ascending byte order. Not modified after the
// index is built; const access is safe from several threads.
//
// Terms can be arbitrarily long (one node per byte), so traversal and
// teardown never recurse.
class PrefixTrie {
public:
    using Visitor = std::function<void(const std::string& term, const PostingList& postings)>;

    PrefixTrie();
    ~PrefixTrie();

    PrefixTrie(PrefixTrie&& other) noexcept;
    PrefixTrie& operator=(PrefixTrie&& other) noexcept;
    PrefixTrie(const PrefixTrie&) = delete;
    PrefixTrie& operator=(const PrefixTrie&) = delete;

    // returns false when the term was already present (its postings are replaced)
    bool insert(const std::string& term, PostingList postings);

    const PostingList* find(const std::string& term) const;

    // every stored term that starts with prefix, the prefix itself included
    void for_each_with_prefix(const std::string& prefix, const Visitor& fn) const;

    size_t size() const { return m_size; }
    bool empty() const { return m_size == 0; }

private:
    struct Node {
        // sorted by byte
        std::vector<std::pair<unsigned char, std::unique_ptr<Node>>> children;
        std::unique_ptr<PostingList> value;

        const Node* child(unsigned char c) const;
    };

    const Node* descend(const std::string& prefix) const;
    static void release(std::unique_ptr<Node> root);

    std::unique_ptr<Node> m_root;
    size_t m_size = 0;
};

}
