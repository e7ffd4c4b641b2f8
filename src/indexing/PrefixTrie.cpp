#include "indexing/PrefixTrie.hpp"
#include <algorithm>

namespace indexing {

PrefixTrie::PrefixTrie() : m_root(std::make_unique<Node>()) {}

PrefixTrie::~PrefixTrie() {
    release(std::move(m_root));
}

PrefixTrie::PrefixTrie(PrefixTrie&& other) noexcept
    : m_root(std::move(other.m_root)), m_size(other.m_size) {
    other.m_size = 0;
}

PrefixTrie& PrefixTrie::operator=(PrefixTrie&& other) noexcept {
    if (this != &other) {
        release(std::move(m_root));
        m_root = std::move(other.m_root);
        m_size = other.m_size;
        other.m_size = 0;
    }
    return *this;
}

void PrefixTrie::release(std::unique_ptr<Node> root) {
    std::vector<std::unique_ptr<Node>> pending;
    if (root) pending.push_back(std::move(root));

    while (!pending.empty()) {
        std::unique_ptr<Node> n = std::move(pending.back());
        pending.pop_back();
        for (auto& c : n->children) pending.push_back(std::move(c.second));
        // n now owns no children and is freed here
    }
}

const PrefixTrie::Node* PrefixTrie::Node::child(unsigned char c) const {
    auto it = std::lower_bound(children.begin(), children.end(), c,
                               [](const auto& entry, unsigned char b){ return entry.first < b; });
    if (it == children.end() || it->first != c) return nullptr;
    return it->second.get();
}

bool PrefixTrie::insert(const std::string& term, PostingList postings) {
    if (!m_root) m_root = std::make_unique<Node>();

    Node* cur = m_root.get();
    for (unsigned char c : term) {
        auto& kids = cur->children;
        auto it = std::lower_bound(kids.begin(), kids.end(), c,
                                   [](const auto& entry, unsigned char b){ return entry.first < b; });
        if (it == kids.end() || it->first != c) {
            it = kids.emplace(it, c, std::make_unique<Node>());
        }
        cur = it->second.get();
    }

    const bool fresh = !cur->value;
    cur->value = std::make_unique<PostingList>(std::move(postings));
    if (fresh) ++m_size;
    return fresh;
}

const PrefixTrie::Node* PrefixTrie::descend(const std::string& prefix) const {
    const Node* cur = m_root.get();
    for (unsigned char c : prefix) {
        if (!cur) return nullptr;
        cur = cur->child(c);
    }
    return cur;
}

const PostingList* PrefixTrie::find(const std::string& term) const {
    const Node* n = descend(term);
    if (!n || !n->value) return nullptr;
    return n->value.get();
}

void PrefixTrie::for_each_with_prefix(const std::string& prefix, const Visitor& fn) const {
    const Node* start = descend(prefix);
    if (!start) return;

    // depth-first, pre-order; each frame remembers the next child to visit
    // and the path length at which its node's term ends
    struct Frame {
        const Node* node;
        size_t next_child;
        size_t path_len;
    };

    std::string path = prefix;
    std::vector<Frame> stack;

    if (start->value) fn(path, *start->value);
    stack.push_back({start, 0, path.size()});

    while (!stack.empty()) {
        Frame& top = stack.back();
        if (top.next_child == top.node->children.size()) {
            stack.pop_back();
            continue;
        }

        const auto& entry = top.node->children[top.next_child++];
        path.resize(top.path_len);
        path.push_back(static_cast<char>(entry.first));

        const Node* child = entry.second.get();
        if (child->value) fn(path, *child->value);
        stack.push_back({child, 0, path.size()});
    }
}

}
