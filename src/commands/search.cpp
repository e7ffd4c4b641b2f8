#include "commands/search.hpp"

#include "corpus/Corpus.hpp"
#include "indexing/InvertedIndex.hpp"
#include "io/ConfigIO.hpp"
#include "scoring/Tfidf.hpp"
#include "search/PrefixSearch.hpp"
#include "search/ResultsArtifact.hpp"
#include "text/TextUtil.hpp"

#include <iostream>
#include <string>
#include <vector>

static int search_usage(std::ostream& err) {
    err << "usage:\n"
        << "  prefix-search [--corpus <dir>] [--config <path>] [--json <path>] <query>\n";
    return 1;
}

static int print_help(std::ostream& err) {
    err << "usage:\n"
        << "  prefix-search [options] <query>\n"
        << "  prefix-search --help\n"
        << "\n"
        << "options:\n"
        << "  --corpus <dir>               default: data/corpus (or config corpus_dir)\n"
        << "  --config <path>              optional JSON config\n"
        << "  --json <path>                optional: also write results as JSON\n"
        << "\n"
        << "config fields:\n"
        << "  corpus_dir      <str>        default: data/corpus\n"
        << "  punctuation     <str>        default: ASCII punctuation (ASCII only)\n"
        << "  per_term_limit  <n>          default: 9\n"
        << "  max_results     <n>          default: 100\n"
        << "\n"
        << "any other single argument, \"help\" included, is the query.\n";
    return 0;
}

struct SearchArgs {
    std::string corpus_dir;
    std::string config_path;
    std::string json_path;
    std::vector<std::string> positional;
};

// returns false on a flag missing its value
static bool parse_args(const std::vector<std::string>& args, SearchArgs& sa, std::ostream& err) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];

        std::string* target = nullptr;
        if (a == "--corpus") target = &sa.corpus_dir;
        else if (a == "--config") target = &sa.config_path;
        else if (a == "--json") target = &sa.json_path;

        if (target) {
            if (i + 1 >= args.size()) {
                err << "error: " << a << " requires a value\n";
                return false;
            }
            *target = args[++i];
            continue;
        }

        sa.positional.push_back(a);
    }
    return true;
}

int cmd_search(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    if (args.size() == 1 && args.front() == "--help") return print_help(err);

    SearchArgs sa;
    if (!parse_args(args, sa, err)) return search_usage(err);

    if (sa.positional.size() != 1) {
        out << "Please use a single argument\n";
        return 1;
    }
    const std::string& query = sa.positional.front();

    io::SearchConfig cfg;
    try {
        if (!sa.config_path.empty()) cfg = io::load_search_config(sa.config_path);
    } catch (const std::exception& e) {
        err << "error: " << e.what() << "\n";
        return 2;
    }
    if (!sa.corpus_dir.empty()) cfg.corpus_dir = sa.corpus_dir;

    out << "Searching for " << query << "\n";

    try {
        const textutil::PunctuationSet punct(cfg.punctuation);

        corpus::Corpus corpus = corpus::Corpus::load_from_dir(cfg.corpus_dir);
        scoring::TfidfModel model(corpus, punct);
        indexing::InvertedIndex index = indexing::InvertedIndex::build(model.vectors());

        const auto& st = index.stats();
        err << "indexed " << st.documents << " documents, "
            << st.terms << " terms, " << st.postings << " postings\n";
        if (st.collisions > 0) {
            err << "warning: " << st.collisions << " postings replaced by an equal score under the same term\n";
        }

        search::SearchOptions opts;
        opts.per_term_limit = cfg.per_term_limit;
        opts.max_results = cfg.max_results;

        search::PrefixSearch searcher(index, punct, opts);
        search::SearchResult res = searcher.search(query);

        if (res.no_matches()) {
            out << "No matches\n";
        } else {
            for (const auto& h : res.hits) {
                out << "Document " << h.doc_id << " matching word " << h.term
                    << " with score " << h.score.to_string() << "\n";
            }
        }

        if (!sa.json_path.empty()) {
            search::ResultsArtifact art;
            art.query = query;
            art.corpus_dir = cfg.corpus_dir;
            art.num_documents = corpus.size();
            art.result = std::move(res);
            art.write_to(sa.json_path);
            err << "wrote " << sa.json_path << "\n";
        }
    } catch (const std::exception& e) {
        err << "error: " << e.what() << "\n";
        return 2;
    }

    return 0;
}

int cmd_search(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return cmd_search(args, std::cout, std::cerr);
}
