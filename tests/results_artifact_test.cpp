#include "search/ResultsArtifact.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

static search::ResultsArtifact sample(const std::string& query, const std::string& doc) {
    search::ResultsArtifact art;
    art.query = query;
    art.corpus_dir = "corpus";
    art.num_documents = 1;
    art.result.normalized_query = query;
    art.result.hits.push_back({doc, "caf\xC3\xA9", indexing::Score::from_double(0.5), false});
    return art;
}

TEST(ResultsArtifactTest, ToJsonShape) {
    nlohmann::json j = sample("caf", "doc1").to_json();

    EXPECT_EQ(j["query"], "caf");
    EXPECT_EQ(j["num_results"], 1);
    ASSERT_EQ(j["results"].size(), 1u);
    EXPECT_EQ(j["results"][0]["rank"], 1);
    EXPECT_EQ(j["results"][0]["document"], "doc1");
    EXPECT_EQ(j["results"][0]["score"], "0.5");
}

TEST(ResultsArtifactTest, InvalidUtf8IsWrittenWithReplacement) {
    const fs::path out = fs::temp_directory_path() / "prefix_search_artifact_test" / "results.json";
    fs::remove_all(out.parent_path());

    EXPECT_NO_THROW(sample("caf\xE9", "dir/\xFF" "file").write_to(out));

    std::ifstream in(out);
    ASSERT_TRUE(in.good());
    nlohmann::json j;
    in >> j;
    EXPECT_EQ(j["query"], "caf\xEF\xBF\xBD");
    EXPECT_EQ(j["results"][0]["document"], "dir/\xEF\xBF\xBD" "file");

    fs::remove_all(out.parent_path());
}
