#include "commands/search.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace fs = std::filesystem;

class SearchCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("prefix_search_cmd_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        fs::create_directories(root_ / "corpus" / "inbox");
        write("corpus/inbox/1", "apple apple banana");
        write("corpus/2", "Banana, cherry!");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write(const std::string& rel, const std::string& text) {
        std::ofstream out(root_ / rel, std::ios::binary);
        out << text;
    }

    int run(const std::vector<std::string>& args) {
        out_.str("");
        err_.str("");
        return cmd_search(args, out_, err_);
    }

    std::string corpus() const { return (root_ / "corpus").string(); }

    fs::path root_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(SearchCommandTest, RequiresExactlyOneQuery) {
    EXPECT_EQ(run({"--corpus", corpus()}), 1);
    EXPECT_EQ(out_.str(), "Please use a single argument\n");

    EXPECT_EQ(run({"--corpus", corpus(), "apple", "banana"}), 1);
    EXPECT_EQ(out_.str(), "Please use a single argument\n");
}

TEST_F(SearchCommandTest, FlagWithoutValueIsUsageError) {
    EXPECT_EQ(run({"apple", "--corpus"}), 1);
    EXPECT_NE(err_.str().find("--corpus requires a value"), std::string::npos);
}

TEST_F(SearchCommandTest, PrintsRankedMatches) {
    ASSERT_EQ(run({"--corpus", corpus(), "banana"}), 0) << err_.str();

    const std::string out = out_.str();
    EXPECT_EQ(out.rfind("Searching for banana\n", 0), 0u);

    const std::string first = "Document " + (root_ / "corpus" / "2").string() + " matching word banana with score 0.";
    const std::string second = "Document " + (root_ / "corpus" / "inbox" / "1").string() + " matching word banana with score 0.";
    const size_t a = out.find(first);
    const size_t b = out.find(second);
    ASSERT_NE(a, std::string::npos) << out;
    ASSERT_NE(b, std::string::npos) << out;
    EXPECT_LT(a, b);

    EXPECT_NE(err_.str().find("indexed 2 documents"), std::string::npos);
}

TEST_F(SearchCommandTest, NoMatchesIsNotAnError) {
    EXPECT_EQ(run({"--corpus", corpus(), "durian"}), 0);
    EXPECT_EQ(out_.str(), "Searching for durian\nNo matches\n");
}

TEST_F(SearchCommandTest, MissingCorpusFails) {
    EXPECT_EQ(run({"--corpus", (root_ / "nope").string(), "apple"}), 2);
    EXPECT_NE(err_.str().find("error: dir not found"), std::string::npos);
}

TEST_F(SearchCommandTest, ConfigFileSuppliesCorpusAndLimits) {
    write("cfg.json", "{\"corpus_dir\": " + nlohmann::json(corpus()).dump() + ", \"max_results\": 1}");

    ASSERT_EQ(run({"--config", (root_ / "cfg.json").string(), "banana"}), 0) << err_.str();
    const std::string out = out_.str();
    size_t lines = 0;
    for (size_t pos = out.find("matching word"); pos != std::string::npos; pos = out.find("matching word", pos + 1)) ++lines;
    EXPECT_EQ(lines, 1u);
}

TEST_F(SearchCommandTest, BadConfigFails) {
    write("bad.json", "{\"max_results\": \"many\"}");
    EXPECT_EQ(run({"--config", (root_ / "bad.json").string(), "apple"}), 2);
    EXPECT_NE(err_.str().find("max_results"), std::string::npos);
}

TEST_F(SearchCommandTest, WritesJsonResults) {
    const fs::path json_path = root_ / "out" / "results.json";
    ASSERT_EQ(run({"--corpus", corpus(), "--json", json_path.string(), "b"}), 0) << err_.str();

    std::ifstream in(json_path);
    ASSERT_TRUE(in.good());
    nlohmann::json j;
    in >> j;

    EXPECT_EQ(j["query"], "b");
    EXPECT_EQ(j["normalized_query"], "b");
    EXPECT_EQ(j["num_documents"], 2);
    ASSERT_EQ(j["num_results"], 2);
    ASSERT_EQ(j["results"].size(), 2u);
    EXPECT_EQ(j["results"][0]["rank"], 1);
    EXPECT_EQ(j["results"][0]["term"], "banana");
    EXPECT_EQ(j["results"][0]["exact"], false);
    EXPECT_TRUE(j["results"][0]["score"].is_string());
}

TEST_F(SearchCommandTest, HelpIsAnOrdinaryQuery) {
    write("corpus/3", "Help wanted");
    EXPECT_EQ(run({"--corpus", corpus(), "help"}), 0);
    EXPECT_EQ(out_.str().rfind("Searching for help\n", 0), 0u);
    EXPECT_NE(out_.str().find("matching word help with score"), std::string::npos) << out_.str();
}

TEST_F(SearchCommandTest, DashDashHelpPrintsUsage) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_NE(err_.str().find("usage:"), std::string::npos);
}

TEST_F(SearchCommandTest, NonUtf8QueryStillWritesJson) {
    const fs::path json_path = root_ / "results.json";
    EXPECT_EQ(run({"--corpus", corpus(), "--json", json_path.string(), "b\xFF"}), 0) << err_.str();
    EXPECT_EQ(out_.str().find("Searching for b"), 0u);
    EXPECT_NE(out_.str().find("No matches"), std::string::npos);

    std::ifstream in(json_path);
    ASSERT_TRUE(in.good());
    nlohmann::json j;
    in >> j;
    EXPECT_EQ(j["num_results"], 0);
    EXPECT_EQ(j["normalized_query"], "b\xEF\xBF\xBD");
}

TEST_F(SearchCommandTest, UnicodeCaseFoldedAcrossQueryAndCorpus) {
    write("corpus/4", "\xC3\x89T\xC3\x89\xC2\xA0" "chaud");
    ASSERT_EQ(run({"--corpus", corpus(), "\xC3\xA9t\xC3\xA9"}), 0) << err_.str();
    EXPECT_NE(out_.str().find("matching word \xC3\xA9t\xC3\xA9 with score"), std::string::npos) << out_.str();
}
