#include <gtest/gtest.h>

#include "envbox/core/result_store.hpp"
#include "envbox/core/exit_codes.hpp"
#include "envbox/utils/hash_utils.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace envbox {
namespace core {
namespace {

class ResultStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("envbox_results_" + utils::HashUtils::RandomToken(8));
        results_dir_ = root_ / "json";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    static BuildResult MakeResult(const std::string& repo, const std::string& sha, int exit_code) {
        BuildResult result;
        result.repo_name = repo;
        result.commit_sha = sha;
        result.exit_code = exit_code;
        result.container_logs = "logs";
        return result;
    }

    static JobSpec MakeJob(const std::string& repo, const std::string& sha) {
        JobSpec job;
        job.repository = repo;
        job.commit_sha = sha;
        return job;
    }

    fs::path root_;
    fs::path results_dir_;
};

TEST_F(ResultStoreTest, SaveCreatesDirectoryAndRecord) {
    ResultStore store(results_dir_);

    auto path = store.Save(MakeResult("owner/repo", "abc", 0));

    EXPECT_EQ(path, results_dir_ / "owner__repo@abc.json");
    EXPECT_TRUE(fs::is_regular_file(path));
    EXPECT_TRUE(store.Exists(JobKey{"owner/repo", "abc"}));
    EXPECT_FALSE(store.Exists(JobKey{"owner/repo", "def"}));

    // No temporary files left behind
    std::size_t files = 0;
    for (const auto& entry : fs::directory_iterator(results_dir_)) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(ResultStoreTest, LoadReturnsSavedRecord) {
    ResultStore store(results_dir_);
    auto saved = MakeResult("owner/repo", "abc", exit_codes::DOCKER_FAILURE);
    saved.extra["build_tool"] = "gradle";
    store.Save(saved);

    auto loaded = store.Load(JobKey{"owner/repo", "abc"});

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded->exit_code, exit_codes::DOCKER_FAILURE);
    EXPECT_EQ(*loaded->container_logs, "logs");
    EXPECT_EQ(loaded->extra.at("build_tool"), "gradle");
    EXPECT_FALSE(store.Load(JobKey{"other/repo", "abc"}).has_value());
}

TEST_F(ResultStoreTest, SaveOverwrites) {
    ResultStore store(results_dir_);
    store.Save(MakeResult("owner/repo", "abc", 1));
    store.Save(MakeResult("owner/repo", "abc", 0));

    EXPECT_EQ(*store.Load(JobKey{"owner/repo", "abc"})->exit_code, 0);
}

TEST_F(ResultStoreTest, CompletedKeysSkipsMalformedFiles) {
    ResultStore store(results_dir_);
    store.Save(MakeResult("a/one", "1", 0));
    store.Save(MakeResult("b/two", "2", exit_codes::TIMEOUT));
    {
        std::ofstream(results_dir_ / "broken.json") << "{ not json";
        std::ofstream(results_dir_ / "nokey.json") << R"({"exit_code": 0})";
        std::ofstream(results_dir_ / "notes.txt") << "ignored";
    }

    auto keys = store.CompletedKeys();

    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys.count(JobKey{"a/one", "1"}), 1u);
    EXPECT_EQ(keys.count(JobKey{"b/two", "2"}), 1u);
}

TEST_F(ResultStoreTest, MissingDirectoryHasNoKeys) {
    ResultStore store(results_dir_ / "absent");
    EXPECT_TRUE(store.CompletedKeys().empty());
}

TEST_F(ResultStoreTest, FilterPendingSkipsCompletedJobs) {
    ResultStore store(results_dir_);
    store.Save(MakeResult("a/one", "1", 0));

    auto pending = store.FilterPending({MakeJob("a/one", "1"), MakeJob("a/one", "2"), MakeJob("c/three", "1")},
                                       false);

    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].commit_sha, "2");
    EXPECT_EQ(pending[1].repository, "c/three");
}

TEST_F(ResultStoreTest, RewritePurgesEverything) {
    ResultStore store(results_dir_);
    store.Save(MakeResult("a/one", "1", 0));
    store.Save(MakeResult("b/two", "2", 0));

    auto pending = store.FilterPending({MakeJob("a/one", "1")}, true);

    EXPECT_EQ(pending.size(), 1u);
    EXPECT_TRUE(store.CompletedKeys().empty());
}

TEST_F(ResultStoreTest, WriteAggregateOneLinePerRecord) {
    ResultStore store(results_dir_);
    store.Save(MakeResult("a/one", "1", 0));
    store.Save(MakeResult("b/two", "2", 3));

    auto written = store.WriteAggregate();

    EXPECT_EQ(written, 2u);
    std::ifstream file(root_ / "results.jsonl");
    ASSERT_TRUE(file.good());
    std::string line;
    std::size_t lines = 0;
    while (std::getline(file, line)) {
        auto j = json::parse(line);
        EXPECT_TRUE(j.contains("repo_name"));
        ++lines;
    }
    EXPECT_EQ(lines, 2u);
}

TEST_F(ResultStoreTest, WriteAggregateToExplicitPath) {
    ResultStore store(results_dir_);
    store.Save(MakeResult("a/one", "1", 0));

    auto target = root_ / "out" / "all.jsonl";
    EXPECT_EQ(store.WriteAggregate(target), 1u);
    EXPECT_TRUE(fs::is_regular_file(target));
}

} // namespace
} // namespace core
} // namespace envbox
