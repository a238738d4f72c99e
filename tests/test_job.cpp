#include <gtest/gtest.h>

#include "envbox/core/job.hpp"
#include "envbox/core/exit_codes.hpp"

namespace envbox {
namespace core {
namespace {

TEST(JobKeyTest, FileStemRoundTrip) {
    JobKey key{"owner/repo", "0123abcd"};
    EXPECT_EQ(key.FileStem(), "owner__repo@0123abcd");

    auto parsed = JobKey::FromFileStem("owner__repo@0123abcd");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, key);

    EXPECT_FALSE(JobKey::FromFileStem("no-revision").has_value());
    EXPECT_FALSE(JobKey::FromFileStem("@abc").has_value());
}

TEST(JobKeyTest, Ordering) {
    JobKey a{"a/x", "2"};
    JobKey b{"a/x", "10"};
    JobKey c{"b/x", "0"};
    EXPECT_TRUE(b < a);
    EXPECT_TRUE(a < c);
    EXPECT_FALSE(a < a);
}

TEST(LanguageTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(ParseLanguage("Python"), Language::PYTHON);
    EXPECT_EQ(ParseLanguage(" jvm "), Language::JVM);
    EXPECT_EQ(ParseLanguage("repo2run"), Language::REPO2RUN);
    EXPECT_FALSE(ParseLanguage("rust").has_value());
    EXPECT_EQ(LanguageToString(Language::JVM), "jvm");
}

TEST(BuildResultTest, MergeFieldsSplitsKnownAndExtra) {
    BuildResult result;
    result.repo_name = "owner/repo";

    result.MergeFields(json{{"issues_count", 7}, {"build_tool", "maven"}, {"exit_code", 2}});

    EXPECT_EQ(result.issues_count, 7);
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 2);
    EXPECT_EQ(result.extra.at("build_tool"), "maven");
    EXPECT_FALSE(result.extra.contains("issues_count"));
}

TEST(BuildResultTest, MergeResultFileKeepsRunnerFields) {
    BuildResult result;
    result.repo_name = "owner/repo";
    result.commit_sha = "abc";
    result.exit_code = 0;
    result.container_logs = "log";

    result.MergeResultFile(json{{"exit_code", 5},
                                {"repo_name", "evil/repo"},
                                {"container_logs", nullptr},
                                {"issues_count", 3},
                                {"missing_imports", json::array({"numpy"})}});

    EXPECT_EQ(*result.exit_code, 0);
    EXPECT_EQ(result.repo_name, "owner/repo");
    ASSERT_TRUE(result.container_logs.has_value());
    EXPECT_EQ(*result.container_logs, "log");
    EXPECT_EQ(result.issues_count, 3);
    EXPECT_EQ(result.extra.at("missing_imports").size(), 1u);
    EXPECT_FALSE(result.extra.contains("exit_code"));
}

TEST(BuildResultTest, NonObjectIsIgnored) {
    BuildResult result;
    result.MergeResultFile(json::array({1, 2}));
    EXPECT_TRUE(result.extra.empty());
    EXPECT_EQ(result.issues_count, 0);
}

TEST(BuildResultTest, JsonRecordCarriesAllFields) {
    BuildResult result;
    result.repo_name = "owner/repo";
    result.commit_sha = "abc";
    result.exit_code = exit_codes::TIMEOUT;
    result.execution_time = 1.5;
    result.script_sha256 = "ff";
    result.extra["pytest"] = json::object();

    json j = result.ToJson();
    EXPECT_EQ(j.at("exit_code"), -127);
    EXPECT_TRUE(j.at("container_logs").is_null());
    EXPECT_EQ(j.at("repo_name"), "owner/repo");
    EXPECT_TRUE(j.contains("pytest"));

    auto parsed = BuildResult::FromJson(j);
    EXPECT_EQ(parsed.Key(), result.Key());
    EXPECT_EQ(*parsed.exit_code, exit_codes::TIMEOUT);
    EXPECT_FALSE(parsed.container_logs.has_value());
    EXPECT_TRUE(parsed.extra.contains("pytest"));
}

TEST(BuildResultTest, NullExitCodeSerializesAsNull) {
    BuildResult result;
    result.repo_name = "owner/repo";
    EXPECT_TRUE(result.ToJson().at("exit_code").is_null());
    EXPECT_THROW(BuildResult::FromJson(json{{"exit_code", 0}}), json::exception);
}

TEST(ExitCodesTest, SentinelsAreDistinctNegatives) {
    const int sentinels[] = {exit_codes::TIMEOUT, exit_codes::UNKNOWN_FAILURE,
                             exit_codes::DOCKER_FAILURE, exit_codes::CREATE_CONTAINER_FAILURE,
                             exit_codes::DOWNLOAD_FAILURE, exit_codes::SCRIPT_FAILURE};
    for (int code : sentinels) {
        EXPECT_LT(code, 0);
        EXPECT_TRUE(exit_codes::IsSentinel(code));
    }
    EXPECT_FALSE(exit_codes::IsSentinel(0));
    EXPECT_FALSE(exit_codes::IsSentinel(1));
    EXPECT_EQ(exit_codes::Describe(exit_codes::DOWNLOAD_FAILURE), "DOWNLOAD_FAILURE");
    EXPECT_EQ(exit_codes::Describe(3), "EXIT_3");
}

} // namespace
} // namespace core
} // namespace envbox
