#include <gtest/gtest.h>

#include "envbox/core/sandbox_session.hpp"
#include "envbox/utils/hash_utils.hpp"
#include "fake_container_client.hpp"

#include <filesystem>
#include <future>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace envbox {
namespace core {
namespace {

/// Session tests run the wrapped scripts on the host: the repository is
/// "mounted" at its own host path so that replayed `cd`s resolve.
class SandboxSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo_dir_ = fs::canonical(fs::temp_directory_path()) /
                    ("envbox_session_" + utils::HashUtils::RandomToken(8));
        fs::create_directories(repo_dir_);

        config_.image = "envbox/fake:latest";
        config_.mount_path = repo_dir_.string();
        config_.bash_timeout = std::chrono::seconds(30);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(repo_dir_, ec);
    }

    std::unique_ptr<SandboxSession> MakeSession() {
        return SandboxSession::Create(client_, config_, repo_dir_);
    }

    static std::string CountTo(int n) {
        return "for i in $(seq 0 " + std::to_string(n - 1) + "); do echo $i; done";
    }

    test_support::FakeContainerClient client_;
    SessionConfig config_;
    fs::path repo_dir_;
};

TEST_F(SandboxSessionTest, EchoStripsTrailingNewline) {
    auto session = MakeSession();

    auto result = session->ExecuteBashCommand("echo hello");

    EXPECT_EQ(result.output, "hello");
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 0);
}

TEST_F(SandboxSessionTest, ContainerConfiguredForSession) {
    config_.env_vars["ENVBOX_TEST"] = "1";
    auto session = MakeSession();

    auto config = client_.LastConfig();
    EXPECT_EQ(config.image, "envbox/fake:latest");
    EXPECT_EQ(config.working_dir, repo_dir_.string());
    ASSERT_EQ(config.mounts.size(), 1u);
    EXPECT_EQ(config.mounts[0].container_path, repo_dir_.string());
    EXPECT_FALSE(config.mounts[0].read_only);
    EXPECT_EQ(config.environment_vars.at("ENVBOX_TEST"), "1");
    EXPECT_EQ(config.command, (std::vector<std::string>{"tail", "-f", "/dev/null"}));
    EXPECT_EQ(client_.starts.load(), 1);
}

TEST_F(SandboxSessionTest, MissingImageIsPulled) {
    client_.image_present = false;
    auto session = MakeSession();
    EXPECT_EQ(client_.pulls.load(), 1);
}

TEST_F(SandboxSessionTest, EmptyImageRejected) {
    config_.image.clear();
    EXPECT_THROW(MakeSession(), std::invalid_argument);
    EXPECT_EQ(client_.creates.load(), 0);
}

TEST_F(SandboxSessionTest, ExportPersistsAcrossCommands) {
    auto session = MakeSession();

    session->ExecuteBashCommand("export MY_VAR=hello");
    auto result = session->ExecuteBashCommand("echo $MY_VAR");

    EXPECT_EQ(result.output, "hello");
    EXPECT_EQ(session->State().Environment().at("MY_VAR"), "hello");
}

TEST_F(SandboxSessionTest, ExportPersistsAfterFailingExit) {
    auto session = MakeSession();

    auto failed = session->ExecuteBashCommand("export MY_VAR=kept; exit 123");
    ASSERT_TRUE(failed.exit_code.has_value());
    EXPECT_EQ(*failed.exit_code, 123);

    auto result = session->ExecuteBashCommand("echo $MY_VAR");
    EXPECT_EQ(result.output, "kept");
    EXPECT_EQ(*result.exit_code, 0);
}

TEST_F(SandboxSessionTest, WorkingDirectoryPersists) {
    fs::create_directories(repo_dir_ / "sub dir");
    auto session = MakeSession();

    session->ExecuteBashCommand("cd 'sub dir'");
    auto result = session->ExecuteBashCommand("pwd");

    EXPECT_EQ(result.output, (repo_dir_ / "sub dir").string());
}

TEST_F(SandboxSessionTest, UnsetPersists) {
    auto session = MakeSession();

    session->ExecuteBashCommand("export GONE=1");
    session->ExecuteBashCommand("unset GONE");
    auto result = session->ExecuteBashCommand("echo \"[${GONE:-unset}]\"");

    EXPECT_EQ(result.output, "[unset]");
}

TEST_F(SandboxSessionTest, FailureIsFramed) {
    auto session = MakeSession();

    auto result = session->ExecuteBashCommand("echo boom; exit 2");

    EXPECT_EQ(result.output, std::string(OutputFormatter::kErrorPrefix) + "boom\n");
    EXPECT_EQ(*result.exit_code, 2);
}

TEST_F(SandboxSessionTest, OutputTruncatedToLimit) {
    config_.max_num_chars_bash_output = 2;
    auto session = MakeSession();

    auto result = session->ExecuteBashCommand(CountTo(10));

    std::string marker = OutputFormatter::SkipMarker(8);
    EXPECT_EQ(result.output.size(), 2 + marker.size());
    EXPECT_EQ(result.output, "0\n" + marker);
    EXPECT_EQ(*result.exit_code, 0);
}

TEST_F(SandboxSessionTest, FailingOutputTruncatedWithPrefix) {
    config_.max_num_chars_bash_output = 2;
    auto session = MakeSession();

    auto result = session->ExecuteBashCommand(CountTo(10) + "; exit 123");

    std::string prefix = OutputFormatter::kErrorPrefix;
    std::string marker = OutputFormatter::SkipMarker(8);
    EXPECT_EQ(result.output.size(), 2 + prefix.size() + marker.size() + 1);
    EXPECT_EQ(*result.exit_code, 123);
}

TEST_F(SandboxSessionTest, NoLimitKeepsFullOutput) {
    config_.max_num_chars_bash_output = std::nullopt;
    auto session = MakeSession();

    auto result = session->ExecuteBashCommand("head -c 20000 /dev/zero | tr '\\0' a");

    EXPECT_EQ(result.output, std::string(20000, 'a'));
}

TEST_F(SandboxSessionTest, TimeoutRestartsContainerAndKeepsState) {
    config_.bash_timeout = std::chrono::seconds(1);
    auto session = MakeSession();
    session->ExecuteBashCommand("export SURVIVOR=yes; echo kept > survivor.txt");

    auto timed_out = session->ExecuteBashCommand("sleep 5");

    EXPECT_FALSE(timed_out.exit_code.has_value());
    EXPECT_EQ(timed_out.output, SandboxSession::DefaultTimeoutMessage(std::chrono::seconds(1)));
    EXPECT_EQ(client_.creates.load(), 2);
    EXPECT_EQ(client_.LiveContainers(), 1u);

    auto next = session->ExecuteBashCommand("echo $SURVIVOR $(cat survivor.txt)");
    EXPECT_EQ(next.output, "yes kept");
    EXPECT_EQ(*next.exit_code, 0);

    auto history = session->CommandsHistory();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_FALSE(history[1].exit_code.has_value());
}

TEST_F(SandboxSessionTest, DaemonLikeOutputIsOrdinaryFailure) {
    auto session = MakeSession();

    auto result = session->ExecuteBashCommand(
        "echo 'Error response from daemon: pull access denied'; exit 1");

    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 1);
    EXPECT_EQ(result.output, std::string(OutputFormatter::kErrorPrefix) +
                                 "Error response from daemon: pull access denied\n");
    EXPECT_EQ(client_.creates.load(), 1);
}

TEST_F(SandboxSessionTest, CustomTimeoutMessage) {
    config_.bash_timeout = std::chrono::seconds(1);
    config_.timeout_message = "took too long";
    auto session = MakeSession();

    auto result = session->ExecuteBashCommand("sleep 5");

    EXPECT_EQ(result.output, "took too long");
    EXPECT_FALSE(result.exit_code.has_value());
}

TEST_F(SandboxSessionTest, ConcurrentCommandsAreSerialized) {
    auto session = MakeSession();
    const std::string lock = (repo_dir_ / "test.lock").string();

    auto command = [&](int i) {
        return "if [ -f '" + lock + "' ]; then\n"
               "    echo \"Lock file exists, commands are racing!\"\n"
               "    exit 1\n"
               "fi\n"
               "touch '" + lock + "'\n"
               "sleep 1\n"
               "rm '" + lock + "'\n"
               "echo \"cmd" + std::to_string(i) + " done\"\n";
    };

    std::vector<std::future<BashCommandOutput>> futures;
    for (int i = 1; i <= 3; ++i) {
        futures.push_back(std::async(std::launch::async, [&, i]() {
            return session->ExecuteBashCommand(command(i));
        }));
    }

    for (int i = 1; i <= 3; ++i) {
        auto result = futures[i - 1].get();
        ASSERT_TRUE(result.exit_code.has_value());
        EXPECT_EQ(*result.exit_code, 0);
        EXPECT_EQ(result.output.find("racing"), std::string::npos);
        EXPECT_NE(result.output.find("cmd" + std::to_string(i) + " done"), std::string::npos);
    }
    EXPECT_EQ(session->CommandsHistory().size(), 3u);
}

TEST_F(SandboxSessionTest, ReadOnlyRejectsWrites) {
    config_.read_only = true;
    auto session = MakeSession();

    auto rejected = session->ExecuteBashCommand("touch created.txt");

    EXPECT_EQ(rejected.output, SandboxSession::kReadOnlyRejection);
    EXPECT_FALSE(rejected.exit_code.has_value());
    EXPECT_FALSE(fs::exists(repo_dir_ / "created.txt"));
    EXPECT_TRUE(session->CommandsHistory().empty());
    EXPECT_TRUE(client_.LastConfig().mounts[0].read_only);

    auto allowed = session->ExecuteBashCommand("ls");
    EXPECT_EQ(*allowed.exit_code, 0);
    EXPECT_EQ(session->CommandsHistory().size(), 1u);
}

TEST_F(SandboxSessionTest, HistoryCanBeSkipped) {
    auto session = MakeSession();

    session->ExecuteBashCommand("echo hidden", false);
    session->ExecuteBashCommand("echo shown");

    auto history = session->CommandsHistory();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].command, "echo shown");
    EXPECT_EQ(history[0].output, "shown");

    json j = history[0].ToJson();
    EXPECT_EQ(j.at("exit_code"), 0);
    EXPECT_TRUE(j.at("timestamp").is_string());
}

TEST_F(SandboxSessionTest, EngineFailureRecovers) {
    auto session = MakeSession();
    client_.exec_engine_failures = 1;

    auto failed = session->ExecuteBashCommand("echo unreachable");
    EXPECT_FALSE(failed.exit_code.has_value());
    EXPECT_EQ(failed.output.rfind("ERROR: Container failure:", 0), 0u);
    EXPECT_EQ(client_.creates.load(), 2);

    auto next = session->ExecuteBashCommand("echo back");
    EXPECT_EQ(next.output, "back");
}

TEST_F(SandboxSessionTest, InitialCommandsRunAndAreRecorded) {
    config_.initial_commands = {"export FROM_INIT=1", "true"};
    auto session = MakeSession();

    EXPECT_EQ(session->CommandsHistory().size(), 2u);
    EXPECT_EQ(session->ExecuteBashCommand("echo $FROM_INIT").output, "1");
}

TEST_F(SandboxSessionTest, FailingInitialCommandThrows) {
    config_.initial_commands = {"exit 3"};

    EXPECT_THROW(MakeSession(), std::runtime_error);
    EXPECT_EQ(client_.LiveContainers(), 0u);
}

TEST_F(SandboxSessionTest, CleanIsIdempotent) {
    auto session = MakeSession();
    EXPECT_EQ(client_.LiveContainers(), 1u);

    session->Clean();
    session->Clean();

    EXPECT_TRUE(session->IsClean());
    EXPECT_EQ(client_.LiveContainers(), 0u);
    EXPECT_EQ(client_.removes.load(), 1);
    EXPECT_THROW(session->ExecuteBashCommand("echo late"), std::logic_error);
}

TEST_F(SandboxSessionTest, DestructorRemovesContainer) {
    {
        auto session = MakeSession();
        EXPECT_EQ(client_.LiveContainers(), 1u);
    }
    EXPECT_EQ(client_.LiveContainers(), 0u);
}

} // namespace
} // namespace core
} // namespace envbox
