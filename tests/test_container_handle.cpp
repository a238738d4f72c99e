#include <gtest/gtest.h>

#include "envbox/core/container_handle.hpp"
#include "fake_container_client.hpp"

#include <stdexcept>

namespace envbox {
namespace core {
namespace {

utils::ContainerConfig MakeConfig() {
    utils::ContainerConfig config;
    config.image = "envbox/test:latest";
    config.name = "envbox-handle-test";
    config.command = {"sleep", "infinity"};
    return config;
}

TEST(ContainerHandleTest, CreateStartExec) {
    test_support::FakeContainerClient client;
    ContainerHandle handle(client, MakeConfig());

    handle.Create(std::chrono::seconds(5));
    EXPECT_EQ(handle.State(), utils::ContainerState::CREATED);
    EXPECT_FALSE(handle.Id().empty());

    handle.Start();
    EXPECT_TRUE(handle.IsRunning());

    auto result = handle.Exec("echo hi; exit 3", std::chrono::seconds(5));
    EXPECT_EQ(result.output, "hi\n");
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 3);
}

TEST(ContainerHandleTest, MissingImageIsPulledOnce) {
    test_support::FakeContainerClient client;
    client.image_present = false;
    ContainerHandle handle(client, MakeConfig());

    handle.Create(std::nullopt);

    EXPECT_EQ(client.pulls.load(), 1);
    EXPECT_EQ(client.creates.load(), 1);
}

TEST(ContainerHandleTest, PullFailureCreatesNothing) {
    test_support::FakeContainerClient client;
    client.image_present = false;
    client.pull_fails = true;
    ContainerHandle handle(client, MakeConfig());

    EXPECT_THROW(handle.Create(std::nullopt), utils::ImagePullError);
    EXPECT_EQ(client.creates.load(), 0);
    EXPECT_TRUE(handle.Id().empty());
}

TEST(ContainerHandleTest, CreateTimeoutPropagates) {
    test_support::FakeContainerClient client;
    client.create_times_out = true;
    ContainerHandle handle(client, MakeConfig());

    EXPECT_THROW(handle.Create(std::chrono::seconds(1)), utils::ContainerCreateTimeout);
}

TEST(ContainerHandleTest, ExecTimeoutHasNoExitCode) {
    test_support::FakeContainerClient client;
    ContainerHandle handle(client, MakeConfig());
    handle.Create(std::nullopt);
    handle.Start();

    auto result = handle.Exec("sleep 10", std::chrono::milliseconds(200));

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.exit_code.has_value());
}

TEST(ContainerHandleTest, MisuseIsLogicError) {
    test_support::FakeContainerClient client;
    ContainerHandle handle(client, MakeConfig());

    EXPECT_THROW(handle.Exec("true", std::nullopt), std::logic_error);
    EXPECT_THROW(handle.Start(), std::logic_error);

    handle.Create(std::nullopt);
    EXPECT_THROW(handle.Create(std::nullopt), std::logic_error);
}

TEST(ContainerHandleTest, RestartReplacesContainer) {
    test_support::FakeContainerClient client;
    ContainerHandle handle(client, MakeConfig());
    handle.Create(std::nullopt);
    handle.Start();
    std::string first = handle.Id();

    handle.Restart(std::nullopt);

    EXPECT_NE(handle.Id(), first);
    EXPECT_TRUE(handle.IsRunning());
    EXPECT_FALSE(client.ContainerExists(first));
    EXPECT_EQ(client.LiveContainers(), 1u);
    EXPECT_EQ(client.LastConfig().image, "envbox/test:latest");
}

TEST(ContainerHandleTest, DestroyIsIdempotent) {
    test_support::FakeContainerClient client;
    ContainerHandle handle(client, MakeConfig());
    handle.Create(std::nullopt);

    handle.Destroy();
    handle.Destroy();

    EXPECT_EQ(client.removes.load(), 1);
    EXPECT_EQ(handle.State(), utils::ContainerState::REMOVED);
}

TEST(ContainerHandleTest, DestructorRemovesLiveContainer) {
    test_support::FakeContainerClient client;
    {
        ContainerHandle handle(client, MakeConfig());
        handle.Create(std::nullopt);
        handle.Start();
        EXPECT_EQ(client.LiveContainers(), 1u);
    }
    EXPECT_EQ(client.LiveContainers(), 0u);
}

} // namespace
} // namespace core
} // namespace envbox
