#include <gtest/gtest.h>

#include "sandpool/core/errors.hpp"
#include "sandpool/core/isolation_manager.hpp"
#include "support/fake_docker_runner.hpp"

#include <algorithm>
#include <memory>

namespace sandpool {
namespace {

using core::IsolationManager;
using test_support::FakeDockerRunner;

/// Engine whose removals fail with a busy error rather than "not found"
class BusyRemovalRunner : public utils::CommandRunner {
public:
    utils::CommandResult Run(const std::vector<std::string>& args,
                             std::chrono::milliseconds) override {
        utils::CommandResult result;
        if (args.size() >= 2 && args[1] == "rm") {
            result.exit_code = 1;
            result.stderr_output = "Error response from daemon: error while removing network: "
                                   "network has active endpoints";
            return result;
        }
        result.success = true;
        result.stdout_output = args.back() + "\n";
        return result;
    }
};

class IsolationManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner = std::make_shared<FakeDockerRunner>();
        isolation = std::make_unique<IsolationManager>(std::make_shared<utils::ContainerUtils>(runner));
    }

    std::shared_ptr<FakeDockerRunner> runner;
    std::unique_ptr<IsolationManager> isolation;
};

TEST_F(IsolationManagerTest, NamesDeriveFromOwner) {
    EXPECT_EQ(IsolationManager::NetworkName("coder-1"), "sandpool-net-coder-1");
    EXPECT_EQ(IsolationManager::VolumeName("coder-1"), "sandpool-vol-coder-1");
}

TEST_F(IsolationManagerTest, CreatesLabelledInternalNetwork) {
    auto network = isolation->CreateIsolatedNetwork("coder-1");

    EXPECT_EQ(network, "sandpool-net-coder-1");
    EXPECT_EQ(isolation->LiveNetworkCount(), 1u);
    EXPECT_EQ(runner->LiveNetworks(), 1u);

    auto call = runner->LastCall("network");
    EXPECT_NE(std::find(call.begin(), call.end(), "--internal"), call.end());
    EXPECT_NE(std::find(call.begin(), call.end(), "sandpool.owner=coder-1"), call.end());
    EXPECT_NE(std::find(call.begin(), call.end(), "sandpool.pool=true"), call.end());
}

TEST_F(IsolationManagerTest, TracksUntilRemoved) {
    auto network = isolation->CreateIsolatedNetwork("a");
    auto volume = isolation->CreateIsolatedVolume("a");
    EXPECT_EQ(isolation->LiveVolumeCount(), 1u);

    isolation->RemoveNetwork(network);
    isolation->RemoveVolume(volume);

    EXPECT_EQ(isolation->LiveNetworkCount(), 0u);
    EXPECT_EQ(isolation->LiveVolumeCount(), 0u);
    EXPECT_EQ(runner->LiveNetworks(), 0u);
    EXPECT_EQ(runner->LiveVolumes(), 0u);
}

TEST_F(IsolationManagerTest, CreationFailureIsTyped) {
    runner->SetFailNetworkCreate(true);
    EXPECT_THROW(isolation->CreateIsolatedNetwork("a"), core::ResourceCreationError);
    EXPECT_EQ(isolation->LiveNetworkCount(), 0u);

    runner->SetFailVolumeCreate(true);
    EXPECT_THROW(isolation->CreateIsolatedVolume("a"), core::ResourceCreationError);
    EXPECT_EQ(isolation->LiveVolumeCount(), 0u);
}

TEST_F(IsolationManagerTest, MissingResourceCountsAsRemoved) {
    EXPECT_NO_THROW(isolation->RemoveNetwork("sandpool-net-ghost"));
    EXPECT_NO_THROW(isolation->RemoveVolume("sandpool-vol-ghost"));
    EXPECT_NO_THROW(isolation->RemoveNetwork(""));
}

TEST_F(IsolationManagerTest, OtherRemovalErrorsPropagate) {
    IsolationManager busy(std::make_shared<utils::ContainerUtils>(std::make_shared<BusyRemovalRunner>()));
    auto network = busy.CreateIsolatedNetwork("a");

    EXPECT_THROW(busy.RemoveNetwork(network), core::RuntimeError);
    EXPECT_EQ(busy.LiveNetworkCount(), 1u);
}

TEST_F(IsolationManagerTest, ReleaseAllSweepsLeftovers) {
    isolation->CreateIsolatedNetwork("a");
    isolation->CreateIsolatedNetwork("b");
    isolation->CreateIsolatedVolume("a");

    EXPECT_EQ(isolation->ReleaseAll(), 0u);
    EXPECT_EQ(runner->LiveNetworks(), 0u);
    EXPECT_EQ(runner->LiveVolumes(), 0u);
    EXPECT_EQ(isolation->LiveNetworkCount(), 0u);
}

TEST_F(IsolationManagerTest, ReleaseAllCountsFailures) {
    IsolationManager busy(std::make_shared<utils::ContainerUtils>(std::make_shared<BusyRemovalRunner>()));
    busy.CreateIsolatedNetwork("a");
    busy.CreateIsolatedVolume("a");

    EXPECT_EQ(busy.ReleaseAll(), 2u);
}

} // namespace
} // namespace sandpool
