#include <gtest/gtest.h>

#include "lib/tc_backend.h"
#include "test_helpers.h"

class TcBackendTest : public ::testing::Test {
protected:
    ScriptedCommandRunner runner;
    TcBackend backend{runner};

    static ShapingParams mediumEgress() {
        ShapingParams params;
        params.meanDelayMs = 80;
        params.jitterMs = 20;
        params.jitterDistribution = JitterDistribution::Normal;
        params.lossPercent = 10;
        params.lossCorrelationPercent = 30;
        return params;
    }
};

TEST_F(TcBackendTest, CreatesRedirectInterface) {
    BackendResult result = backend.createRedirectInterface("ifb0");

    EXPECT_EQ(result.status, BackendStatus::Ok);
    std::vector<std::string> expected = {
        "modprobe ifb",
        "ip link add ifb0 type ifb",
        "ip link set ifb0 up",
    };
    EXPECT_EQ(runner.commands, expected);
}

TEST_F(TcBackendTest, ExistingRedirectInterfaceIsAlreadyInState) {
    runner.script("ip link add ifb0 type ifb", 2, "RTNETLINK answers: File exists\n");

    BackendResult result = backend.createRedirectInterface("ifb0");

    EXPECT_EQ(result.status, BackendStatus::AlreadyInState);
    EXPECT_EQ(result.command, "ip link add ifb0 type ifb");
    // still brought up
    EXPECT_EQ(runner.commands.back(), "ip link set ifb0 up");
}

TEST_F(TcBackendTest, ModprobeFailureDoesNotStopSetup) {
    runner.script("modprobe ifb", 1, "modprobe: ERROR: could not insert 'ifb': Operation not permitted\n");

    BackendResult result = backend.createRedirectInterface("ifb0");

    EXPECT_EQ(result.status, BackendStatus::Failed);
    EXPECT_EQ(result.command, "modprobe ifb");
    EXPECT_EQ(runner.commands.size(), 3u);
}

TEST_F(TcBackendTest, InstallsIngressRedirect) {
    BackendResult result = backend.installIngressRedirect("wlp2s0", "ifb0");

    EXPECT_EQ(result.status, BackendStatus::Ok);
    std::vector<std::string> expected = {
        "tc qdisc add dev wlp2s0 ingress",
        "tc filter replace dev wlp2s0 parent ffff: protocol ip pref 1 handle 800::800 u32 "
        "match u32 0 0 action mirred egress redirect dev ifb0",
    };
    EXPECT_EQ(runner.commands, expected);
}

TEST_F(TcBackendTest, RepeatedIngressRedirectReplacesTheSameFilter) {
    backend.installIngressRedirect("wlp2s0", "ifb0");
    runner.script("tc qdisc add dev wlp2s0 ingress", 2, "Error: Exclusivity flag on, cannot modify.\n");
    BackendResult second = backend.installIngressRedirect("wlp2s0", "ifb0");

    EXPECT_EQ(second.status, BackendStatus::AlreadyInState);
    ASSERT_EQ(runner.commands.size(), 4u);
    // both calls address the one pinned filter; nothing uses "filter add"
    EXPECT_EQ(runner.commands[1], runner.commands[3]);
    for (const std::string& command : runner.commands) {
        EXPECT_EQ(command.find("tc filter add"), std::string::npos) << command;
    }
}

TEST_F(TcBackendTest, FailedFilterReplaceIsAFailure) {
    runner.script("tc filter replace dev wlp2s0 parent ffff: protocol ip pref 1 handle 800::800 u32 "
                  "match u32 0 0 action mirred egress redirect dev ifb0",
                  2, "RTNETLINK answers: File exists\n");

    EXPECT_EQ(backend.installIngressRedirect("wlp2s0", "ifb0").status, BackendStatus::Failed);
}

TEST_F(TcBackendTest, InstallsNetemRootQdisc) {
    BackendResult result = backend.installEgressShaping("wlp2s0", mediumEgress());

    EXPECT_EQ(result.status, BackendStatus::Ok);
    ASSERT_EQ(runner.commands.size(), 1u);
    EXPECT_EQ(runner.commands[0],
              "tc qdisc replace dev wlp2s0 root netem delay 80ms 20ms distribution normal loss 10% 30%");
}

TEST_F(TcBackendTest, LeftoverRootQdiscIsNotMistakenForTheRequestedOne) {
    ShapingParams bad;
    bad.meanDelayMs = 150;
    bad.jitterMs = 40;
    bad.jitterDistribution = JitterDistribution::Normal;
    bad.lossPercent = 15;
    bad.lossCorrelationPercent = 30;
    runner.script("tc qdisc replace dev wlp2s0 root netem delay 150ms 40ms distribution normal loss 15% 30%", 2,
                  "Error: Exclusivity flag on, cannot modify.\n");

    BackendResult result = backend.installEgressShaping("wlp2s0", bad);

    EXPECT_EQ(result.status, BackendStatus::Failed);
}

TEST_F(TcBackendTest, RootQdiscFileExistsIsAFailure) {
    runner.script("tc qdisc replace dev wlp2s0 root netem delay 80ms 20ms distribution normal loss 10% 30%", 2,
                  "RTNETLINK answers: File exists\n");

    EXPECT_EQ(backend.installEgressShaping("wlp2s0", mediumEgress()).status, BackendStatus::Failed);
}

TEST_F(TcBackendTest, InvalidParametersRunNothing) {
    ShapingParams params;
    params.lossPercent = 120;

    BackendResult result = backend.installEgressShaping("wlp2s0", params);

    EXPECT_EQ(result.status, BackendStatus::Failed);
    EXPECT_TRUE(runner.commands.empty());
    // the command that would have run is still reported
    EXPECT_EQ(result.command, "tc qdisc replace dev wlp2s0 root netem loss 120%");
    EXPECT_EQ(result.detail, "loss must be between 0 and 100 percent");
}

TEST_F(TcBackendTest, RemovingAbsentQdiscIsAlreadyInState) {
    runner.script("tc qdisc del dev wlp2s0 root", 2,
                  "Error: Cannot delete qdisc with handle of zero.\n");
    runner.script("tc qdisc del dev wlp2s0 ingress", 2, "Error: Invalid handle.\n");
    runner.script("tc qdisc del dev ifb0 root", 1, "Cannot find device \"ifb0\"\n");

    EXPECT_EQ(backend.removeShaping("wlp2s0").status, BackendStatus::AlreadyInState);
    EXPECT_EQ(backend.removeIngressRedirect("wlp2s0").status, BackendStatus::AlreadyInState);
    EXPECT_EQ(backend.removeShaping("ifb0").status, BackendStatus::AlreadyInState);
}

TEST_F(TcBackendTest, OlderTcNotFoundMessage) {
    runner.script("tc qdisc del dev wlp2s0 root", 2, "RTNETLINK answers: No such file or directory\n");

    EXPECT_EQ(backend.removeShaping("wlp2s0").status, BackendStatus::AlreadyInState);
}

TEST_F(TcBackendTest, DestroysRedirectInterface) {
    runner.script("ip link del ifb0", 1, "Cannot find device \"ifb0\"\n");

    BackendResult result = backend.destroyRedirectInterface("ifb0");

    EXPECT_EQ(result.status, BackendStatus::AlreadyInState);
    ASSERT_EQ(runner.commands.size(), 1u);
    EXPECT_EQ(runner.commands[0], "ip link del ifb0");
}

TEST_F(TcBackendTest, PermissionDeniedIsAFailure) {
    runner.script("tc qdisc del dev wlp2s0 root", 2, "RTNETLINK answers: Operation not permitted\n");

    BackendResult result = backend.removeShaping("wlp2s0");

    EXPECT_EQ(result.status, BackendStatus::Failed);
    EXPECT_EQ(result.detail, "RTNETLINK answers: Operation not permitted\n");
}

TEST_F(TcBackendTest, MissingDeviceOnAddIsAFailure) {
    runner.script("tc qdisc replace dev eth9 root netem delay 80ms 20ms distribution normal loss 10% 30%", 1,
                  "Cannot find device \"eth9\"\n");

    EXPECT_EQ(backend.installEgressShaping("eth9", mediumEgress()).status, BackendStatus::Failed);
}

TEST_F(TcBackendTest, ExistingQdiscOnAddIsAlreadyInState) {
    runner.script("tc qdisc add dev wlp2s0 ingress", 2, "Error: Exclusivity flag on, cannot modify.\n");

    BackendResult result = backend.installIngressRedirect("wlp2s0", "ifb0");

    EXPECT_EQ(result.status, BackendStatus::AlreadyInState);
    EXPECT_EQ(runner.commands.size(), 2u);
}

TEST_F(TcBackendTest, CommandThatCouldNotStartIsAFailure) {
    runner.script("tc qdisc del dev wlp2s0 root", -1, "No such file or directory");

    EXPECT_EQ(backend.removeShaping("wlp2s0").status, BackendStatus::Failed);
}

TEST(MergeResultsTest, FailureWinsOverBenign) {
    BackendResult ok;
    BackendResult benign;
    benign.status = BackendStatus::AlreadyInState;
    benign.command = "benign";
    BackendResult failed;
    failed.status = BackendStatus::Failed;
    failed.command = "failed";

    EXPECT_EQ(mergeResults({ok, benign, failed}).command, "failed");
    EXPECT_EQ(mergeResults({ok, benign}).command, "benign");
    EXPECT_EQ(mergeResults({ok}).status, BackendStatus::Ok);
}
