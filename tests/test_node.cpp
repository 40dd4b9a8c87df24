#include <gtest/gtest.h>
#include <glog/logging.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include <../src/core/protocol.hpp>
#include <../src/network/network.hpp>
#include <../src/node/node.hpp>

using namespace std::chrono_literals;


static TimingConfig fast_timing() {
    TimingConfig timing;
    timing.round_window = 20ms;
    timing.round_gap = 5ms;
    timing.readiness_poll = 5ms;
    return timing;
}

static bool wait_until(const std::function<bool()>& done, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

static auto always_ready = [] { return true; };


TEST(BenOrNode, FaultyNodeIsUnavailable) {
    TimerNetwork net;
    BenOrNode node({0, QuorumConfig(3, 1), Value::One, FailStop, fast_timing()}, net, always_ready);
    node.run();

    EXPECT_EQ(node.status(), NodeHealth::Faulty);
    EXPECT_EQ(json(node.status()), "faulty");
    EXPECT_FALSE(node.submit_message({Phase::R, 1, 0, Value::One}));
    EXPECT_FALSE(node.start().has_value());

    json state = node.snapshot();
    EXPECT_TRUE(state["currentValue"].is_null());
    EXPECT_TRUE(state["decided"].is_null());
    EXPECT_TRUE(state["round"].is_null());

    node.shutdown();
    net.shutdown();
}

TEST(BenOrNode, StoppedNodeRejectsEverything) {
    TimerNetwork net;
    BenOrNode node({0, QuorumConfig(3, 1), Value::Zero, Fair, fast_timing()}, net, always_ready);
    node.run();

    EXPECT_EQ(node.status(), NodeHealth::Live);
    EXPECT_TRUE(node.submit_message({Phase::R, 1, 0, Value::One}));

    node.stop();
    NodeConsensusState once = node.snapshot();
    node.stop();
    NodeConsensusState twice = node.snapshot();

    EXPECT_TRUE(once.stopped);
    EXPECT_EQ(once, twice);
    EXPECT_FALSE(node.submit_message({Phase::R, 2, 0, Value::One}));
    EXPECT_FALSE(node.start().has_value());

    node.shutdown();
    net.shutdown();
}

TEST(BenOrNode, SingleNodeDecidesImmediately) {
    TimerNetwork net;
    BenOrNode node({0, QuorumConfig(1, 0), Value::One, Fair, fast_timing()}, net, always_ready);
    node.run();

    ASSERT_TRUE(node.start().has_value());
    ASSERT_TRUE(wait_until([&node] { return node.snapshot().decided; }));

    NodeConsensusState state = node.snapshot();
    EXPECT_EQ(state.current_value, Value::One);
    EXPECT_EQ(state.round, 0u);
    EXPECT_EQ(node.get_metrics().decided_round, 0u);

    node.shutdown();
    net.shutdown();
}

TEST(BenOrNode, SingleNodeWithoutValueDecidesBinary) {
    TimerNetwork net;
    NodeConfig config{0, QuorumConfig(1, 0)};
    config.timing = fast_timing();
    ASSERT_EQ(config.initial_value, Value::Unknown);

    BenOrNode node(config, net, always_ready);
    node.run();

    ASSERT_TRUE(node.start().has_value());
    ASSERT_TRUE(wait_until([&node] { return node.snapshot().decided; }));

    NodeConsensusState state = node.snapshot();
    ASSERT_TRUE(state.current_value.has_value());
    EXPECT_NE(*state.current_value, Value::Unknown);
    EXPECT_TRUE(json(state)["currentValue"].is_number_integer());

    node.shutdown();
    net.shutdown();
}

TEST(BenOrNode, StaleRoundsAreNotStored) {
    TimerNetwork net;
    // F > N/2 and no peers: rounds keep advancing on coin flips
    BenOrNode node({0, QuorumConfig(3, 2), Value::One, Fair, fast_timing()}, net, always_ready);
    node.run();

    ASSERT_TRUE(node.start().has_value());
    ASSERT_TRUE(wait_until([&node] { return node.snapshot().round >= 3; }));

    EXPECT_TRUE(node.submit_message({Phase::R, 1, 0, Value::One}));
    EXPECT_TRUE(node.submit_message({Phase::P, 2, 1, Value::Zero}));

    std::vector<uint32_t> rounds = node.stored_rounds();
    ASSERT_FALSE(rounds.empty());
    EXPECT_GE(rounds.front(), 2u);
    EXPECT_LE(rounds.size(), 2u);

    node.shutdown();
    net.shutdown();
}

TEST(BenOrNode, DecidedNodeStoresNothingMore) {
    TimerNetwork net;
    BenOrNode node({0, QuorumConfig(1, 0), Value::Zero, Fair, fast_timing()}, net, always_ready);
    node.run();

    ASSERT_TRUE(node.start().has_value());
    ASSERT_TRUE(wait_until([&node] { return node.snapshot().decided; }));
    std::vector<uint32_t> before = node.stored_rounds();

    for (uint32_t round = 1; round < 50; ++round) {
        EXPECT_TRUE(node.submit_message({Phase::R, 1, round, Value::One}));
    }
    EXPECT_EQ(node.stored_rounds(), before);

    node.shutdown();
    net.shutdown();
}

TEST(BenOrNode, CallsAfterTransportStopReturn) {
    TimerNetwork net;
    BenOrNode node({0, QuorumConfig(3, 1), Value::One, Fair, fast_timing()}, net, always_ready);
    node.run();

    // the event loop exits before the node is shut down
    net.shutdown();

    NodeConsensusState state = node.snapshot();
    EXPECT_FALSE(state.decided);
    EXPECT_TRUE(node.submit_message({Phase::R, 1, 0, Value::One}));
    EXPECT_EQ(node.stored_rounds(), (std::vector<uint32_t>{0}));

    node.shutdown();
}

TEST(BenOrNode, StartWaitsForReadiness) {
    TimerNetwork net;
    std::atomic<bool> ready{false};
    BenOrNode node({0, QuorumConfig(1, 0), Value::Zero, Fair, fast_timing()}, net,
                   [&ready] { return ready.load(); });
    node.run();

    ASSERT_TRUE(node.start().has_value());
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(node.snapshot().decided);
    EXPECT_EQ(node.get_metrics().rounds_number, 0u);

    ready = true;
    EXPECT_TRUE(wait_until([&node] { return node.snapshot().decided; }));

    node.shutdown();
    net.shutdown();
}

TEST(BenOrNode, PeersExchangeMessages) {
    TimerNetwork net(200us);
    TimingConfig timing = fast_timing();
    timing.round_window = 50ms;

    std::vector<std::unique_ptr<BenOrNode>> nodes;
    for (uint32_t i = 0; i < 3; ++i) {
        nodes.emplace_back(std::make_unique<BenOrNode>(
            NodeConfig{i, QuorumConfig(3, 0), Value::Zero, Fair, timing}, net, always_ready));
    }
    for (auto& node : nodes) {
        node->run();
    }
    for (auto& node : nodes) {
        node->start();
    }

    // N - F = 3, nobody decides without hearing both peers
    for (auto& node : nodes) {
        ASSERT_TRUE(wait_until([&node] { return node->snapshot().decided; }));
        EXPECT_EQ(node->snapshot().current_value, Value::Zero);
    }

    for (auto& node : nodes) {
        node->shutdown();
    }
    net.shutdown();
}

TEST(BenOrNode, MalformedTrafficIsDropped) {
    TimerNetwork net(100us);
    BenOrNode node({0, QuorumConfig(2, 1), Value::One, Fair, fast_timing()}, net, always_ready);
    // a raw peer without a node behind it
    IChannel& peer = net.add_node(1);
    node.run();

    auto receivers = net.get_nodes();
    ASSERT_TRUE(receivers.contains(0));
    receivers.at(0).send(Message(BEN_OR_MSG_TYPE, json{{"phase", "X"}}, 1, 0));
    // well-formed payload under a foreign type
    receivers.at(0).send(Message("RB_ECHO", json(ProtocolMessage{Phase::R, 1, 0, Value::Zero}), 1, 0));

    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(node.stored_rounds().empty());

    EXPECT_TRUE(node.submit_message({Phase::R, 1, 0, Value::One}));
    EXPECT_EQ(node.stored_rounds(), (std::vector<uint32_t>{0}));

    peer.stop();
    node.shutdown();
    net.shutdown();
}

int main(int argc, char **argv) {
    FLAGS_v = -1;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
