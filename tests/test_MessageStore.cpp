#include <gtest/gtest.h>
#include <glog/logging.h>

#include <algorithm>

#include <../src/consensus/MessageStore.hpp>


static size_t count_value(const std::vector<ProtocolMessage>& msgs, Value value) {
    return std::count_if(msgs.begin(), msgs.end(), [value](const ProtocolMessage& msg) {
        return msg.value == value;
    });
}

TEST(MessageStore, SeparatesRoundsAndPhases) {
    MessageStore store;
    store.record({Phase::R, 0, 0, Value::One});
    store.record({Phase::R, 1, 0, Value::Zero});
    store.record({Phase::P, 0, 0, Value::One});
    store.record({Phase::R, 0, 1, Value::Zero});

    EXPECT_EQ(store.read(0, Phase::R).size(), 2u);
    EXPECT_EQ(store.read(0, Phase::P).size(), 1u);
    EXPECT_EQ(store.read(1, Phase::R).size(), 1u);
    EXPECT_TRUE(store.read(1, Phase::P).empty());
    EXPECT_TRUE(store.read(5, Phase::R).empty());
    EXPECT_FALSE(store.has_round(5));
}

TEST(MessageStore, LastWritePerSenderWins) {
    MessageStore store;
    store.record({Phase::R, 2, 0, Value::Zero});
    store.record({Phase::R, 2, 0, Value::One});
    store.record({Phase::R, 3, 0, Value::One});

    auto msgs = store.read(0, Phase::R);
    EXPECT_EQ(msgs.size(), 2u);
    EXPECT_EQ(count_value(msgs, Value::One), 2u);
    EXPECT_EQ(count_value(msgs, Value::Zero), 0u);
}

TEST(MessageStore, PruneKeepsPreviousRound) {
    MessageStore store;
    for (uint32_t round = 0; round < 6; ++round) {
        store.record({Phase::R, 0, round, Value::One});
        store.record({Phase::P, 0, round, Value::One});
    }

    store.prune(4);
    EXPECT_EQ(store.rounds(), (std::vector<uint32_t>{3, 4, 5}));
    EXPECT_EQ(store.read(3, Phase::P).size(), 1u);
    EXPECT_TRUE(store.read(2, Phase::R).empty());

    // a bound at or below the oldest round removes nothing
    store.prune(4);
    store.prune(0);
    EXPECT_EQ(store.rounds(), (std::vector<uint32_t>{3, 4, 5}));
}

TEST(MessageStore, LateMessagesForPrunedRoundsAreIgnored) {
    MessageStore store;
    for (uint32_t round = 0; round < 1000; ++round) {
        EXPECT_TRUE(store.record({Phase::R, 0, round, Value::One}));
    }
    store.prune(1000);

    for (uint32_t round = 0; round < 500; ++round) {
        EXPECT_FALSE(store.record({Phase::P, 1, round, Value::Zero}));
    }
    EXPECT_EQ(store.rounds(), (std::vector<uint32_t>{999}));

    // the previous round still takes messages, a smaller bound does not lower the floor
    EXPECT_TRUE(store.record({Phase::P, 1, 999, Value::Zero}));
    store.prune(3);
    EXPECT_FALSE(store.record({Phase::R, 2, 2, Value::One}));
    EXPECT_EQ(store.rounds(), (std::vector<uint32_t>{999}));
}

int main(int argc, char **argv) {
    FLAGS_v = -1;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
