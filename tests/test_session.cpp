#include <gtest/gtest.h>
#include <string>
#include "encoder.h"
#include "huffman.hpp"
#include "tracking_resource.h"

TEST(SessionTest, ReferenceVector) {
    Session session = create_session();
    std::string encoded = session.encode(std::string("abcaabbaaaccaaaa"));

    EXPECT_EQ(encoded, "1000111000011101011111");
    EXPECT_EQ(encoded.size(), 22u);
    EXPECT_EQ(session.state(), SessionState::Done);
}

TEST(SessionTest, SingleSymbolEncodesToOnes) {
    Session session;
    std::vector<uint8_t> input(37, 'x');

    EXPECT_EQ(encode(session, input), std::string(37, '1'));
    EXPECT_EQ(session.node_count(), 1u);
    EXPECT_EQ(session.code_table().size(), 1u);
}

TEST(SessionTest, SingleByteInput) {
    Session session;
    EXPECT_EQ(session.encode(std::string("\x00", 1)), "1");
}

TEST(SessionTest, EmptyInputFailsBeforeBuildingAnything) {
    TrackingResource resource;
    Session session = create_session(&resource);

    EXPECT_THROW(encode(session, std::vector<uint8_t>()), EmptyInputError);
    EXPECT_EQ(session.state(), SessionState::Failed);
    EXPECT_EQ(session.node_count(), 0u);
    EXPECT_EQ(resource.total_allocations(), 0u);
}

TEST(SessionTest, EmptyInputIsAHuffmanError) {
    Session session;
    EXPECT_THROW(session.encode(std::string()), HuffmanError);
}

TEST(SessionTest, TableIsPrefixFreeAndLengthsAddUp) {
    std::vector<std::string> inputs = {
        "ab",
        "aaab",
        "mississippi river",
        "abcdefghijklmnopqrstuvwxyz",
        std::string(1000, 'z') + "y" + std::string(3, 'w'),
    };

    Session session;
    for (const auto& input : inputs) {
        std::string encoded = session.encode(input);

        EXPECT_TRUE(is_prefix_free(session.code_table())) << input;
        EXPECT_EQ(encoded.size(), encoded_length(session.frequencies(), session.code_table())) << input;
        EXPECT_EQ(frequency_total(session.frequencies()), input.size()) << input;
        EXPECT_EQ(session.code_table().size(), distinct_symbols(session.frequencies())) << input;
    }
}

TEST(SessionTest, NodeCountMatchesDistinctSymbols) {
    Session session;

    session.encode(std::string("aaaa"));
    EXPECT_EQ(session.node_count(), 1u);

    session.encode(std::string("abcaabbaaaccaaaa"));
    EXPECT_EQ(session.node_count(), 5u);

    std::vector<uint8_t> all;
    for (int i = 0; i < 256; i++) all.push_back(static_cast<uint8_t>(i));
    session.encode(all);
    EXPECT_EQ(session.node_count(), 511u);
}

TEST(SessionTest, OutputIsReproducible) {
    std::string text = "reproducible output across runs and sessions";

    Session first;
    Session second;
    std::string a = first.encode(text);
    std::string b = second.encode(text);
    std::string c = first.encode(text);

    EXPECT_EQ(a, b);
    EXPECT_EQ(a, c);
}

TEST(SessionTest, ResetReturnsToIdle) {
    Session session;
    session.encode(std::string("hello"));
    ASSERT_EQ(session.state(), SessionState::Done);

    reset_or_destroy(session);
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_TRUE(session.code_table().empty());
    EXPECT_EQ(session.node_count(), 0u);
    EXPECT_EQ(distinct_symbols(session.frequencies()), 0u);
}

TEST(SessionTest, FailedSessionCanBeReused) {
    Session session;
    EXPECT_THROW(session.encode(std::string()), EmptyInputError);

    EXPECT_EQ(session.encode(std::string("abcaabbaaaccaaaa")), "1000111000011101011111");
    EXPECT_EQ(session.state(), SessionState::Done);
}

TEST(SessionTest, NodesAreReleasedOnceCodesAreExtracted) {
    TrackingResource resource;
    Session session(&resource);

    std::vector<uint8_t> input;
    for (int i = 0; i < 1024; i++) input.push_back(static_cast<uint8_t>(i % 200));
    session.encode(input);

    // only the code table is left: the slot vector plus codes past the small string buffer
    size_t table_blocks = resource.outstanding_blocks();
    reset_or_destroy(session);
    EXPECT_EQ(resource.outstanding_blocks(), 0u);
    EXPECT_GE(table_blocks, 1u);
}

TEST(SessionTest, RepeatedCyclesLeaveNothingOutstanding) {
    TrackingResource resource;

    for (int round = 0; round < 50; round++) {
        Session session = create_session(&resource);

        std::vector<uint8_t> input;
        for (int i = 0; i < 300 + round * 17; i++)
            input.push_back(static_cast<uint8_t>((i * (round + 3)) % (round + 2)));

        std::string encoded = encode(session, input);
        EXPECT_FALSE(encoded.empty());
        EXPECT_GT(resource.outstanding_blocks(), 0u);

        reset_or_destroy(session);
        EXPECT_EQ(resource.outstanding_blocks(), 0u) << "round " << round;
        EXPECT_EQ(resource.outstanding_bytes(), 0u) << "round " << round;
    }
}

TEST(SessionTest, DestructionReleasesEverything) {
    TrackingResource resource;
    {
        Session session(&resource);
        session.encode(std::string("destroyed without an explicit reset"));
    }
    EXPECT_EQ(resource.outstanding_blocks(), 0u);
}

TEST(SessionTest, ExhaustedResourceIsAllocationFailure) {
    TrackingResource resource(64);
    Session session(&resource);

    std::vector<uint8_t> input;
    for (int i = 0; i < 256; i++) input.push_back(static_cast<uint8_t>(i));

    EXPECT_THROW(session.encode(input), AllocationFailure);
    EXPECT_EQ(session.state(), SessionState::Failed);

    reset_or_destroy(session);
    EXPECT_EQ(resource.outstanding_blocks(), 0u);
}

TEST(SessionTest, CodeTableExhaustingResourceIsAllocationFailure) {
    // room for the three nodes of "ab" but not for the 256 code slots
    TrackingResource resource(1000);
    Session session(&resource);

    try {
        session.encode(std::string("ab"));
        FAIL() << "expected AllocationFailure";
    }
    catch (const AllocationFailure& e) {
        EXPECT_STREQ(e.what(), "allocation failed: code table");
    }
    EXPECT_EQ(session.state(), SessionState::Failed);
    EXPECT_EQ(session.node_count(), 3u);

    reset_or_destroy(session);
    EXPECT_EQ(resource.outstanding_blocks(), 0u);
    EXPECT_EQ(resource.outstanding_bytes(), 0u);
}

TEST(SessionTest, LeafWinsWeightTieAgainstInternalNode) {
    // a+b combine to 4, c is a leaf of weight 4 created earlier and goes left
    Session session;
    std::string encoded = session.encode(std::string("aabbcccc"));

    EXPECT_EQ(encoded, "101011110000");
    EXPECT_EQ(session.code_table().code('c'), "0");
    EXPECT_EQ(session.code_table().code('a'), "10");
    EXPECT_EQ(session.code_table().code('b'), "11");
}

TEST(SessionTest, StateNames) {
    EXPECT_STREQ(state_name(SessionState::Idle), "idle");
    EXPECT_STREQ(state_name(SessionState::BuildingTree), "building tree");
    EXPECT_STREQ(state_name(SessionState::Failed), "failed");
}
