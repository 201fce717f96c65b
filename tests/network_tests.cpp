#include <gtest/gtest.h>
#include <queue>
#include <random>
#include <stdexcept>
#include "kernel/SocialNetwork.h"

TEST(NetworkTest, BarabasiAlbertEdgeCount) {
    std::mt19937_64 rng(42);
    SocialNetwork net;
    net.buildBarabasiAlbert(500, 3, rng);

    EXPECT_EQ(net.size(), 500u);
    // star (m edges) + m per later node
    EXPECT_EQ(net.edgeCount(), 3u + (500u - 3u - 1u) * 3u);
}

TEST(NetworkTest, BarabasiAlbertSimpleAndSymmetric) {
    std::mt19937_64 rng(7);
    SocialNetwork net;
    net.buildBarabasiAlbert(300, 4, rng);

    std::size_t degreeSum = 0;
    for (std::uint32_t i = 0; i < net.size(); ++i) {
        const auto& nbrs = net.neighbors(i);
        degreeSum += nbrs.size();
        for (std::size_t k = 0; k < nbrs.size(); ++k) {
            EXPECT_NE(nbrs[k], i);
            EXPECT_TRUE(net.hasEdge(nbrs[k], i));
            for (std::size_t j = k + 1; j < nbrs.size(); ++j) {
                EXPECT_NE(nbrs[k], nbrs[j]);
            }
        }
        // every node after the seed star attaches with m ties
        if (i > 4) EXPECT_GE(nbrs.size(), 4u);
    }
    EXPECT_EQ(degreeSum, 2 * net.edgeCount());
}

TEST(NetworkTest, BarabasiAlbertConnected) {
    std::mt19937_64 rng(1);
    SocialNetwork net;
    net.buildBarabasiAlbert(200, 1, rng);

    std::vector<bool> seen(net.size(), false);
    std::queue<std::uint32_t> frontier;
    frontier.push(0);
    seen[0] = true;
    std::size_t reached = 1;
    while (!frontier.empty()) {
        const auto node = frontier.front();
        frontier.pop();
        for (auto nbr : net.neighbors(node)) {
            if (!seen[nbr]) {
                seen[nbr] = true;
                ++reached;
                frontier.push(nbr);
            }
        }
    }
    EXPECT_EQ(reached, 200u);
}

TEST(NetworkTest, DeterministicForSeed) {
    std::mt19937_64 rngA(99);
    std::mt19937_64 rngB(99);
    SocialNetwork a;
    SocialNetwork b;
    a.buildBarabasiAlbert(100, 2, rngA);
    b.buildBarabasiAlbert(100, 2, rngB);
    for (std::uint32_t i = 0; i < 100; ++i) {
        EXPECT_EQ(a.neighbors(i), b.neighbors(i));
    }
}

TEST(NetworkTest, InvalidAttachment) {
    std::mt19937_64 rng(1);
    SocialNetwork net;
    EXPECT_THROW(net.buildBarabasiAlbert(10, 0, rng), std::invalid_argument);
    EXPECT_THROW(net.buildBarabasiAlbert(10, 10, rng), std::invalid_argument);
}

TEST(NetworkTest, AddRemoveEdges) {
    SocialNetwork net;
    net.reset(4);
    EXPECT_EQ(net.edgeCount(), 0u);

    EXPECT_TRUE(net.addEdge(0, 1));
    EXPECT_FALSE(net.addEdge(1, 0));   // duplicate
    EXPECT_FALSE(net.addEdge(2, 2));   // self loop
    EXPECT_TRUE(net.addEdge(1, 3));
    EXPECT_EQ(net.edgeCount(), 2u);
    EXPECT_EQ(net.degree(1), 2u);

    EXPECT_TRUE(net.removeEdge(1, 0));
    EXPECT_FALSE(net.removeEdge(0, 1));
    EXPECT_FALSE(net.hasEdge(0, 1));
    EXPECT_EQ(net.edgeCount(), 1u);
    EXPECT_EQ(net.degree(0), 0u);

    EXPECT_THROW(net.addEdge(0, 4), std::out_of_range);
    EXPECT_THROW(net.addEdge(9, 9), std::out_of_range);
    EXPECT_THROW(net.neighbors(4), std::out_of_range);
}
