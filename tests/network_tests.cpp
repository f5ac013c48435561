#include <gtest/gtest.h>
#include "Errors.hpp"
#include "Network.hpp"

#include <vector>

// Complete graphs are implicit but answer the same queries as explicit ones
TEST(NetworkTest, CompleteGraph) {
    Network network = Network::complete(5);

    EXPECT_TRUE(network.isComplete());
    EXPECT_EQ(network.size(), 5u);
    EXPECT_EQ(network.degree(2), 4u);
    EXPECT_EQ(network.neighbors(2), (std::vector<size_t>{0, 1, 3, 4}));
    EXPECT_EQ(network.neighborAt(2, 1), 1u);
    EXPECT_EQ(network.neighborAt(2, 2), 3u);
    EXPECT_TRUE(network.hasEdge(0, 4));
    EXPECT_FALSE(network.hasEdge(3, 3));
}

TEST(NetworkTest, UndirectedEdgesAreSymmetric) {
    Network network = Network::fromEdges(4, {{0, 1}, {0, 2}, {0, 3}, {2, 1}});

    EXPECT_EQ(network.neighbors(0), (std::vector<size_t>{1, 2, 3}));
    EXPECT_EQ(network.neighbors(1), (std::vector<size_t>{0, 2}));
    EXPECT_EQ(network.neighbors(3), (std::vector<size_t>{0}));
    for (size_t i = 0; i < network.size(); ++i) {
        EXPECT_FALSE(network.hasEdge(i, i));
        for (size_t j : network.neighbors(i)) {
            EXPECT_TRUE(network.hasEdge(j, i));
        }
    }
}

TEST(NetworkTest, DirectedEdgesAreOneWay) {
    Network network = Network::fromEdges(3, {{0, 1}, {1, 2}}, true);

    EXPECT_TRUE(network.isDirected());
    EXPECT_TRUE(network.hasEdge(0, 1));
    EXPECT_FALSE(network.hasEdge(1, 0));
    EXPECT_EQ(network.degree(2), 0u);
}

TEST(NetworkTest, DuplicateEdgesCollapse) {
    Network network = Network::fromEdges(3, {{0, 1}, {1, 0}, {0, 1}});
    EXPECT_EQ(network.degree(0), 1u);
    EXPECT_EQ(network.degree(1), 1u);
}

TEST(NetworkTest, RejectsMalformedEdges) {
    EXPECT_THROW(Network::fromEdges(3, {{1, 1}}), ConfigurationError);
    EXPECT_THROW(Network::fromEdges(3, {{0, 3}}), ConfigurationError);
    EXPECT_THROW(Network::complete(3).degree(3), ConfigurationError);
}

TEST(NetworkTest, FromAdjacencyMatrix) {
    std::vector<std::vector<double>> matrix = {
        {0.0, 1.0, 0.0},
        {0.0, 0.0, 0.5},
        {0.0, 0.0, 0.0}
    };
    Network undirected = Network::fromAdjacencyMatrix(matrix);
    EXPECT_EQ(undirected.neighbors(1), (std::vector<size_t>{0, 2}));

    Network directed = Network::fromAdjacencyMatrix(matrix, true);
    EXPECT_EQ(directed.neighbors(1), (std::vector<size_t>{2}));
    EXPECT_EQ(directed.degree(2), 0u);
}

TEST(NetworkTest, AdjacencyMatrixMustBeSquareAndIrreflexive) {
    EXPECT_THROW(Network::fromAdjacencyMatrix({{0.0, 1.0}, {1.0}}), ConfigurationError);
    EXPECT_THROW(Network::fromAdjacencyMatrix({{1.0, 0.0}, {0.0, 0.0}}), ConfigurationError);
}
