#ifndef NETWORK_HPP
#define NETWORK_HPP

#include <cstddef>
#include <utility>
#include <vector>

// Social network over agent ids 0..size()-1. Complete graphs are kept implicit
// so an unconstrained population does not pay for an edge list.
class Network {
public:
    Network() = default;

    static Network complete(size_t numNodes);
    static Network fromEdges(size_t numNodes,
                             const std::vector<std::pair<size_t, size_t>>& edges,
                             bool directed = false);
    // Any weight > 0 is an edge. Row i lists the agents that i observes.
    static Network fromAdjacencyMatrix(const std::vector<std::vector<double>>& adjMatrix,
                                       bool directed = false);

    size_t size() const { return numNodes; }
    bool isComplete() const { return implicitComplete; }
    bool isDirected() const { return directed; }

    size_t degree(size_t node) const;
    // k-th neighbor of node, 0 <= k < degree(node)
    size_t neighborAt(size_t node, size_t k) const;
    std::vector<size_t> neighbors(size_t node) const;
    bool hasEdge(size_t from, size_t to) const;

private:
    Network(size_t numNodes, bool implicitComplete, bool directed);
    void checkNode(size_t node) const;

    size_t numNodes = 0;
    bool implicitComplete = false;
    bool directed = false;
    std::vector<std::vector<size_t>> adjacency; // sorted, empty when implicitComplete
};

#endif // NETWORK_HPP
