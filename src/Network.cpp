#include "Network.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <string>

Network::Network(size_t numNodes, bool implicitComplete, bool directed)
    : numNodes(numNodes), implicitComplete(implicitComplete), directed(directed)
{
    if (!implicitComplete) {
        adjacency.resize(numNodes);
    }
}

Network Network::complete(size_t numNodes) {
    return Network(numNodes, true, false);
}

Network Network::fromEdges(size_t numNodes,
                           const std::vector<std::pair<size_t, size_t>>& edges,
                           bool directed) {
    Network network(numNodes, false, directed);

    for (const auto& [from, to] : edges) {
        if (from >= numNodes || to >= numNodes) {
            throw ConfigurationError("Edge (" + std::to_string(from) + ", " + std::to_string(to) +
                                     ") references an agent outside 0.." + std::to_string(numNodes));
        }
        if (from == to) {
            throw ConfigurationError("Self loop on agent " + std::to_string(from));
        }
        network.adjacency[from].push_back(to);
        if (!directed) {
            network.adjacency[to].push_back(from);
        }
    }

    // Duplicate edges collapse into a single neighbor entry
    for (auto& row : network.adjacency) {
        std::sort(row.begin(), row.end());
        row.erase(std::unique(row.begin(), row.end()), row.end());
    }
    return network;
}

Network Network::fromAdjacencyMatrix(const std::vector<std::vector<double>>& adjMatrix,
                                     bool directed) {
    size_t n = adjMatrix.size();
    std::vector<std::pair<size_t, size_t>> edges;

    for (size_t row = 0; row < n; ++row) {
        if (adjMatrix[row].size() != n) {
            throw ConfigurationError("Adjacency matrix is not square: row " + std::to_string(row) +
                                     " has " + std::to_string(adjMatrix[row].size()) +
                                     " entries, expected " + std::to_string(n));
        }
        for (size_t col = 0; col < n; ++col) {
            if (adjMatrix[row][col] > 0.0) {
                // fromEdges rejects the diagonal
                edges.emplace_back(row, col);
            }
        }
    }
    return fromEdges(n, edges, directed);
}

void Network::checkNode(size_t node) const {
    if (node >= numNodes) {
        throw ConfigurationError("Unknown agent id " + std::to_string(node));
    }
}

size_t Network::degree(size_t node) const {
    checkNode(node);
    if (implicitComplete) {
        return numNodes - 1;
    }
    return adjacency[node].size();
}

size_t Network::neighborAt(size_t node, size_t k) const {
    checkNode(node);
    if (implicitComplete) {
        // Everyone except the node itself, in id order
        return k < node ? k : k + 1;
    }
    return adjacency[node].at(k);
}

std::vector<size_t> Network::neighbors(size_t node) const {
    checkNode(node);
    if (!implicitComplete) {
        return adjacency[node];
    }
    std::vector<size_t> result;
    result.reserve(numNodes - 1);
    for (size_t other = 0; other < numNodes; ++other) {
        if (other != node) {
            result.push_back(other);
        }
    }
    return result;
}

bool Network::hasEdge(size_t from, size_t to) const {
    checkNode(from);
    checkNode(to);
    if (implicitComplete) {
        return from != to;
    }
    const auto& row = adjacency[from];
    return std::binary_search(row.begin(), row.end(), to);
}
