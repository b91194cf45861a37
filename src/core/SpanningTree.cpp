#include "core/SpanningTree.hpp"

#include <vector>

MazeGraph SpanningTree::Prim(const MazeGraph& graph)
{
    MazeGraph tree;
    tree.nodes = graph.nodes;
    tree.positions = graph.positions;

    if (graph.Empty())
        return tree;

    const size_t n = graph.positions.size();
    std::vector<uint8_t> visited(n, 0);
    visited[MazeGraph::CenterId] = 1;
    size_t visitedCount = 1;

    while (visitedCount < n)
    {
        const Edge* best = nullptr;

        for (const Edge& e : graph.edges)
        {
            // exactly one endpoint inside the tree
            if (visited[(size_t)e.startId] == visited[(size_t)e.endId]) continue;
            if (!best || e.weight < best->weight) best = &e;
        }

        if (!best)
            break; // rest of the graph is unreachable from the center

        visited[(size_t)best->startId] = 1;
        visited[(size_t)best->endId] = 1;
        ++visitedCount;
        tree.edges.insert(*best);
    }

    spdlog::info("Minimum spanning tree weight: {}", tree.TotalWeight());
    for (const Edge& e : tree.edges)
        spdlog::debug("Edge from {} to {} with weight {}", e.startId, e.endId, e.weight);

    return tree;
}
