#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/MazeBuilder.hpp"

#include <set>
#include <unordered_map>

struct Edge
{
    int32_t startId;
    int32_t endId;
    int32_t weight;

    // one edge per unordered node pair; startId is always the lower id
    bool operator<(const Edge& other) const
    {
        return startId != other.startId ? startId < other.startId : endId < other.endId;
    }

    bool operator==(const Edge& other) const
    {
        return startId == other.startId && endId == other.endId && weight == other.weight;
    }
};

using NodeMap = std::unordered_map<Point, int32_t, PointHash>;
using EdgeSet = std::set<Edge>;

// Snapshot of the corridor structure. Holds no reference to the maze it came from.
struct MazeGraph
{
    static constexpr int32_t CenterId = 0;
    static constexpr int32_t ExitId = 1;

    NodeMap nodes{};
    std::vector<Point> positions{}; // indexed by node id
    EdgeSet edges{};

    bool Empty() const { return nodes.empty(); }
    int32_t NodeId(const Point& p) const;
    int64_t TotalWeight() const;

    // Adds a node and returns its id.
    int32_t AddNode(const Point& p);

    // Inserts {min, max, weight}; an existing edge for the pair is kept unless heavier.
    bool AddEdge(int32_t a, int32_t b, int32_t weight);
};

class GraphBuilder
{
public:
    static MazeGraph Build(const Maze& maze);

    static int32_t TraversableNeighbours(const Maze& maze, int32_t x, int32_t y);
};
