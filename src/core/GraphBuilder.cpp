#include "core/GraphBuilder.hpp"

#include <unordered_set>
#include <vector>

int32_t MazeGraph::NodeId(const Point& p) const
{
    auto it = nodes.find(p);
    return (it == nodes.end()) ? -1 : it->second;
}

int64_t MazeGraph::TotalWeight() const
{
    int64_t total = 0;
    for (const Edge& e : edges) total += e.weight;
    return total;
}

int32_t MazeGraph::AddNode(const Point& p)
{
    auto it = nodes.find(p);
    if (it != nodes.end()) return it->second;

    const int32_t id = (int32_t)positions.size();
    nodes.emplace(p, id);
    positions.push_back(p);
    return id;
}

bool MazeGraph::AddEdge(int32_t a, int32_t b, int32_t weight)
{
    if (a == b) return false;

    const Edge e{ std::min(a, b), std::max(a, b), weight };
    auto it = edges.find(e);
    if (it != edges.end())
    {
        if (it->weight <= weight) return false;
        edges.erase(it);
    }
    edges.insert(e);
    return true;
}

int32_t GraphBuilder::TraversableNeighbours(const Maze& maze, int32_t x, int32_t y)
{
    auto ok = [&](int32_t xx, int32_t yy) {
        return maze.InBounds(xx, yy) && IsTraversable(maze.At(xx, yy));
    };

    int32_t d = 0;
    d += ok(x + 1, y);
    d += ok(x - 1, y);
    d += ok(x, y + 1);
    d += ok(x, y - 1);
    return d;
}

MazeGraph GraphBuilder::Build(const Maze& maze)
{
    MazeGraph graph;

    const std::optional<Point> exit = maze.ExitPosition();
    if (!exit)
        return graph;

    const int32_t W = maze.Width();
    const int32_t H = maze.Height();
    const Point center = maze.Center();

    graph.AddNode(center);
    graph.AddNode(*exit);

    // dead ends and junctions
    for (int32_t y = 1; y < H - 1; ++y)
    {
        for (int32_t x = 1; x < W - 1; ++x)
        {
            if (!IsTraversable(maze.At(x, y))) continue;

            const Point p{ x, y };
            if (p == center || p == *exit) continue;

            if (TraversableNeighbours(maze, x, y) != 2)
                graph.AddNode(p);
        }
    }

    // follow corridors (handles turns)
    const int dx4[4] = { 1, -1, 0, 0 };
    const int dy4[4] = { 0, 0, 1, -1 };

    std::unordered_set<Point, PointHash> visited;

    const int32_t n = (int32_t)graph.positions.size();
    for (int32_t u = 0; u < n; ++u)
    {
        const Point start = graph.positions[(size_t)u];

        for (int dir = 0; dir < 4; ++dir)
        {
            Point cur{ start.x + dx4[dir], start.y + dy4[dir] };
            if (!maze.InBounds(cur.x, cur.y)) continue;

            const CellType first = maze.At(cur.x, cur.y);
            if (first == CellType::Wall) continue;

            int32_t weight = CellWeight(first);
            visited.clear();
            visited.insert(start);

            while (true)
            {
                const int32_t v = graph.NodeId(cur);
                if (v >= 0)
                {
                    // the walk from the lower id records the pair
                    if (u < v) graph.AddEdge(u, v, weight);
                    break;
                }

                visited.insert(cur);

                bool moved = false;
                for (int d = 0; d < 4; ++d)
                {
                    const Point next{ cur.x + dx4[d], cur.y + dy4[d] };
                    if (!maze.InBounds(next.x, next.y)) continue;

                    const CellType t = maze.At(next.x, next.y);
                    if (t == CellType::Wall || visited.count(next)) continue;

                    cur = next;
                    weight += CellWeight(t);
                    moved = true;
                    break;
                }

                if (!moved) break; // dead end without a node
            }
        }
    }

    spdlog::debug("Graph: {} nodes, {} edges", graph.nodes.size(), graph.edges.size());
    return graph;
}
