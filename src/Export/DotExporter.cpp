#include "Export/DotExporter.hpp"

#include <fstream>
#include <iomanip>

void DotExporter::Export(const Maze& maze, const MazeGraph& graph, std::ostream& out)
{
    out << "graph Maze {\n";
    out << "    node [shape=point];\n";
    out << "    edge [len=1.0];\n";

    for (int32_t id = 0; id < (int32_t)graph.positions.size(); ++id)
    {
        const Point& p = graph.positions[(size_t)id];

        if (id == MazeGraph::CenterId)
        {
            out << "    n" << id << " [color=green, shape=circle, label=\"Start\"];\n";
        }
        else if (id == MazeGraph::ExitId)
        {
            out << "    n" << id << " [color=red, shape=box, label=\"Exit\"];\n";
        }
        else
        {
            const bool deadEnd = GraphBuilder::TraversableNeighbours(maze, p.x, p.y) == 1;
            out << "    n" << id << " [label=\"" << (deadEnd ? "Dead End" : "Junction") << "\"];\n";
        }
    }

    for (const Edge& e : graph.edges)
    {
        out << "    n" << e.startId << " -- n" << e.endId
            << " [len=" << std::fixed << std::setprecision(1) << (double)e.weight
            << std::defaultfloat << ", label=\"" << e.weight << "\"];\n";
    }

    out << "}\n";
}

bool DotExporter::ExportToFile(const Maze& maze, const MazeGraph& graph,
                               const std::string& filename, std::string& outError)
{
    std::ofstream file(filename);
    if (!file)
    {
        outError = "Cannot open " + filename + " for writing.";
        return false;
    }

    Export(maze, graph, file);
    file.flush();
    if (!file)
    {
        outError = "Write to " + filename + " failed.";
        return false;
    }
    return true;
}
