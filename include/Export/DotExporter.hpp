#pragma once
#include "core/Common.hpp"
#include "core/GraphBuilder.hpp"

#include <ostream>
#include <string>

// GraphViz "graph" writer for a maze graph (full or spanning tree).
class DotExporter
{
public:
    static void Export(const Maze& maze, const MazeGraph& graph, std::ostream& out);

    static bool ExportToFile(const Maze& maze, const MazeGraph& graph,
                             const std::string& filename, std::string& outError);
};
