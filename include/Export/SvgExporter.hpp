#pragma once
#include "core/Common.hpp"
#include "core/MazeBuilder.hpp"

#include <ostream>
#include <string>

enum class SolutionType
{
    None,
    Route,
    MinimumSpanningTree
};

class SvgExporter
{
public:
    static void Export(const Maze& maze, std::ostream& out, float scale,
                       SolutionType solution = SolutionType::None,
                       RouteOrder order = RouteOrder::DepthFirst);

    static bool ExportToFile(const Maze& maze, const std::string& filename, float scale,
                             SolutionType solution, RouteOrder order, std::string& outError);
};
