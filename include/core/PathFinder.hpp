#pragma once
#include "core/Common.hpp"
#include "core/MazeBuilder.hpp"

#include <string>
#include <vector>

class PathFinder
{
public:
    // Runs a RouteExploer to completion. DepthFirst returns *a* connecting
    // route, BreadthFirst one with the fewest cells outside the center room.
    static bool FindRoute(
        const Maze& maze,
        std::vector<Point>& outSteps,
        std::string& outError,
        RouteOrder order = RouteOrder::DepthFirst,
        int* outVisited = nullptr
    );
};
