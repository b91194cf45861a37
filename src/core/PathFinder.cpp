#include "core/PathFinder.hpp"
#include "Exploer/Exploer.hpp"

bool PathFinder::FindRoute(
    const Maze& maze,
    std::vector<Point>& outSteps,
    std::string& outError,
    RouteOrder order,
    int* outVisited)
{
    outSteps.clear();
    outError.clear();

    RouteExploer ex(maze, order);
    while (ex.state != State::END)
        ex.update();

    if (outVisited) *outVisited = (int)ex.way.size();

    if (!ex.found)
    {
        outError = ex.error.empty() ? "No path." : ex.error;
        return false;
    }

    outSteps = std::move(ex.path);
    return true;
}
