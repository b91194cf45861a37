#include "core/Common.hpp"
#include "core/MazeBuilder.hpp"
#include "core/GraphBuilder.hpp"
#include "App/CommandLine.hpp"
#include "Export/DotExporter.hpp"
#include "Export/SvgExporter.hpp"
#include "Log/Log.hpp"

#include <random>
#include <string>

int RunApp(const AppOptions& options)
{
    logsys::Init(options.verbose);

    uint32_t seed = 0;
    if (options.seed) seed = *options.seed;
    else seed = std::random_device{}();

    std::mt19937 rng(seed);

    Maze maze(options.maze);
    maze.Generate(rng);

    const auto [w, h] = maze.GetSize();
    spdlog::info("Maze {}x{} (room {}), seed {}", w, h, maze.RoomSize(), seed);

    if (options.artifactsRatio)
    {
        const Maze::ArtifactStats stats = maze.PlaceArtifacts(*options.artifactsRatio, rng);
        spdlog::info("Artifacts: {} rewards, {} dangers (target {})",
                     stats.rewardsPlaced, stats.dangersPlaced, stats.target);
    }

    std::string error;

    if (!options.dotFile.empty())
    {
        const MazeGraph graph = options.dotSpanningTree ? maze.MinimumSpanningTree() : maze.BuildGraph();
        if (!DotExporter::ExportToFile(maze, graph, options.dotFile, error))
        {
            spdlog::error("DOT export failed: {}", error);
            return 1;
        }
        spdlog::info("Wrote {}", options.dotFile);
    }

    if (!options.svgFile.empty())
    {
        if (!SvgExporter::ExportToFile(maze, options.svgFile, options.scale,
                                       options.withPath, options.routeOrder, error))
        {
            spdlog::error("SVG export failed: {}", error);
            return 1;
        }
        spdlog::info("Wrote {}", options.svgFile);
    }

    const auto route = maze.RouteSearch(options.routeOrder);
    if (route)
        spdlog::info("Route to exit: {} cells", route->size());
    else
        spdlog::warn("No route from the center to the exit");

    const MazeGraph tree = maze.MinimumSpanningTree();
    spdlog::info("Spanning tree: {} nodes, {} edges", tree.nodes.size(), tree.edges.size());
    return 0;
}
