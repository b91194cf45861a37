#include "Export/SvgExporter.hpp"
#include "core/GraphBuilder.hpp"

#include <fstream>

static void writeRoute_(const Maze& maze, std::ostream& out, RouteOrder order)
{
    const auto route = maze.RouteSearch(order);
    if (!route) return;

    out << "    <polyline fill=\"none\" stroke=\"rgb(28, 163, 163)\" stroke-width=\"0.35\" points=\"";
    for (const Point& p : *route)
        out << (p.x + 0.5f) << ',' << (p.y + 0.5f) << ' ';
    out << "\" />\n";
}

static void writeSpanningTree_(const Maze& maze, std::ostream& out)
{
    const MazeGraph tree = maze.MinimumSpanningTree();
    for (const Edge& e : tree.edges)
    {
        const Point& a = tree.positions[(size_t)e.startId];
        const Point& b = tree.positions[(size_t)e.endId];
        out << "    <line x1=\"" << (a.x + 0.5f) << "\" y1=\"" << (a.y + 0.5f)
            << "\" x2=\"" << (b.x + 0.5f) << "\" y2=\"" << (b.y + 0.5f)
            << "\" stroke=\"rgb(28, 163, 163)\" stroke-width=\"0.2\" />\n";
    }
}

void SvgExporter::Export(const Maze& maze, std::ostream& out, float scale,
                         SolutionType solution, RouteOrder order)
{
    const float W = (float)maze.Width() * scale;
    const float H = (float)maze.Height() * scale;

    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << W << "\" height=\"" << H
        << "\" viewBox=\"0 0 " << W << ' ' << H << "\">\n";
    out << "<rect width=\"100%\" height=\"100%\" fill=\"#eee\" />\n";
    out << "  <g transform=\"scale(" << scale << ")\" >\n";

    switch (solution)
    {
    case SolutionType::Route:               writeRoute_(maze, out, order); break;
    case SolutionType::MinimumSpanningTree: writeSpanningTree_(maze, out); break;
    case SolutionType::None:                break;
    }

    for (int32_t y = 0; y < maze.Height(); ++y)
    {
        for (int32_t x = 0; x < maze.Width(); ++x)
        {
            const CellType t = maze.At(x, y);
            if (t == CellType::Wall)
            {
                out << "    <rect x=\"" << x << "\" y=\"" << y
                    << "\" width=\"1\" height=\"1\" fill=\"#222\" />\n";
            }
            else if (IsArtifact(t))
            {
                out << "    <circle cx=\"" << (x + 0.5f) << "\" cy=\"" << (y + 0.5f)
                    << "\" r=\"0.4\" fill=\"" << (IsReward(t) ? "#2d1" : "#e43")
                    << "\" title=\"" << CellTypeName(t) << "\" />\n";
            }
        }
    }

    out << "  </g>\n";
    out << "</svg>\n";
}

bool SvgExporter::ExportToFile(const Maze& maze, const std::string& filename, float scale,
                               SolutionType solution, RouteOrder order, std::string& outError)
{
    std::ofstream file(filename);
    if (!file)
    {
        outError = "Cannot open " + filename + " for writing.";
        return false;
    }

    Export(maze, file, scale, solution, order);
    file.flush();
    if (!file)
    {
        outError = "Write to " + filename + " failed.";
        return false;
    }
    return true;
}
