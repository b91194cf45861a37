#include "core/MazeBuilder.hpp"
#include "core/ArtifactPlacer.hpp"
#include "core/GraphBuilder.hpp"
#include "core/PathFinder.hpp"
#include "core/SpanningTree.hpp"

#include <string>

Maze::Maze(int32_t width, int32_t height, int32_t roomSize, ExitSide exitSide)
    : width_(MazeBuilder::ConstrainDimension(width))
    , height_(MazeBuilder::ConstrainDimension(height))
    , exitSide_(exitSide)
{
    roomSize_ = MazeBuilder::ConstrainRoomSize(roomSize, width_, height_);
    Reset();
}

Maze::Maze(const MazeConfig& config)
    : Maze(config.width, config.height, config.roomSize, config.exitSide)
{
}

void Maze::Reset()
{
    cells_.assign((size_t)width_ * (size_t)height_, CellType::Wall);
}

bool Maze::InRoom(int32_t x, int32_t y) const
{
    const Point c = Center();
    const int32_t half = roomSize_ / 2;
    return x >= c.x - half && x <= c.x + half && y >= c.y - half && y <= c.y + half;
}

CellType Maze::At(int32_t x, int32_t y) const
{
    if (!InBounds(x, y))
        throw std::out_of_range("Maze::At(" + std::to_string(x) + ", " + std::to_string(y) + ") outside "
                                + std::to_string(width_) + "x" + std::to_string(height_));
    return cells_[Index(x, y)];
}

void Maze::Set(int32_t x, int32_t y, CellType value)
{
    if (!InBounds(x, y))
        throw std::out_of_range("Maze::Set(" + std::to_string(x) + ", " + std::to_string(y) + ") outside "
                                + std::to_string(width_) + "x" + std::to_string(height_));
    cells_[Index(x, y)] = value;
}

std::optional<Point> Maze::ExitPosition() const
{
    for (int32_t x : { 0, width_ - 1 })
        for (int32_t y = 0; y < height_; ++y)
            if (cells_[Index(x, y)] == CellType::Exit) return Point{ x, y };

    for (int32_t y : { 0, height_ - 1 })
        for (int32_t x = 0; x < width_; ++x)
            if (cells_[Index(x, y)] == CellType::Exit) return Point{ x, y };

    return std::nullopt;
}

size_t Maze::Count(CellType t) const
{
    return (size_t)std::count(cells_.begin(), cells_.end(), t);
}

void Maze::Generate(std::mt19937& rng)
{
    Reset();
    MazeBuilder::Build(*this, rng);
}

void Maze::Generate()
{
    std::random_device rd;
    std::mt19937 rng(rd());
    Generate(rng);
}

Maze::ArtifactStats Maze::PlaceArtifacts(float fillRatio, std::mt19937& rng)
{
    return ArtifactPlacer::Place(*this, fillRatio, rng);
}

Maze::ArtifactStats Maze::PlaceArtifacts(float fillRatio)
{
    std::random_device rd;
    std::mt19937 rng(rd());
    return PlaceArtifacts(fillRatio, rng);
}

MazeGraph Maze::BuildGraph() const
{
    return GraphBuilder::Build(*this);
}

MazeGraph Maze::MinimumSpanningTree() const
{
    return SpanningTree::Prim(BuildGraph());
}

std::optional<std::vector<Point>> Maze::RouteSearch(RouteOrder order) const
{
    std::vector<Point> steps;
    std::string error;
    if (!PathFinder::FindRoute(*this, steps, error, order))
    {
        spdlog::debug("Route search: {}", error);
        return std::nullopt;
    }
    return steps;
}
