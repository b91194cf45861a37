#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

enum class ExitSide
{
    Random,
    Left,
    Right,
    Top,
    Bottom
};

// Route exploration order, see PathFinder
enum class RouteOrder : int
{
    DepthFirst = 0,
    BreadthFirst = 1
};

struct MazeConfig
{
    int32_t width{60};
    int32_t height{30};
    int32_t roomSize{3};
    ExitSide exitSide{ExitSide::Right};
};

struct MazeGraph;

// The grid. Created at fixed (normalized) dimensions, all walls.
class Maze
{
public:
    Maze(int32_t width, int32_t height, int32_t roomSize, ExitSide exitSide);
    explicit Maze(const MazeConfig& config);

    std::pair<int32_t, int32_t> GetSize() const { return {width_, height_}; }
    int32_t Width() const { return width_; }
    int32_t Height() const { return height_; }
    int32_t RoomSize() const { return roomSize_; }
    ExitSide GetExitSide() const { return exitSide_; }

    Point Center() const { return {width_ / 2, height_ / 2}; }

    bool InBounds(int32_t x, int32_t y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    bool IsWall(int32_t x, int32_t y) const {
        return InBounds(x, y) ? cells_[Index(x, y)] == CellType::Wall : true;
    }

    bool InRoom(int32_t x, int32_t y) const;

    // throws std::out_of_range
    CellType At(int32_t x, int32_t y) const;
    void Set(int32_t x, int32_t y, CellType value);

    std::optional<Point> ExitPosition() const;
    size_t Count(CellType t) const;

    void Generate(std::mt19937& rng);
    void Generate();

    struct ArtifactStats
    {
        size_t target{0};
        size_t rewardsPlaced{0};
        size_t dangersPlaced{0};
    };

    ArtifactStats PlaceArtifacts(float fillRatio, std::mt19937& rng);
    ArtifactStats PlaceArtifacts(float fillRatio);

    // Derived snapshots, recomputed on every call.
    MazeGraph BuildGraph() const;
    MazeGraph MinimumSpanningTree() const;
    std::optional<std::vector<Point>> RouteSearch(RouteOrder order = RouteOrder::DepthFirst) const;

private:
    size_t Index(int32_t x, int32_t y) const {
        return (size_t)y * (size_t)width_ + (size_t)x;
    }

    void Reset();

    int32_t width_{7};
    int32_t height_{7};
    int32_t roomSize_{1};
    ExitSide exitSide_{ExitSide::Right};
    std::vector<CellType> cells_{};
};

class MazeBuilder
{
public:
    static int32_t ConstrainDimension(int32_t dim);
    static int32_t ConstrainRoomSize(int32_t roomSize, int32_t width, int32_t height);

    static Point ExitCell(const Maze& maze, ExitSide side);

    // center room + exit + carving + loops
    static void Build(Maze& maze, std::mt19937& rng);

    static void CarveRoom(Maze& maze);
    static void Carve(Maze& maze, const Point& start, std::mt19937& rng);

    // Opens up to `count` walls that sit between two straight Path neighbours.
    static int32_t InjectLoops(Maze& maze, int32_t count, std::mt19937& rng,
                               std::vector<Point>* outRemoved = nullptr);

    static bool IsLoopCandidate(const Maze& maze, int32_t x, int32_t y);
};
