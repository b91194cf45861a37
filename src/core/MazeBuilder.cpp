#include "core/MazeBuilder.hpp"
#include <vector>
#include <random>
#include <algorithm>
#include <array>

int32_t MazeBuilder::ConstrainDimension(int32_t dim)
{
    if (dim < 7) return 7;
    const int32_t rem = (dim - 7) % 4;
    return rem == 0 ? dim : dim + (4 - rem);
}

int32_t MazeBuilder::ConstrainRoomSize(int32_t roomSize, int32_t width, int32_t height)
{
    if (roomSize < 0) roomSize = 0;

    // keep at least one wall ring between the room and the border
    const int32_t maxHalf = std::min(width, height) / 2 - 1;
    const int32_t half = std::min(roomSize / 2, maxHalf);
    return 2 * half + 1;
}

Point MazeBuilder::ExitCell(const Maze& maze, ExitSide side)
{
    const int32_t W = maze.Width();
    const int32_t H = maze.Height();

    switch (side)
    {
    case ExitSide::Left:   return { 0, H / 2 };
    case ExitSide::Right:  return { W - 1, H / 2 };
    case ExitSide::Top:    return { W / 2, 0 };
    case ExitSide::Bottom: return { W / 2, H - 1 };
    case ExitSide::Random: break;
    }
    return { W - 1, H / 2 };
}

void MazeBuilder::Build(Maze& maze, std::mt19937& rng)
{
    CarveRoom(maze);

    ExitSide side = maze.GetExitSide();
    if (side == ExitSide::Random)
    {
        static constexpr std::array<ExitSide, 4> sides = {
            ExitSide::Left, ExitSide::Right, ExitSide::Top, ExitSide::Bottom
        };
        std::uniform_int_distribution<size_t> pick(0, sides.size() - 1);
        side = sides[pick(rng)];
    }

    const Point exit = ExitCell(maze, side);
    maze.Set(exit.x, exit.y, CellType::Exit);

    Carve(maze, maze.Center(), rng);

    const int32_t loops = (maze.Width() + maze.Height()) / 8;
    spdlog::info("Removing {} walls", loops);
    const int32_t opened = InjectLoops(maze, loops, rng);
    spdlog::debug("Opened {} of {} walls", opened, loops);
}

void MazeBuilder::CarveRoom(Maze& maze)
{
    const Point c = maze.Center();
    const int32_t half = maze.RoomSize() / 2;

    for (int32_t y = c.y - half; y <= c.y + half; ++y)
        for (int32_t x = c.x - half; x <= c.x + half; ++x)
            maze.Set(x, y, CellType::Path);
}

void MazeBuilder::Carve(Maze& maze, const Point& start, std::mt19937& rng)
{
    const int32_t W = maze.Width();
    const int32_t H = maze.Height();

    auto inLattice = [&](int32_t x, int32_t y) {
        return x > 0 && y > 0 && x < W - 1 && y < H - 1;
    };

    std::vector<uint8_t> visited((size_t)W * (size_t)H, 0);
    auto key = [&](const Point& p) { return (size_t)p.y * (size_t)W + (size_t)p.x; };

    // step=2 grid: right, left, down, up
    const int dx[4] = { 2, -2, 0, 0 };
    const int dy[4] = { 0, 0, 2, -2 };

    struct Move { Point next; Point wall; };

    std::vector<Point> st;
    st.push_back(start);
    visited[key(start)] = 1;

    std::vector<Move> options;
    options.reserve(4);

    while (!st.empty())
    {
        const Point cur = st.back();
        st.pop_back();

        options.clear();
        for (int dir = 0; dir < 4; ++dir)
        {
            const Point next{ cur.x + dx[dir], cur.y + dy[dir] };
            if (!inLattice(next.x, next.y)) continue;
            if (visited[key(next)]) continue;

            options.push_back({ next, { cur.x + dx[dir] / 2, cur.y + dy[dir] / 2 } });
        }

        if (options.empty())
            continue; // backtrack

        st.push_back(cur);

        std::uniform_int_distribution<size_t> pick(0, options.size() - 1);
        const Move& m = options[pick(rng)];

        maze.Set(m.wall.x, m.wall.y, CellType::Path);
        maze.Set(m.next.x, m.next.y, CellType::Path);

        visited[key(m.next)] = 1;
        st.push_back(m.next);
    }
}

bool MazeBuilder::IsLoopCandidate(const Maze& maze, int32_t x, int32_t y)
{
    if (x <= 0 || y <= 0 || x >= maze.Width() - 1 || y >= maze.Height() - 1) return false;
    if (maze.At(x, y) != CellType::Wall) return false;

    auto isPath = [&](int32_t xx, int32_t yy) { return maze.At(xx, yy) == CellType::Path; };

    const int adjacent = (int)isPath(x + 1, y) + (int)isPath(x - 1, y)
                       + (int)isPath(x, y + 1) + (int)isPath(x, y - 1);
    if (adjacent != 2) return false;

    // wall between two corridors (either horizontal or vertical), never a corner
    const bool horiz = isPath(x - 1, y) && isPath(x + 1, y);
    const bool vert  = isPath(x, y - 1) && isPath(x, y + 1);
    return horiz || vert;
}

int32_t MazeBuilder::InjectLoops(Maze& maze, int32_t count, std::mt19937& rng,
                                 std::vector<Point>* outRemoved)
{
    const int32_t W = maze.Width();
    const int32_t H = maze.Height();

    std::vector<Point> candidates;
    candidates.reserve((size_t)W * (size_t)H / 4);

    int32_t opened = 0;
    for (int32_t i = 0; i < count; ++i)
    {
        // candidates move as walls open, so rescan every round
        candidates.clear();
        for (int32_t y = 1; y < H - 1; ++y)
            for (int32_t x = 1; x < W - 1; ++x)
                if (IsLoopCandidate(maze, x, y))
                    candidates.push_back({ x, y });

        if (candidates.empty())
            continue;

        std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
        const Point w = candidates[pick(rng)];
        maze.Set(w.x, w.y, CellType::Path);
        ++opened;

        if (outRemoved) outRemoved->push_back(w);
    }

    return opened;
}
