#include "core/Common.hpp"
#include "Exploer/Exploer.hpp"

#include <algorithm>
#include <vector>

void Exploer::update() {}

// key helpers
static uint32_t keyOf(int32_t x, int32_t y, int32_t W) { return (uint32_t)y * (uint32_t)W + (uint32_t)x; }
static Point xyOf(uint32_t k, int32_t W) { return { (int32_t)(k % (uint32_t)W), (int32_t)(k / (uint32_t)W) }; }

// right, left, down, up
static const int dx4[4] = { 1, -1, 0, 0 };
static const int dy4[4] = { 0, 0, 1, -1 };

RouteExploer::RouteExploer(Maze maze, RouteOrder order)
    : Exploer(std::move(maze))
    , order_(order)
{
}

void RouteExploer::push_(uint32_t k)
{
    if (order_ == RouteOrder::DepthFirst)
        work_.push_back(k);
    else
        work_.push_front(k);
}

void RouteExploer::seed_()
{
    const int32_t W = maze.Width();
    const Point c = maze.Center();
    const int32_t half = maze.RoomSize() / 2;

    const uint32_t startK = keyOf(c.x, c.y, W);
    visited_[startK] = 1;

    // room edge cells that lead outside go in front of the center
    for (int32_t y = c.y - half; y <= c.y + half; ++y)
    {
        for (int32_t x = c.x - half; x <= c.x + half; ++x)
        {
            const bool edge = x == c.x - half || x == c.x + half || y == c.y - half || y == c.y + half;
            if (!edge) continue;

            const uint32_t k = keyOf(x, y, W);
            if (visited_[k]) continue;

            for (int d = 0; d < 4; ++d)
            {
                const int32_t nx = x + dx4[d];
                const int32_t ny = y + dy4[d];
                if (!maze.InBounds(nx, ny) || maze.InRoom(nx, ny)) continue;
                if (!IsTraversable(maze.At(nx, ny))) continue;

                work_.push_front(k);
                visited_[k] = 1;
                break;
            }
        }
    }

    work_.push_back(startK);
}

void RouteExploer::buildPath_(uint32_t endK)
{
    const int32_t W = maze.Width();

    std::vector<Point> rev;
    uint32_t cur = endK;
    rev.push_back(xyOf(cur, W));

    for (auto it = parent_.find(cur); it != parent_.end(); it = parent_.find(cur))
    {
        cur = it->second;
        rev.push_back(xyOf(cur, W));
    }

    // chain starts at a seed; walk the open room from the center to it
    const Point seed = rev.back();
    const Point c = maze.Center();

    path.clear();
    path.reserve(rev.size() + (size_t)maze.RoomSize());

    Point p = c;
    while (p != seed)
    {
        path.push_back(p);
        if (p.x != seed.x) p.x += (seed.x > p.x) ? 1 : -1;
        else               p.y += (seed.y > p.y) ? 1 : -1;
    }

    path.insert(path.end(), rev.rbegin(), rev.rend());
}

void RouteExploer::update()
{
    const int32_t W = maze.Width();
    const int32_t H = maze.Height();

    if (state == State::START)
    {
        state = State::EXPLORE;
        timeStep = 1;

        way.clear();
        path.clear();
        found = false;
        error.clear();
        work_.clear();
        parent_.clear();
        visited_.assign((size_t)W * (size_t)H, 0);

        seed_();
        return;
    }

    if (state != State::EXPLORE) return;

    timeStep += 1;

    if (work_.empty())
    {
        state = State::END;
        found = false;
        error = "No path.";
        return;
    }

    const uint32_t curK = work_.back();
    work_.pop_back();

    const Point cur = xyOf(curK, W);
    way.push_back(cur);

    if (maze.At(cur.x, cur.y) == CellType::Exit)
    {
        buildPath_(curK);
        found = true;
        state = State::END;
        return;
    }

    for (int d = 0; d < 4; ++d)
    {
        const int32_t nx = cur.x + dx4[d];
        const int32_t ny = cur.y + dy4[d];

        if (!maze.InBounds(nx, ny)) continue;
        if (!IsTraversable(maze.At(nx, ny))) continue;

        const uint32_t nk = keyOf(nx, ny, W);
        if (visited_[nk]) continue;

        // mark on push so a cell is queued at most once
        visited_[nk] = 1;
        parent_[nk] = curK;
        push_(nk);
    }
}
