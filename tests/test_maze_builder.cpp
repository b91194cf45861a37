// tests/test_maze_builder.cpp (doctest)
//
// Grid construction, carving and loop injection.

#include <doctest/doctest.h>

#include "core/MazeBuilder.hpp"
#include "TestSupport.hpp"

#include <random>
#include <stdexcept>
#include <vector>

using mazegen_test::SameCells;

namespace builder_tests {

Maze CarvedTree(int32_t w, int32_t h, uint32_t seed)
{
    Maze m(w, h, 1, ExitSide::Right);
    const Point c = m.Center();
    m.Set(c.x, c.y, CellType::Path);

    std::mt19937 rng(seed);
    MazeBuilder::Carve(m, c, rng);
    return m;
}

size_t CountPathAdjacencies(const Maze& m)
{
    size_t n = 0;
    for (int32_t y = 0; y < m.Height(); ++y)
    {
        for (int32_t x = 0; x < m.Width(); ++x)
        {
            if (m.At(x, y) != CellType::Path) continue;
            if (x + 1 < m.Width() && m.At(x + 1, y) == CellType::Path) ++n;
            if (y + 1 < m.Height() && m.At(x, y + 1) == CellType::Path) ++n;
        }
    }
    return n;
}

} // namespace builder_tests

TEST_CASE("MazeBuilder: dimensions are normalized upwards")
{
    CHECK(MazeBuilder::ConstrainDimension(-5) == 7);
    CHECK(MazeBuilder::ConstrainDimension(0) == 7);
    CHECK(MazeBuilder::ConstrainDimension(7) == 7);
    CHECK(MazeBuilder::ConstrainDimension(8) == 11);
    CHECK(MazeBuilder::ConstrainDimension(11) == 11);
    CHECK(MazeBuilder::ConstrainDimension(30) == 31);
    CHECK(MazeBuilder::ConstrainDimension(60) == 63);

    for (int32_t d = -3; d < 120; ++d)
    {
        const int32_t r = MazeBuilder::ConstrainDimension(d);
        CHECK(r >= 7);
        CHECK((r - 7) % 4 == 0);
        if (d >= 7)
        {
            CHECK(r >= d);
            CHECK(r - d < 4);
        }
    }
}

TEST_CASE("MazeBuilder: room size is odd and stays off the border")
{
    CHECK(MazeBuilder::ConstrainRoomSize(3, 7, 7) == 3);
    CHECK(MazeBuilder::ConstrainRoomSize(4, 7, 7) == 5);
    CHECK(MazeBuilder::ConstrainRoomSize(99, 7, 7) == 5);
    CHECK(MazeBuilder::ConstrainRoomSize(99, 31, 11) == 9);
    CHECK(MazeBuilder::ConstrainRoomSize(0, 7, 7) == 1);
    CHECK(MazeBuilder::ConstrainRoomSize(-4, 7, 7) == 1);
}

TEST_CASE("Maze: new grid is all walls at normalized size")
{
    Maze m(8, 5, 3, ExitSide::Left);

    const auto [w, h] = m.GetSize();
    CHECK(w == 11);
    CHECK(h == 7);
    CHECK(m.RoomSize() == 3);
    CHECK(m.Count(CellType::Wall) == (size_t)(w * h));
    CHECK_FALSE(m.ExitPosition().has_value());
}

TEST_CASE("Maze: accessors reject coordinates outside the grid")
{
    Maze m(7, 7, 3, ExitSide::Right);

    CHECK_THROWS_AS(m.At(7, 0), std::out_of_range);
    CHECK_THROWS_AS(m.At(0, 7), std::out_of_range);
    CHECK_THROWS_AS(m.At(-1, 3), std::out_of_range);
    CHECK_THROWS_AS(m.Set(3, 9, CellType::Path), std::out_of_range);

    m.Set(2, 5, CellType::Ghost);
    CHECK(m.At(2, 5) == CellType::Ghost);
    CHECK(m.IsWall(0, 0));
    CHECK(m.IsWall(-1, -1));
}

TEST_CASE("Maze: 7x7 with a right exit")
{
    for (uint32_t seed = 1; seed <= 20; ++seed)
    {
        Maze m(7, 7, 3, ExitSide::Right);
        std::mt19937 rng(seed);
        m.Generate(rng);

        CHECK(m.At(6, 3) == CellType::Exit);
        CHECK(m.Count(CellType::Exit) == 1);

        for (int32_t y = 2; y <= 4; ++y)
            for (int32_t x = 2; x <= 4; ++x)
                CHECK(m.At(x, y) == CellType::Path);
    }
}

TEST_CASE("Maze: exit lands on the configured side")
{
    struct Case { ExitSide side; int32_t x; int32_t y; };
    // 31 x 15 grid
    const Case cases[] = {
        { ExitSide::Left,   0,  7 },
        { ExitSide::Right,  30, 7 },
        { ExitSide::Top,    15, 0 },
        { ExitSide::Bottom, 15, 14 },
    };

    for (const Case& c : cases)
    {
        Maze m(31, 15, 3, c.side);
        std::mt19937 rng(7);
        m.Generate(rng);

        CHECK(m.At(c.x, c.y) == CellType::Exit);
        CHECK(m.Count(CellType::Exit) == 1);
        REQUIRE(m.ExitPosition().has_value());
        CHECK(*m.ExitPosition() == Point{ c.x, c.y });
    }
}

TEST_CASE("Maze: random exit picks one of the four border midpoints")
{
    const std::vector<Point> allowed = { { 0, 7 }, { 30, 7 }, { 15, 0 }, { 15, 14 } };
    std::vector<int> seen(allowed.size(), 0);

    for (uint32_t seed = 0; seed < 64; ++seed)
    {
        Maze m(31, 15, 3, ExitSide::Random);
        std::mt19937 rng(seed);
        m.Generate(rng);

        REQUIRE(m.ExitPosition().has_value());
        const Point e = *m.ExitPosition();
        const auto it = std::find(allowed.begin(), allowed.end(), e);
        REQUIRE(it != allowed.end());
        ++seen[(size_t)(it - allowed.begin())];
        CHECK(m.Count(CellType::Exit) == 1);
    }

    for (int n : seen)
        CHECK(n > 0);
}

TEST_CASE("Maze: same seed, same maze; regenerating starts from scratch")
{
    Maze a(23, 15, 3, ExitSide::Random);
    Maze b(23, 15, 3, ExitSide::Random);

    std::mt19937 ra(1234);
    std::mt19937 rb(1234);
    a.Generate(ra);
    b.Generate(rb);
    CHECK(SameCells(a, b));

    std::mt19937 other(99);
    a.Generate(other);
    CHECK(a.Count(CellType::Exit) == 1);
}

TEST_CASE("MazeBuilder: carving yields a spanning tree over the odd lattice")
{
    for (uint32_t seed = 0; seed < 10; ++seed)
    {
        const Maze m = builder_tests::CarvedTree(23, 15, seed);

        const size_t lattice = (size_t)((23 - 1) / 2) * (size_t)((15 - 1) / 2);
        const size_t paths = m.Count(CellType::Path);

        // every lattice cell plus one connecting wall per tree edge
        CHECK(paths == 2 * lattice - 1);
        CHECK(builder_tests::CountPathAdjacencies(m) == paths - 1);

        for (int32_t y = 1; y < m.Height() - 1; y += 2)
            for (int32_t x = 1; x < m.Width() - 1; x += 2)
                CHECK(m.At(x, y) == CellType::Path);

        // border untouched
        for (int32_t x = 0; x < m.Width(); ++x)
        {
            CHECK(m.At(x, 0) == CellType::Wall);
            CHECK(m.At(x, m.Height() - 1) == CellType::Wall);
        }
    }
}

TEST_CASE("MazeBuilder: every opened wall sat between two straight path cells")
{
    for (uint32_t seed = 0; seed < 10; ++seed)
    {
        Maze m = builder_tests::CarvedTree(31, 23, seed);
        Maze replay = m;

        std::mt19937 rng(seed + 100);
        std::vector<Point> removed;
        const int32_t opened = MazeBuilder::InjectLoops(m, 12, rng, &removed);

        CHECK(opened == 12);
        REQUIRE(removed.size() == (size_t)opened);

        for (const Point& p : removed)
        {
            CHECK(MazeBuilder::IsLoopCandidate(replay, p.x, p.y));
            replay.Set(p.x, p.y, CellType::Path);
        }
        CHECK(SameCells(m, replay));

        // one new cell with two path neighbours per opening: one cycle each
        CHECK(builder_tests::CountPathAdjacencies(m) == m.Count(CellType::Path) - 1 + (size_t)opened);
    }
}

TEST_CASE("MazeBuilder: loop candidates exclude corners and the border")
{
    const Maze m = mazegen_test::MazeFromRows({
        "#######",
        "#.#.#.#",
        "#######",
        "##.#..#",
        "##...##",
        "#######",
        "#######",
    });

    CHECK(MazeBuilder::IsLoopCandidate(m, 2, 1));  // left + right
    CHECK(MazeBuilder::IsLoopCandidate(m, 5, 2));  // up + down
    CHECK_FALSE(MazeBuilder::IsLoopCandidate(m, 5, 4)); // left + up is a corner
    CHECK_FALSE(MazeBuilder::IsLoopCandidate(m, 3, 3)); // three path neighbours
    CHECK_FALSE(MazeBuilder::IsLoopCandidate(m, 2, 4)); // not a wall
    CHECK_FALSE(MazeBuilder::IsLoopCandidate(m, 0, 3)); // border

    Maze copy = m;
    std::mt19937 rng(3);
    CHECK(MazeBuilder::InjectLoops(copy, 0, rng) == 0);
    CHECK(SameCells(copy, m));
}

TEST_CASE("MazeBuilder: a pass without candidates opens nothing")
{
    Maze m(11, 11, 1, ExitSide::Right);
    std::mt19937 rng(5);
    std::vector<Point> removed;

    CHECK(MazeBuilder::InjectLoops(m, 5, rng, &removed) == 0);
    CHECK(removed.empty());
    CHECK(m.Count(CellType::Path) == 0);
}
