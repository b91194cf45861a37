#include "core/ArtifactPlacer.hpp"

#include <algorithm>
#include <vector>

Maze::ArtifactStats ArtifactPlacer::Place(Maze& maze, float fillRatio, std::mt19937& rng)
{
    Maze::ArtifactStats stats;

    if (!(fillRatio > 0.0f)) fillRatio = 0.0f; // also catches NaN
    if (fillRatio > 1.0f) fillRatio = 1.0f;

    const int32_t W = maze.Width();
    const int32_t H = maze.Height();

    const size_t pathCells = maze.Count(CellType::Path);
    stats.target = (size_t)std::floor((double)pathCells * (double)fillRatio);

    const size_t rewardCount = (size_t)std::floor((double)stats.target * (double)RewardRatio);
    const size_t dangerCount = stats.target - rewardCount;

    std::vector<Point> candidates;
    candidates.reserve(pathCells);
    for (int32_t y = 0; y < H; ++y)
        for (int32_t x = 0; x < W; ++x)
            if (maze.At(x, y) == CellType::Path && !maze.InRoom(x, y))
                candidates.push_back({ x, y });

    std::shuffle(candidates.begin(), candidates.end(), rng);

    // placed cells and their 4-neighbours
    std::vector<uint8_t> blocked((size_t)W * (size_t)H, 0);
    auto key = [&](int32_t x, int32_t y) { return (size_t)y * (size_t)W + (size_t)x; };

    auto block = [&](const Point& p) {
        const int dx[5] = { 0, 1, -1, 0, 0 };
        const int dy[5] = { 0, 0, 0, 1, -1 };
        for (int i = 0; i < 5; ++i)
        {
            const int32_t nx = p.x + dx[i];
            const int32_t ny = p.y + dy[i];
            if (maze.InBounds(nx, ny)) blocked[key(nx, ny)] = 1;
        }
    };

    auto fill = [&](size_t wanted, const auto& variants) -> size_t {
        std::uniform_int_distribution<size_t> pick(0, variants.size() - 1);
        size_t placed = 0;
        for (const Point& p : candidates)
        {
            if (placed >= wanted) break;
            if (blocked[key(p.x, p.y)]) continue;

            maze.Set(p.x, p.y, variants[pick(rng)]);
            block(p);
            ++placed;
        }
        return placed;
    };

    // rewards first, then dangers over the same shuffled order
    stats.rewardsPlaced = fill(rewardCount, RewardTypes);
    stats.dangersPlaced = fill(dangerCount, DangerTypes);

    const size_t placed = stats.rewardsPlaced + stats.dangersPlaced;
    if (placed < stats.target)
        spdlog::debug("Artifacts: placed {} of {} (ran out of free cells)", placed, stats.target);
    else
        spdlog::debug("Artifacts: placed {} rewards, {} dangers", stats.rewardsPlaced, stats.dangersPlaced);

    return stats;
}
