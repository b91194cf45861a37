#pragma once
#include "core/Common.hpp"
#include "core/MazeBuilder.hpp"

class ArtifactPlacer
{
public:
    // share of the placement target that becomes rewards, the rest are dangers
    static constexpr float RewardRatio = 0.4f;

    static Maze::ArtifactStats Place(Maze& maze, float fillRatio, std::mt19937& rng);
};
