#pragma once
#include "core/Common.hpp"

struct Point
{
    int32_t x;
    int32_t y;

    bool operator==(const Point& other) const
    {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Point& other) const
    {
        return !(*this == other);
    }

    bool operator<(const Point& other) const
    {
        return y != other.y ? y < other.y : x < other.x;
    }
};

struct PointHash
{
    size_t operator()(const Point& p) const noexcept
    {
        return std::hash<uint64_t>()((uint64_t)(uint32_t)p.x << 32 | (uint32_t)p.y);
    }
};

enum class CellType : uint8_t
{
    Start,
    Exit,
    Wall,
    Path,

    // rewards
    Marshmallows,
    GummyBears,
    Cookies,
    Candy,
    Chocolate,

    // dangers
    Zombie,
    Ghost,
    Witch,
    Fog,
    Shadows,
    Crow,
    BlackCat,
    Skeleton,
    Spider,
    Bat,
    Pumpkin,
};

constexpr int32_t CellWeight(CellType t)
{
    switch (t)
    {
    case CellType::Start:        return 0;
    case CellType::Exit:         return 0;
    case CellType::Wall:         return 0;
    case CellType::Path:         return 0;
    case CellType::Marshmallows: return -2;
    case CellType::GummyBears:   return -3;
    case CellType::Cookies:      return -4;
    case CellType::Candy:        return -2;
    case CellType::Chocolate:    return -6;
    case CellType::Zombie:       return 7;
    case CellType::Ghost:        return 6;
    case CellType::Witch:        return 9;
    case CellType::Fog:          return 3;
    case CellType::Shadows:      return 4;
    case CellType::Crow:         return 5;
    case CellType::BlackCat:     return 2;
    case CellType::Skeleton:     return 5;
    case CellType::Spider:       return 3;
    case CellType::Bat:          return 1;
    case CellType::Pumpkin:      return 2;
    }
    return 0;
}

constexpr bool IsReward(CellType t)
{
    return t >= CellType::Marshmallows && t <= CellType::Chocolate;
}

constexpr bool IsDanger(CellType t)
{
    return t >= CellType::Zombie && t <= CellType::Pumpkin;
}

constexpr bool IsArtifact(CellType t)
{
    return IsReward(t) || IsDanger(t);
}

// everything except Wall can be walked on
constexpr bool IsTraversable(CellType t)
{
    return t != CellType::Wall;
}

constexpr std::array<CellType, 5> RewardTypes = {
    CellType::Marshmallows,
    CellType::GummyBears,
    CellType::Cookies,
    CellType::Candy,
    CellType::Chocolate,
};

constexpr std::array<CellType, 11> DangerTypes = {
    CellType::Zombie,
    CellType::Ghost,
    CellType::Witch,
    CellType::Fog,
    CellType::Shadows,
    CellType::Crow,
    CellType::BlackCat,
    CellType::Skeleton,
    CellType::Spider,
    CellType::Bat,
    CellType::Pumpkin,
};

namespace detail
{
    template <size_t N>
    constexpr bool AllWeights(const std::array<CellType, N>& types, int sign)
    {
        for (CellType t : types)
        {
            const int32_t w = CellWeight(t);
            if (sign < 0 && !(w < 0 && w >= -6)) return false;
            if (sign > 0 && !(w > 0 && w <= 9)) return false;
        }
        return true;
    }
}

static_assert(detail::AllWeights(RewardTypes, -1), "reward weights must lie in [-6, -1]");
static_assert(detail::AllWeights(DangerTypes, 1), "danger weights must lie in [1, 9]");
static_assert(CellWeight(CellType::Wall) == 0 && CellWeight(CellType::Path) == 0 &&
              CellWeight(CellType::Start) == 0 && CellWeight(CellType::Exit) == 0,
              "structural cells carry no weight");
static_assert(!IsTraversable(CellType::Wall) && IsTraversable(CellType::Exit), "");

const char* CellTypeName(CellType t);
