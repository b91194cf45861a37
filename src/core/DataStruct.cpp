#include "core/DataStruct.hpp"

const char* CellTypeName(CellType t)
{
    switch (t)
    {
    case CellType::Start:        return "Start";
    case CellType::Exit:         return "Exit";
    case CellType::Wall:         return "Wall";
    case CellType::Path:         return "Path";
    case CellType::Marshmallows: return "Marshmallows";
    case CellType::GummyBears:   return "Gummy Bears";
    case CellType::Cookies:      return "Cookies";
    case CellType::Candy:        return "Candy";
    case CellType::Chocolate:    return "Chocolate";
    case CellType::Zombie:       return "Zombie";
    case CellType::Ghost:        return "Ghost";
    case CellType::Witch:        return "Witch";
    case CellType::Fog:          return "Fog";
    case CellType::Shadows:      return "Shadows";
    case CellType::Crow:         return "Crow";
    case CellType::BlackCat:     return "Black Cat";
    case CellType::Skeleton:     return "Skeleton";
    case CellType::Spider:       return "Spider";
    case CellType::Bat:          return "Bat";
    case CellType::Pumpkin:      return "Pumpkin";
    }
    return "Unknown";
}
