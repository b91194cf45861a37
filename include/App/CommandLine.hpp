#pragma once
#include "core/Common.hpp"
#include "core/MazeBuilder.hpp"
#include "Export/SvgExporter.hpp"

#include <string>
#include <vector>

struct AppOptions
{
    MazeConfig maze{};
    std::optional<float> artifactsRatio{};

    std::string dotFile;
    bool dotSpanningTree{false};

    std::string svgFile;
    float scale{10.0f};
    SolutionType withPath{SolutionType::None};

    RouteOrder routeOrder{RouteOrder::DepthFirst};
    std::optional<uint32_t> seed{};

    bool verbose{false};
    bool showHelp{false};
};

// args[0] is the program name. Accepts "--opt value" and "--opt=value";
// option names are case-insensitive.
bool ParseCommandLine(const std::vector<std::string>& args, AppOptions& out, std::string& outError);

bool ParseExitSide(const std::string& s, ExitSide& out);
bool ParseSolutionType(const std::string& s, SolutionType& out);
bool ParseRouteOrder(const std::string& s, RouteOrder& out);

const char* UsageText();

int RunApp(const AppOptions& options);
