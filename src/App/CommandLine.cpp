#include "App/CommandLine.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

static std::string toLower_(const std::string& s)
{
    std::string t;
    t.reserve(s.size());
    for (unsigned char ch : s) t.push_back((char)std::tolower(ch));
    return t;
}

static bool parseInt_(const std::string& s, int32_t& out)
{
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    if (v < INT32_MIN || v > INT32_MAX) return false;
    out = (int32_t)v;
    return true;
}

static bool parseU32_(const std::string& s, uint32_t& out)
{
    if (s.empty() || s[0] == '-') return false;
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    if (v > UINT32_MAX) return false;
    out = (uint32_t)v;
    return true;
}

static bool parseFloat_(const std::string& s, float& out)
{
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const float v = std::strtof(s.c_str(), &end);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

bool ParseExitSide(const std::string& s, ExitSide& out)
{
    const std::string t = toLower_(s);
    if (t == "left"   || t == "l") { out = ExitSide::Left;   return true; }
    if (t == "right"  || t == "r") { out = ExitSide::Right;  return true; }
    if (t == "top"    || t == "t") { out = ExitSide::Top;    return true; }
    if (t == "bottom" || t == "b") { out = ExitSide::Bottom; return true; }
    if (t == "random")             { out = ExitSide::Random; return true; }
    return false;
}

bool ParseSolutionType(const std::string& s, SolutionType& out)
{
    const std::string t = toLower_(s);
    if (t == "none") { out = SolutionType::None; return true; }
    if (t == "route" || t == "shortest_path") { out = SolutionType::Route; return true; }
    if (t == "mst" || t == "minimum_spanning_tree") { out = SolutionType::MinimumSpanningTree; return true; }
    return false;
}

bool ParseRouteOrder(const std::string& s, RouteOrder& out)
{
    const std::string t = toLower_(s);
    if (t == "dfs" || t == "depth") { out = RouteOrder::DepthFirst; return true; }
    if (t == "bfs" || t == "breadth") { out = RouteOrder::BreadthFirst; return true; }
    return false;
}

const char* UsageText()
{
    return
        "Usage: mazegen [options]\n"
        "Generate and solve mazes.\n"
        "\n"
        "  -w, --width <n>          Width of the maze (default 60)\n"
        "  -h, --height <n>         Height of the maze (default 30)\n"
        "  -r, --room-size <n>      Size of the central room (default 3)\n"
        "  -e, --exit <side>        left|right|top|bottom|random (default right)\n"
        "  -a, --artifacts <ratio>  Share of path cells that receive artifacts, 0..1\n"
        "  -d, --dot <file>         Write the maze graph as a GraphViz DOT file\n"
        "      --dot-graph <kind>   full|mst (default full)\n"
        "  -s, --svg <file>         Write the maze as an SVG file\n"
        "      --scale <f>          SVG scale (default 10)\n"
        "      --with-path <kind>   none|route|mst overlay in the SVG (default none)\n"
        "      --route-order <o>    dfs|bfs (default dfs)\n"
        "      --seed <n>           Random seed (default: random)\n"
        "  -v, --verbose            Enable verbose output\n"
        "      --help               Show this help\n";
}

bool ParseCommandLine(const std::vector<std::string>& args, AppOptions& out, std::string& outError)
{
    outError.clear();

    for (size_t i = 1; i < args.size(); ++i)
    {
        std::string name = args[i];
        std::string value;
        bool hasValue = false;

        if (name.size() > 2 && name.compare(0, 2, "--") == 0)
        {
            const size_t eq = name.find('=');
            if (eq != std::string::npos)
            {
                value = name.substr(eq + 1);
                name = name.substr(0, eq);
                hasValue = true;
            }
        }
        name = toLower_(name);

        if (name == "--help") { out.showHelp = true; continue; }
        if (name == "-v" || name == "--verbose") { out.verbose = true; continue; }

        auto takeValue = [&]() -> bool {
            if (hasValue) return true;
            if (i + 1 >= args.size())
            {
                outError = "Missing value for " + args[i] + ".";
                return false;
            }
            value = args[++i];
            return true;
        };

        auto bad = [&](const char* what) {
            outError = "Invalid " + std::string(what) + ": '" + value + "'.";
            return false;
        };

        if (name == "-w" || name == "--width")
        {
            if (!takeValue()) return false;
            if (!parseInt_(value, out.maze.width)) return bad("width");
        }
        else if (name == "-h" || name == "--height")
        {
            if (!takeValue()) return false;
            if (!parseInt_(value, out.maze.height)) return bad("height");
        }
        else if (name == "-r" || name == "--room-size")
        {
            if (!takeValue()) return false;
            if (!parseInt_(value, out.maze.roomSize)) return bad("room size");
        }
        else if (name == "-e" || name == "--exit")
        {
            if (!takeValue()) return false;
            if (!ParseExitSide(value, out.maze.exitSide)) return bad("exit side");
        }
        else if (name == "-a" || name == "--artifacts")
        {
            if (!takeValue()) return false;
            float r = 0.0f;
            if (!parseFloat_(value, r) || r < 0.0f || r > 1.0f) return bad("artifacts ratio");
            out.artifactsRatio = r;
        }
        else if (name == "-d" || name == "--dot")
        {
            if (!takeValue()) return false;
            out.dotFile = value;
        }
        else if (name == "--dot-graph")
        {
            if (!takeValue()) return false;
            const std::string t = toLower_(value);
            if (t == "full") out.dotSpanningTree = false;
            else if (t == "mst") out.dotSpanningTree = true;
            else return bad("DOT graph kind");
        }
        else if (name == "-s" || name == "--svg")
        {
            if (!takeValue()) return false;
            out.svgFile = value;
        }
        else if (name == "--scale")
        {
            if (!takeValue()) return false;
            if (!parseFloat_(value, out.scale) || out.scale <= 0.0f) return bad("scale");
        }
        else if (name == "--with-path")
        {
            if (!takeValue()) return false;
            if (!ParseSolutionType(value, out.withPath)) return bad("solution type");
        }
        else if (name == "--route-order")
        {
            if (!takeValue()) return false;
            if (!ParseRouteOrder(value, out.routeOrder)) return bad("route order");
        }
        else if (name == "--seed")
        {
            if (!takeValue()) return false;
            uint32_t s = 0;
            if (!parseU32_(value, s)) return bad("seed");
            out.seed = s;
        }
        else
        {
            outError = "Unknown option '" + args[i] + "'.";
            return false;
        }
    }

    return true;
}
