#include "core/Common.hpp"
#include "App/CommandLine.hpp"

int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv, argv + argc);

    AppOptions options;
    std::string error;
    if (!ParseCommandLine(args, options, error))
    {
        std::cerr << "mazegen: " << error << "\n\n" << UsageText();
        return 2;
    }

    if (options.showHelp)
    {
        std::cout << UsageText();
        return 0;
    }

    return RunApp(options);
}
