#include "mdlive/logging.hpp"
#include "mdlive/preview_options.hpp"
#include "mdlive/view/json_export.hpp"
#include "mdlive/view/preview_window.hpp"

#include <plog/Log.h>

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace
{

enum class Mode
{
    Interactive,
    Dump,
    Outline,
    Render
};

struct CommandLine
{
    Mode mode = Mode::Interactive;
    std::vector<std::string> files;
    std::optional<std::size_t> caret;
    int width = 80;
    std::string configPath;
};

void printHelp()
{
    std::cout << mdlive::view::kAppName << " - " << mdlive::view::kAppShortDescription << "\n\n";
    std::cout << "Usage: " << mdlive::view::kAppName << " [OPTIONS] [FILE...]\n\n";
    std::cout << "Without OPTIONS each FILE opens in its own preview window. Move the caret\n"
                 "with the cursor keys to reveal the Markdown source under it.\n\n";
    std::cout << "Options:\n"
                 "  --dump FILE      Print the render instructions of FILE as JSON\n"
                 "  --outline FILE   Print the heading outline of FILE as JSON\n"
                 "  --render FILE    Print FILE as it appears in the preview\n"
                 "  --caret N        Place the caret at byte offset N before rendering\n"
                 "  --width N        Column count used by --render (default 80)\n"
                 "  --config PATH    Read options from PATH instead of the default location\n"
                 "  -h, --help       Show this help" << std::endl;
}

bool isHelpFlag(std::string_view arg)
{
    return arg == "--help" || arg == "-h";
}

template <typename T>
bool parseNumber(std::string_view text, T &out)
{
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && end == text.data() + text.size();
}

std::optional<CommandLine> parseCommandLine(int argc, char **argv)
{
    CommandLine line;
    auto needValue = [&](int &i, std::string_view flag) -> std::optional<std::string_view> {
        if (i + 1 >= argc)
        {
            std::cerr << flag << " needs a value\n";
            return std::nullopt;
        }
        return std::string_view(argv[++i]);
    };
    auto setMode = [&](Mode mode, std::string_view file) {
        line.mode = mode;
        line.files.assign(1, std::string(file));
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--dump" || arg == "--outline" || arg == "--render")
        {
            auto value = needValue(i, arg);
            if (!value)
                return std::nullopt;
            setMode(arg == "--dump" ? Mode::Dump : arg == "--outline" ? Mode::Outline : Mode::Render, *value);
        }
        else if (arg == "--caret")
        {
            auto value = needValue(i, arg);
            std::size_t caret = 0;
            if (!value || !parseNumber(*value, caret))
            {
                std::cerr << "--caret expects a byte offset\n";
                return std::nullopt;
            }
            line.caret = caret;
        }
        else if (arg == "--width")
        {
            auto value = needValue(i, arg);
            if (!value || !parseNumber(*value, line.width) || line.width < 1)
            {
                std::cerr << "--width expects a positive column count\n";
                return std::nullopt;
            }
        }
        else if (arg == "--config")
        {
            auto value = needValue(i, arg);
            if (!value)
                return std::nullopt;
            line.configPath = std::string(*value);
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            std::cerr << "Unknown option " << arg << "\n";
            return std::nullopt;
        }
        else if (line.mode == Mode::Interactive)
        {
            line.files.emplace_back(arg);
        }
    }
    return line;
}

int runBatch(const CommandLine &line, const mdlive::preview::EngineOptions &options)
{
    using namespace mdlive::preview;

    std::optional<std::string> text = mdlive::view::readTextFile(line.files.front());
    if (!text)
    {
        std::cerr << "Cannot read " << line.files.front() << "\n";
        return 1;
    }

    SnapshotPtr snapshot = DocumentSnapshot::create(std::move(*text));
    LivePreviewEngine engine(options);
    RevealOracle oracle = line.caret ? SelectionState(*line.caret).oracle() : neverReveal();
    DecorationSet decorations = engine.decorations(snapshot, oracle);

    switch (line.mode)
    {
    case Mode::Dump:
        std::cout << mdlive::view::decorationsToJson(decorations).dump(2) << std::endl;
        break;
    case Mode::Outline:
        std::cout << mdlive::view::outlineToJson(engine.outline()).dump(2) << std::endl;
        break;
    case Mode::Render:
    {
        mdlive::view::TerminalRenderer renderer(line.width);
        for (const auto &row : renderer.render(*snapshot, decorations))
            std::cout << row.text << '\n';
        std::cout.flush();
        break;
    }
    case Mode::Interactive:
        break;
    }
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        if (isHelpFlag(std::string_view{argv[i]}))
        {
            printHelp();
            return 0;
        }
    }

    std::optional<CommandLine> commandLine = parseCommandLine(argc, argv);
    if (!commandLine)
        return 2;

    mdlive::logging::init(plog::warning);

    mdlive::config::OptionRegistry registry;
    mdlive::config::registerPreviewOptions(registry);
    if (!commandLine->configPath.empty())
    {
        if (!registry.loadFromFile(commandLine->configPath))
            PLOG_WARNING << "Using default options; could not load " << commandLine->configPath;
    }
    else if (!registry.loadDefaults())
    {
        PLOGD << "No options loaded from " << registry.defaultOptionsPath().string();
    }
    mdlive::logging::init(mdlive::config::logLevel(registry));
    const mdlive::preview::EngineOptions options = mdlive::config::engineOptions(registry);

    if (commandLine->mode != Mode::Interactive)
        return runBatch(*commandLine, options);

    mdlive::view::PreviewApp app(commandLine->files, options);
    app.run();
    app.shutDown();
    return 0;
}
