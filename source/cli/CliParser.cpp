#include "CliParser.h"
#include "CliHandler.h"

#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTextStream>
#include <cstring>

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 *
 * @see CliParser.h for API documentation
 */

namespace Cli {

// Application version (matches CMakeLists.txt project VERSION)
static const char* APP_VERSION = "0.3.0";

// =============================================================================
// Command Detection
// =============================================================================

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }

    const char* arg1 = argv[1];

    if (std::strcmp(arg1, "info") == 0) {
        return Command::Info;
    }
    if (std::strcmp(arg1, "render") == 0) {
        return Command::Render;
    }
    if (std::strcmp(arg1, "demo") == 0) {
        return Command::Demo;
    }

    // Global flags
    if (std::strcmp(arg1, "--help") == 0 || std::strcmp(arg1, "-h") == 0) {
        return Command::Help;
    }
    if (std::strcmp(arg1, "--version") == 0 || std::strcmp(arg1, "-v") == 0) {
        return Command::Version;
    }

    return Command::None;
}

QString commandName(Command cmd)
{
    switch (cmd) {
        case Command::Info:    return QStringLiteral("info");
        case Command::Render:  return QStringLiteral("render");
        case Command::Demo:    return QStringLiteral("demo");
        case Command::Help:    return QStringLiteral("help");
        case Command::Version: return QStringLiteral("version");
        default:               return QString();
    }
}

// =============================================================================
// Parser Setup
// =============================================================================

static void addCommonOptions(QCommandLineParser& parser)
{
    parser.addOption(QCommandLineOption(
        QStringLiteral("verbose"),
        QCoreApplication::translate("CLI", "Show details and debug output")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("json"),
        QCoreApplication::translate("CLI", "Output results as JSON")));
}

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "InkBoard - Ink capture, tiling and ISF tools"));

    parser.addHelpOption();
    parser.addVersionOption();

    switch (cmd) {
        case Command::Info:
            parser.addPositionalArgument(
                QStringLiteral("input"),
                QCoreApplication::translate("CLI", "ISF container file"),
                QStringLiteral("<input.isf>"));

            parser.addOption(QCommandLineOption(
                QStringLiteral("precision"),
                QCoreApplication::translate("CLI", "Position precision for statistics (default: 2)"),
                QStringLiteral("N"),
                QStringLiteral("2")));

            addCommonOptions(parser);
            break;

        case Command::Render:
            parser.addPositionalArgument(
                QStringLiteral("input"),
                QCoreApplication::translate("CLI", "ISF container file"),
                QStringLiteral("<input.isf>"));

            parser.addOption(QCommandLineOption(
                {QStringLiteral("o"), QStringLiteral("output")},
                QCoreApplication::translate("CLI", "Output PNG file"),
                QStringLiteral("path")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("scale"),
                QCoreApplication::translate("CLI", "Viewport scale, 0.1 to 5 (default: 1)"),
                QStringLiteral("N"),
                QStringLiteral("1")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("dpr"),
                QCoreApplication::translate("CLI", "Device pixel ratio (default: 1)"),
                QStringLiteral("N"),
                QStringLiteral("1")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("margin"),
                QCoreApplication::translate("CLI", "World units of padding around the ink (default: 16)"),
                QStringLiteral("N"),
                QStringLiteral("16")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("background"),
                QCoreApplication::translate("CLI", "Background color (default: #ffffff)"),
                QStringLiteral("color"),
                QStringLiteral("#ffffff")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("transparent"),
                QCoreApplication::translate("CLI", "Keep the background transparent")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("overwrite"),
                QCoreApplication::translate("CLI", "Overwrite an existing output file")));

            addCommonOptions(parser);
            break;

        case Command::Demo:
            parser.addOption(QCommandLineOption(
                {QStringLiteral("o"), QStringLiteral("output")},
                QCoreApplication::translate("CLI", "Output .isf file"),
                QStringLiteral("path")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("points"),
                QCoreApplication::translate("CLI", "Raw samples per stroke (default: 200)"),
                QStringLiteral("N"),
                QStringLiteral("200")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("strokes"),
                QCoreApplication::translate("CLI", "Number of strokes (default: 3)"),
                QStringLiteral("N"),
                QStringLiteral("3")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("precision"),
                QCoreApplication::translate("CLI", "Position precision (default: 2)"),
                QStringLiteral("N"),
                QStringLiteral("2")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("overwrite"),
                QCoreApplication::translate("CLI", "Overwrite an existing output file")));

            addCommonOptions(parser);
            break;

        default:
            // No command-specific options for Help/Version/None
            break;
    }
}

// =============================================================================
// Help and Version
// =============================================================================

void showHelp(const QCommandLineParser& parser, Command cmd)
{
    QTextStream out(stdout);

    if (cmd == Command::None || cmd == Command::Help) {
        out << QCoreApplication::translate("CLI",
            "Usage: inkboard <command> [options] [file]\n"
            "\n"
            "InkBoard - Ink capture, tiling and ISF tools.\n"
            "\n"
            "COMMANDS:\n"
            "  info            Show stroke and compression statistics of an .isf file\n"
            "  render          Bake an .isf file through the tile pipeline into a PNG\n"
            "  demo            Capture sinusoidal test strokes and save them as .isf\n"
            "\n"
            "GLOBAL OPTIONS:\n"
            "  -h, --help      Show this help message\n"
            "  -v, --version   Show version information\n"
            "\n"
            "COMMON OPTIONS (work with all commands):\n"
            "  --verbose       Show details and debug output\n"
            "  --json          Output results as JSON (for scripting)\n"
            "\n"
            "QUICK START:\n"
            "  inkboard demo -o strokes.isf\n"
            "  inkboard info strokes.isf\n"
            "  inkboard render strokes.isf -o strokes.png --dpr 2\n"
            "\n"
            "EXIT CODES:\n"
            "  0   Success\n"
            "  1   Nothing to do (e.g. empty document)\n"
            "  2   Input is not a valid ISF container\n"
            "  3   Invalid arguments\n"
            "  4   File could not be read or written\n"
            "\n"
            "Run 'inkboard <command> --help' for command-specific options.\n");
    } else if (cmd == Command::Info) {
        out << QCoreApplication::translate("CLI",
            "Usage: inkboard info [OPTIONS] <input.isf>\n"
            "\n"
            "Decode an ISF container and report what it holds.\n"
            "\n"
            "OPTIONS:\n"
            "  --precision <N>         Position precision used for statistics (default: 2)\n"
            "  --verbose               List every stroke\n"
            "  --json                  Output results as JSON\n"
            "  -h, --help              Show this help\n");
    } else if (cmd == Command::Render) {
        out << QCoreApplication::translate("CLI",
            "Usage: inkboard render [OPTIONS] <input.isf> -o <output.png>\n"
            "\n"
            "Load an ISF container, bake the tiles covering its ink (erasers\n"
            "applied) and composite them into one image.\n"
            "\n"
            "OPTIONS:\n"
            "  -o, --output <path>     Output PNG file [required]\n"
            "  --scale <N>             Viewport scale, 0.1 to 5 (default: 1)\n"
            "  --dpr <N>               Device pixel ratio (default: 1)\n"
            "  --margin <N>            Padding around the ink in world units (default: 16)\n"
            "  --background <color>    Background color (default: #ffffff)\n"
            "  --transparent           Keep the background transparent\n"
            "  --overwrite             Overwrite an existing output file\n"
            "  --verbose               Show details and debug output\n"
            "  --json                  Output results as JSON\n"
            "  -h, --help              Show this help\n");
    } else if (cmd == Command::Demo) {
        out << QCoreApplication::translate("CLI",
            "Usage: inkboard demo [OPTIONS] -o <output.isf>\n"
            "\n"
            "Feed sinusoidal test strokes through the capture engine and save\n"
            "the result as an ISF container.\n"
            "\n"
            "OPTIONS:\n"
            "  -o, --output <path>     Output .isf file [required]\n"
            "  --points <N>            Raw samples per stroke (default: 200)\n"
            "  --strokes <N>           Number of strokes (default: 3)\n"
            "  --precision <N>         Position precision (default: 2)\n"
            "  --overwrite             Overwrite an existing output file\n"
            "  --verbose               Show details and debug output\n"
            "  --json                  Output results as JSON\n"
            "  -h, --help              Show this help\n");
    } else {
        out << parser.helpText();
    }
}

void showVersion()
{
    QTextStream out(stdout);
    out << "InkBoard " << APP_VERSION << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    Q_UNUSED(app)

    Command cmd = parseCommand(argc, argv);

    if (cmd == Command::Version) {
        showVersion();
        return ExitCode::Success;
    }

    if (cmd == Command::Help || cmd == Command::None) {
        QCommandLineParser parser;
        setupParser(parser, Command::None);
        showHelp(parser, cmd);
        return (cmd == Command::Help) ? ExitCode::Success : ExitCode::InvalidArgs;
    }

    QCommandLineParser parser;
    setupParser(parser, cmd);

    // QCommandLineParser doesn't understand subcommands: drop the command name
    QStringList args;
    args << QString::fromLocal8Bit(argv[0]);
    for (int i = 2; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }

    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ")
            << parser.errorText() << "\n\n";
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }

    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }

    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }

    // Debug logging only when asked for
    if (!parser.isSet(QStringLiteral("verbose"))) {
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));
    }

    switch (cmd) {
        case Command::Info:
            return handleInfo(parser);
        case Command::Render:
            return handleRender(parser);
        case Command::Demo:
            return handleDemo(parser);
        default:
            // Help/Version/None handled above
            return ExitCode::InvalidArgs;
    }
}

} // namespace Cli
