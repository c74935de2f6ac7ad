#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for the inkboard tool.
 *
 * Supported commands:
 * - info:   Print stroke and compression statistics of an .isf file
 * - render: Bake an .isf file through the tile pipeline into a PNG
 * - demo:   Capture sinusoidal test strokes and write them as .isf
 */

#include <QString>
#include <QStringList>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

// =============================================================================
// CLI Commands
// =============================================================================

/**
 * @brief Known CLI commands.
 */
enum class Command {
    None,           ///< No command given
    Help,           ///< Show help message
    Version,        ///< Show version information
    Info,           ///< Inspect an .isf file
    Render,         ///< Rasterize an .isf file to PNG
    Demo            ///< Generate an .isf file from test strokes
};

/**
 * @brief Output mode for CLI results.
 */
enum class OutputMode {
    Simple,         ///< Short human-readable report (default)
    Verbose,        ///< Per-stroke details and debug logging
    Json            ///< JSON format for scripting
};

// =============================================================================
// Exit Codes
// =============================================================================

/**
 * @brief Exit codes for CLI operations.
 */
namespace ExitCode {
    constexpr int Success = 0;        ///< Operation succeeded
    constexpr int Failure = 1;        ///< Operation ran but produced nothing usable
    constexpr int DecodeError = 2;    ///< Input is not a valid .isf container
    constexpr int InvalidArgs = 3;    ///< Bad command line arguments
    constexpr int IoError = 4;        ///< Can't read/write files
}

// =============================================================================
// Command Detection
// =============================================================================

/**
 * @brief Parse the command from command-line arguments.
 *
 * Extracts the command keyword from argv[1] if present.
 *
 * @param argc Argument count
 * @param argv Argument vector
 * @return The detected command, or Command::None
 */
Command parseCommand(int argc, char* argv[]);

/**
 * @brief Get command name as string.
 * @param cmd The command
 * @return Command name string (e.g., "render")
 */
QString commandName(Command cmd);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Configure QCommandLineParser for a specific command.
 *
 * @param parser The parser to configure
 * @param cmd The command to set up options for
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Show help message for a command.
 *
 * If cmd is Command::None, shows general help with available commands.
 *
 * @param parser The configured parser
 * @param cmd The command (or Command::None for general help)
 */
void showHelp(const QCommandLineParser& parser, Command cmd);

/**
 * @brief Show version information.
 */
void showVersion();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Run the CLI.
 *
 * Parses arguments, executes the requested command, and returns an exit code.
 *
 * @param app The QCoreApplication instance
 * @param argc Argument count
 * @param argv Argument vector
 * @return Exit code (see ExitCode namespace)
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
