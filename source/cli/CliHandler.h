#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for the inkboard tool.
 *
 * Provides handler functions for each CLI command:
 * - info: Decode an .isf container and report statistics
 * - render: Bake an .isf container into a PNG through the tile pipeline
 * - demo: Capture test strokes and write an .isf container
 */

#include "CliParser.h"

#include <QCommandLineParser>

namespace Cli {

/**
 * @brief Handle the info command.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleInfo(const QCommandLineParser& parser);

/**
 * @brief Handle the render command.
 *
 * Loads the container, sizes a viewport around the ink, bakes the visible
 * tiles at scale × dpr and composites them through RasterRenderSink.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleRender(const QCommandLineParser& parser);

/**
 * @brief Handle the demo command.
 *
 * Replays the sinusoidal test stroke as raw samples through the capture
 * engine, one stroke per row, and writes the document as a container.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleDemo(const QCommandLineParser& parser);

/**
 * @brief Determine the output mode from parser options.
 *
 * Priority: --json > --verbose > Simple
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return The output mode to use
 */
OutputMode getOutputMode(const QCommandLineParser& parser);

} // namespace Cli

#endif // CLIHANDLER_H
