#ifndef CLIREPORT_H
#define CLIREPORT_H

/**
 * @file CliReport.h
 * @brief Console reporter for inkboard commands.
 *
 * Formats command results for terminal display.
 * Supports three output modes:
 * - Simple: A few summary lines
 * - Verbose: Summary plus one line per stroke
 * - JSON: One object per line for scripting
 */

#include "CliParser.h"
#include "../codec/IsfCodec.h"

#include <QSize>
#include <QTextStream>

class InkDocument;

namespace Cli {

/**
 * @brief Result reporter for console output.
 *
 * Usage:
 * @code
 *   ConsoleReport report(OutputMode::Simple);
 *   report.reportInfo(path, fileSize, document, options);
 * @endcode
 */
class ConsoleReport {
public:
    /**
     * @brief Construct a reporter.
     * @param mode Output mode (Simple, Verbose, or Json)
     */
    explicit ConsoleReport(OutputMode mode = OutputMode::Simple);

    OutputMode mode() const { return m_mode; }

    /**
     * @brief Report the content of a decoded document (info command).
     *
     * Verbose and JSON modes add one entry per stroke.
     */
    void reportInfo(const QString& path, qint64 fileSize, const InkDocument& document,
                    const IsfOptions& options);

    /**
     * @brief Report a rendered image (render command).
     */
    void reportRender(const QString& path, const QSize& pixels, int tiles, qint64 fileSize);

    /**
     * @brief Report a written container (demo command).
     */
    void reportDemo(const QString& path, int strokes, const CompressionStats& stats, qint64 fileSize);

    /**
     * @brief Report an error message to stderr.
     */
    void reportError(const QString& message);

    /**
     * @brief Report a warning message to stderr.
     */
    void reportWarning(const QString& message);

private:
    // Output the compression block in Simple/Verbose mode
    void writeStatsText(const CompressionStats& stats);

    // Output compression fields as JSON members (leading comma included)
    void writeStatsJson(const CompressionStats& stats);

    // Format file size for display (e.g., "1.5 KB")
    static QString formatSize(qint64 bytes);

    // Escape string for JSON output
    static QString jsonEscape(const QString& str);

private:
    OutputMode m_mode;
    QTextStream m_out;      ///< stdout stream
    QTextStream m_err;      ///< stderr stream
};

} // namespace Cli

#endif // CLIREPORT_H
