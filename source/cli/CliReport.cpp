#include "CliReport.h"
#include "../core/InkDocument.h"

#include <QCoreApplication>
#include <QFileInfo>

/**
 * @file CliReport.cpp
 * @brief Implementation of the console reporter.
 *
 * @see CliReport.h for API documentation
 */

namespace Cli {

ConsoleReport::ConsoleReport(OutputMode mode)
    : m_mode(mode)
    , m_out(stdout)
    , m_err(stderr)
{
}

// =============================================================================
// Command Results
// =============================================================================

void ConsoleReport::reportInfo(const QString& path, qint64 fileSize, const InkDocument& document,
                               const IsfOptions& options)
{
    const CompressionStats stats = document.compressionStats(options);
    const QRectF bounds = document.inkBounds();

    if (m_mode == OutputMode::Json) {
        // {"type":"info","file":"a.isf","size":923,"strokes":1,"erasers":0,...}
        m_out << "{\"type\":\"info\""
              << ",\"file\":\"" << jsonEscape(path) << "\""
              << ",\"size\":" << fileSize
              << ",\"strokes\":" << document.strokeCount()
              << ",\"erasers\":" << document.eraseStrokeCount();
        writeStatsJson(stats);
        m_out << ",\"bounds\":[" << bounds.x() << "," << bounds.y() << ","
              << bounds.width() << "," << bounds.height() << "]}\n";

        for (const InkStroke* stroke : document.strokes() + document.eraseStrokes()) {
            m_out << "{\"type\":\"stroke\""
                  << ",\"id\":" << stroke->id
                  << ",\"eraser\":" << (stroke->isEraser ? "true" : "false")
                  << ",\"points\":" << stroke->pointCount()
                  << ",\"color\":\"" << stroke->color.name() << "\""
                  << ",\"width\":" << stroke->baseWidth
                  << ",\"length\":" << stroke->totalLength
                  << "}\n";
        }
        m_out.flush();
        return;
    }

    m_out << QFileInfo(path).fileName() << " (" << formatSize(fileSize) << ")\n";
    m_out << QCoreApplication::translate("CLI", "Strokes:  ") << document.strokeCount() << "\n";
    if (document.eraseStrokeCount() > 0) {
        m_out << QCoreApplication::translate("CLI", "Erasers:  ") << document.eraseStrokeCount() << "\n";
    }
    writeStatsText(stats);
    if (!bounds.isNull()) {
        m_out << QCoreApplication::translate("CLI", "Bounds:   ")
              << QStringLiteral("%1, %2  %3 x %4")
                     .arg(bounds.x(), 0, 'f', 1).arg(bounds.y(), 0, 'f', 1)
                     .arg(bounds.width(), 0, 'f', 1).arg(bounds.height(), 0, 'f', 1)
              << "\n";
    }

    if (m_mode == OutputMode::Verbose) {
        m_out << "\n";
        for (const InkStroke* stroke : document.strokes() + document.eraseStrokes()) {
            const CompressionStats s = IsfSerializer::compressionStats(*stroke, options);
            m_out << QStringLiteral("  #%1 %2 %3 pts  width %4  %5  %6 B (%7:1)\n")
                         .arg(stroke->id)
                         .arg(stroke->isEraser ? QStringLiteral("eraser") : QStringLiteral("ink"))
                         .arg(stroke->pointCount())
                         .arg(stroke->baseWidth, 0, 'f', 2)
                         .arg(stroke->color.name())
                         .arg(s.compressedSize)
                         .arg(s.compressionRatio, 0, 'f', 2);
        }
    }
    m_out.flush();
}

void ConsoleReport::reportRender(const QString& path, const QSize& pixels, int tiles, qint64 fileSize)
{
    if (m_mode == OutputMode::Json) {
        m_out << "{\"type\":\"render\""
              << ",\"output\":\"" << jsonEscape(path) << "\""
              << ",\"width\":" << pixels.width()
              << ",\"height\":" << pixels.height()
              << ",\"tiles\":" << tiles
              << ",\"size\":" << fileSize
              << "}\n";
    } else {
        m_out << QCoreApplication::translate("CLI", "Rendered %1 (%2 x %3 px, %4 tiles, %5)\n")
                     .arg(QFileInfo(path).fileName())
                     .arg(pixels.width()).arg(pixels.height())
                     .arg(tiles)
                     .arg(formatSize(fileSize));
    }
    m_out.flush();
}

void ConsoleReport::reportDemo(const QString& path, int strokes, const CompressionStats& stats,
                               qint64 fileSize)
{
    if (m_mode == OutputMode::Json) {
        m_out << "{\"type\":\"demo\""
              << ",\"output\":\"" << jsonEscape(path) << "\""
              << ",\"size\":" << fileSize
              << ",\"strokes\":" << strokes;
        writeStatsJson(stats);
        m_out << "}\n";
    } else {
        m_out << QCoreApplication::translate("CLI", "Wrote %1 (%2, %3 strokes)\n")
                     .arg(QFileInfo(path).fileName())
                     .arg(formatSize(fileSize))
                     .arg(strokes);
        writeStatsText(stats);
    }
    m_out.flush();
}

// =============================================================================
// Error/Warning Reporting
// =============================================================================

void ConsoleReport::reportError(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        m_err << "{\"type\":\"error\",\"message\":\"" << jsonEscape(message) << "\"}\n";
    } else {
        m_err << QCoreApplication::translate("CLI", "Error: ") << message << "\n";
    }
    m_err.flush();
}

void ConsoleReport::reportWarning(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        m_err << "{\"type\":\"warning\",\"message\":\"" << jsonEscape(message) << "\"}\n";
    } else {
        m_err << QCoreApplication::translate("CLI", "Warning: ") << message << "\n";
    }
    m_err.flush();
}

// =============================================================================
// Helpers
// =============================================================================

void ConsoleReport::writeStatsText(const CompressionStats& stats)
{
    m_out << QCoreApplication::translate("CLI", "Points:   ") << stats.pointCount << "\n";
    m_out << QCoreApplication::translate("CLI", "Raw:      ") << formatSize(stats.originalSize) << "\n";
    m_out << QCoreApplication::translate("CLI", "Encoded:  ") << formatSize(stats.compressedSize) << "\n";
    m_out << QCoreApplication::translate("CLI", "Ratio:    ")
          << QString::number(stats.compressionRatio, 'f', 2) << ":1  ("
          << QString::number(stats.bytesPerPoint, 'f', 2)
          << QCoreApplication::translate("CLI", " bytes/point)\n");
}

void ConsoleReport::writeStatsJson(const CompressionStats& stats)
{
    m_out << ",\"points\":" << stats.pointCount
          << ",\"original_size\":" << stats.originalSize
          << ",\"compressed_size\":" << stats.compressedSize
          << ",\"compression_ratio\":" << QString::number(stats.compressionRatio, 'f', 4)
          << ",\"bytes_per_point\":" << QString::number(stats.bytesPerPoint, 'f', 4);
}

QString ConsoleReport::formatSize(qint64 bytes)
{
    if (bytes < 1024) {
        return QStringLiteral("%1 B").arg(bytes);
    }
    if (bytes < 1024 * 1024) {
        return QStringLiteral("%1 KB").arg(bytes / 1024.0, 0, 'f', 1);
    }
    return QStringLiteral("%1 MB").arg(bytes / (1024.0 * 1024.0), 0, 'f', 1);
}

QString ConsoleReport::jsonEscape(const QString& str)
{
    QString result;
    result.reserve(str.size() + 10);

    for (const QChar& c : str) {
        switch (c.unicode()) {
            case '"':  result += QStringLiteral("\\\""); break;
            case '\\': result += QStringLiteral("\\\\"); break;
            case '\n': result += QStringLiteral("\\n"); break;
            case '\r': result += QStringLiteral("\\r"); break;
            case '\t': result += QStringLiteral("\\t"); break;
            default:
                if (c.unicode() < 32) {
                    result += QStringLiteral("\\u%1").arg(static_cast<uint>(c.unicode()), 4, 16, QLatin1Char('0'));
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

} // namespace Cli
