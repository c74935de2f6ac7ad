#include "CliHandler.h"
#include "CliReport.h"
#include "../core/InkDocument.h"
#include "../render/RenderSink.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <cmath>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 *
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// Demo strokes are laid out in rows of this many
static constexpr int DEMO_COLUMNS = 10;

// =============================================================================
// Helper Functions
// =============================================================================

OutputMode getOutputMode(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("json"))) {
        return OutputMode::Json;
    }
    if (parser.isSet(QStringLiteral("verbose"))) {
        return OutputMode::Verbose;
    }
    return OutputMode::Simple;
}

static bool parseNumber(const QCommandLineParser& parser, const QString& name,
                        qreal minValue, qreal maxValue, qreal& value)
{
    bool ok = false;
    const qreal parsed = parser.value(name).toDouble(&ok);
    if (!ok || !std::isfinite(parsed) || parsed < minValue || parsed > maxValue) {
        return false;
    }
    value = parsed;
    return true;
}

static QString absolutePath(const QString& path)
{
    return QDir::cleanPath(QDir::current().absoluteFilePath(path));
}

// Reads and decodes an .isf file into document; returns an exit code
static int loadDocument(const QString& path, InkDocument& document, ConsoleReport& report,
                        qint64* fileSize = nullptr)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        report.reportError(QCoreApplication::translate("CLI", "Cannot read %1: %2")
                               .arg(path, file.errorString()));
        return ExitCode::IoError;
    }
    const QByteArray bytes = file.readAll();
    if (fileSize) {
        *fileSize = bytes.size();
    }

    IsfParseError error;
    if (!document.loadFromIsf(bytes, &error)) {
        report.reportError(QCoreApplication::translate("CLI", "%1 is not a valid ISF container: %2 (offset %3)")
                               .arg(path, error.errorString())
                               .arg(error.offset));
        return ExitCode::DecodeError;
    }
    return ExitCode::Success;
}

static bool checkOutput(const QCommandLineParser& parser, const QString& outputPath,
                        ConsoleReport& report)
{
    if (QFileInfo::exists(outputPath) && !parser.isSet(QStringLiteral("overwrite"))) {
        report.reportError(QCoreApplication::translate("CLI",
            "%1 already exists. Use --overwrite to replace it.").arg(outputPath));
        return false;
    }
    return true;
}

// =============================================================================
// Info Handler
// =============================================================================

int handleInfo(const QCommandLineParser& parser)
{
    ConsoleReport report(getOutputMode(parser));

    const QStringList inputs = parser.positionalArguments();
    if (inputs.size() != 1) {
        report.reportError(QCoreApplication::translate("CLI",
            "Exactly one input file expected. Use 'inkboard info --help' for usage."));
        return ExitCode::InvalidArgs;
    }

    qreal precision = 2;
    if (!parseNumber(parser, QStringLiteral("precision"), 0, PacketCodec::MAX_PRECISION, precision)) {
        report.reportError(QCoreApplication::translate("CLI", "--precision must be between 0 and %1.")
                               .arg(PacketCodec::MAX_PRECISION));
        return ExitCode::InvalidArgs;
    }

    const QString inputPath = absolutePath(inputs.first());
    InkDocument document;
    qint64 fileSize = 0;
    const int loaded = loadDocument(inputPath, document, report, &fileSize);
    if (loaded != ExitCode::Success) {
        return loaded;
    }

    IsfOptions options;
    options.precision = static_cast<int>(precision);
    report.reportInfo(inputPath, fileSize, document, options);
    return ExitCode::Success;
}

// =============================================================================
// Render Handler
// =============================================================================

int handleRender(const QCommandLineParser& parser)
{
    ConsoleReport report(getOutputMode(parser));

    const QStringList inputs = parser.positionalArguments();
    if (inputs.size() != 1) {
        report.reportError(QCoreApplication::translate("CLI",
            "Exactly one input file expected. Use 'inkboard render --help' for usage."));
        return ExitCode::InvalidArgs;
    }

    QString outputPath = parser.value(QStringLiteral("output"));
    if (outputPath.isEmpty()) {
        report.reportError(QCoreApplication::translate("CLI",
            "Output path required. Use -o or --output to specify destination."));
        return ExitCode::InvalidArgs;
    }
    outputPath = absolutePath(outputPath);
    if (!checkOutput(parser, outputPath, report)) {
        return ExitCode::InvalidArgs;
    }

    qreal scale = 1.0;
    qreal dpr = 1.0;
    qreal margin = 16.0;
    if (!parseNumber(parser, QStringLiteral("scale"), CanvasViewport::MIN_SCALE, CanvasViewport::MAX_SCALE, scale)) {
        report.reportError(QCoreApplication::translate("CLI", "--scale must be between %1 and %2.")
                               .arg(CanvasViewport::MIN_SCALE).arg(CanvasViewport::MAX_SCALE));
        return ExitCode::InvalidArgs;
    }
    if (!parseNumber(parser, QStringLiteral("dpr"), 0.25, 8.0, dpr)) {
        report.reportError(QCoreApplication::translate("CLI", "--dpr must be between 0.25 and 8."));
        return ExitCode::InvalidArgs;
    }
    if (!parseNumber(parser, QStringLiteral("margin"), 0.0, 4096.0, margin)) {
        report.reportError(QCoreApplication::translate("CLI", "--margin must be between 0 and 4096."));
        return ExitCode::InvalidArgs;
    }

    const QColor background = InkStroke::parseColor(parser.value(QStringLiteral("background")));

    InkDocument document;
    const int loaded = loadDocument(absolutePath(inputs.first()), document, report);
    if (loaded != ExitCode::Success) {
        return loaded;
    }

    const QRectF ink = document.inkBounds();
    if (ink.isNull()) {
        report.reportWarning(QCoreApplication::translate("CLI", "The document contains no ink."));
        return ExitCode::Failure;
    }
    const QRectF area = ink.adjusted(-margin, -margin, margin, margin);

    // Tiles are baked at the pixel density they will be shown at
    document.setDeviceScale(scale * dpr);

    CanvasViewport& viewport = document.viewport();
    viewport.resize(area.width() * scale, area.height() * scale);
    viewport.setScale(scale);
    viewport.setWorldOffset(area.topLeft());

    document.rebakeVisible();

    RasterRenderSink sink(dpr);
    if (!parser.isSet(QStringLiteral("transparent"))) {
        sink.setBackground(background);
    }
    document.renderFrame(sink);

    int tiles = 0;
    for (const Tile* tile : document.tiles().getVisibleTiles(viewport)) {
        if (!tile->strokeIds().isEmpty()) {
            ++tiles;
        }
    }

    QSaveFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly) || !sink.image().save(&file, "PNG") || !file.commit()) {
        report.reportError(QCoreApplication::translate("CLI", "Cannot write %1: %2")
                               .arg(outputPath, file.errorString()));
        return ExitCode::IoError;
    }

    report.reportRender(outputPath, sink.image().size(), tiles, QFileInfo(outputPath).size());
    return ExitCode::Success;
}

// =============================================================================
// Demo Handler
// =============================================================================

int handleDemo(const QCommandLineParser& parser)
{
    ConsoleReport report(getOutputMode(parser));

    QString outputPath = parser.value(QStringLiteral("output"));
    if (outputPath.isEmpty()) {
        report.reportError(QCoreApplication::translate("CLI",
            "Output path required. Use -o or --output to specify destination."));
        return ExitCode::InvalidArgs;
    }
    outputPath = absolutePath(outputPath);
    if (!checkOutput(parser, outputPath, report)) {
        return ExitCode::InvalidArgs;
    }

    qreal points = 200;
    qreal strokes = 3;
    qreal precision = 2;
    if (!parseNumber(parser, QStringLiteral("points"), 1, 100000, points)) {
        report.reportError(QCoreApplication::translate("CLI", "--points must be between 1 and 100000."));
        return ExitCode::InvalidArgs;
    }
    if (!parseNumber(parser, QStringLiteral("strokes"), 1, 1000, strokes)) {
        report.reportError(QCoreApplication::translate("CLI", "--strokes must be between 1 and 1000."));
        return ExitCode::InvalidArgs;
    }
    if (!parseNumber(parser, QStringLiteral("precision"), 0, PacketCodec::MAX_PRECISION, precision)) {
        report.reportError(QCoreApplication::translate("CLI", "--precision must be between 0 and %1.")
                               .arg(PacketCodec::MAX_PRECISION));
        return ExitCode::InvalidArgs;
    }

    InkDocument document(InkSettings::fromAppSettings());
    StrokeEngine& engine = document.engine();
    const int strokeCount = static_cast<int>(strokes);

    for (int s = 0; s < strokeCount; ++s) {
        std::unique_ptr<InkStroke> path = IsfSerializer::generateTestStroke(static_cast<int>(points));
        const QPointF offset((s % DEMO_COLUMNS) * 500.0, (s / DEMO_COLUMNS) * 400.0);
        const QVector<InkPoint>& samples = path->points;

        engine.startStroke(samples.first().x() + offset.x(), samples.first().y() + offset.y(),
                           path->color, path->baseWidth,
                           samples.first().pressure, std::nullopt, samples.first().time);
        for (int i = 1; i < samples.size(); ++i) {
            const InkPoint& p = samples[i];
            engine.addPoint(p.x() + offset.x(), p.y() + offset.y(), p.pressure, std::nullopt, p.time);
        }
        document.commitStroke(engine.finishStroke());
    }

    IsfOptions options;
    options.precision = static_cast<int>(precision);
    const QByteArray bytes = document.serializeAll(options);

    QSaveFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly) || file.write(bytes) != bytes.size() || !file.commit()) {
        report.reportError(QCoreApplication::translate("CLI", "Cannot write %1: %2")
                               .arg(outputPath, file.errorString()));
        return ExitCode::IoError;
    }

    report.reportDemo(outputPath, document.strokeCount(), document.compressionStats(options), bytes.size());
    return ExitCode::Success;
}

} // namespace Cli
