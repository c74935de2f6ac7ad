// ============================================================================
// InkBoard - Test Runner
// ============================================================================
// Usage: inkboard_tests [Suite] [QTest options]
// With no suite name every suite runs in turn.
// ============================================================================

#include <QCoreApplication>
#include <QStringList>
#include <QTest>
#include <QDebug>
#include <functional>
#include <memory>
#include <vector>

#include "codec/IsfCodecTests.h"
#include "core/CanvasViewportTests.h"
#include "core/InkDocumentTests.h"
#include "core/InkSettingsTests.h"
#include "core/PointerEventTests.h"
#include "core/TileCacheTests.h"
#include "render/MeshBuilderTests.h"
#include "strokes/StrokeEngineTests.h"

namespace {

struct Suite {
    const char* name;
    std::function<QObject*()> create;
};

const std::vector<Suite>& suites()
{
    static const std::vector<Suite> all = {
        {"StrokeEngine", [] { return new StrokeEngineTests(); }},
        {"InkSettings", [] { return new InkSettingsTests(); }},
        {"IsfCodec", [] { return new IsfCodecTests(); }},
        {"MeshBuilder", [] { return new MeshBuilderTests(); }},
        {"CanvasViewport", [] { return new CanvasViewportTests(); }},
        {"TileCache", [] { return new TileCacheTests(); }},
        {"InkDocument", [] { return new InkDocumentTests(); }},
        {"PointerEvent", [] { return new PointerEventTests(); }},
    };
    return all;
}

int runSuite(const Suite& suite, const QStringList& args)
{
    std::unique_ptr<QObject> tests(suite.create());
    return QTest::qExec(tests.get(), args);
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("InkBoard");
    app.setApplicationName("Tests");

    QStringList args = app.arguments();
    QString selected;
    if (args.size() > 1 && !args.at(1).startsWith('-')) {
        selected = args.takeAt(1);
    }

    int failures = 0;
    bool found = false;
    for (const Suite& suite : suites()) {
        if (!selected.isEmpty() && selected != QLatin1String(suite.name)) {
            continue;
        }
        found = true;
        failures += runSuite(suite, args);
    }

    if (!found) {
        qWarning() << "Unknown test suite:" << selected;
        return 1;
    }
    return failures == 0 ? 0 : 1;
}
