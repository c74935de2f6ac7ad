// ============================================================================
// InkBoard - Main Entry Point
// ============================================================================

#include <QCoreApplication>
#include <QLocale>
#include <QSettings>
#include <QStandardPaths>
#include <QTranslator>

#include "cli/CliParser.h"

// ============================================================================
// Translation Loading
// ============================================================================

static void loadTranslations(QCoreApplication& app, QTranslator& translator)
{
    QSettings settings("InkBoard", "App");
    bool useSystemLanguage = settings.value("useSystemLanguage", true).toBool();

    QString langCode;
    if (useSystemLanguage) {
        langCode = QLocale::system().name().section('_', 0, 0);
    } else {
        langCode = settings.value("languageOverride", "en").toString();
    }

    QStringList translationPaths = {
        QCoreApplication::applicationDirPath(),
        QCoreApplication::applicationDirPath() + "/translations",
        "/usr/share/inkboard/translations",
        "/usr/local/share/inkboard/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                               "inkboard/translations", QStandardPaths::LocateDirectory)
    };

    for (const QString& path : translationPaths) {
        if (!path.isEmpty() && translator.load(path + "/inkboard_" + langCode + ".qm")) {
            app.installTranslator(&translator);
            break;
        }
    }
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("InkBoard");
    app.setApplicationName("App");

    QTranslator translator;
    loadTranslations(app, translator);

    return Cli::run(app, argc, argv);
}
