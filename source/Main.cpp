// ============================================================================
// NoteCanvas - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QPalette>

#include "CanvasEditor.h"
#include "cli/CliParser.h"
#include "core/CanvasSettings.h"
#include "network/HttpElementApi.h"
#include "render/ThemeProvider.h"
#include "ui/CanvasWindow.h"

#include <memory>

// ============================================================================
// Theme
// ============================================================================

static void applyDarkPalette(QApplication& app)
{
    QPalette darkPalette;

    const QColor darkGray(53, 53, 53);
    const QColor gray(128, 128, 128);
    const QColor blue(42, 130, 218);

    darkPalette.setColor(QPalette::Window, QColor(45, 45, 45));
    darkPalette.setColor(QPalette::WindowText, Qt::white);
    darkPalette.setColor(QPalette::Base, QColor(35, 35, 35));
    darkPalette.setColor(QPalette::AlternateBase, darkGray);
    darkPalette.setColor(QPalette::Text, Qt::white);
    darkPalette.setColor(QPalette::Button, darkGray);
    darkPalette.setColor(QPalette::ButtonText, Qt::white);
    darkPalette.setColor(QPalette::Highlight, blue);
    darkPalette.setColor(QPalette::HighlightedText, Qt::white);
    darkPalette.setColor(QPalette::PlaceholderText, gray);
    darkPalette.setColor(QPalette::Disabled, QPalette::ButtonText, gray);
    darkPalette.setColor(QPalette::Disabled, QPalette::Text, gray);

    app.setStyle("Fusion");
    app.setPalette(darkPalette);
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("NoteCanvas");
    app.setApplicationName("App");
    app.setApplicationVersion("1.0");

    // ========== Parse Command Line Arguments ==========
    QCommandLineParser parser;
    Cli::setupParser(parser);
    parser.process(app);

    Cli::LaunchOptions launch;
    QString error;
    if (!Cli::parseLaunchOptions(parser, &launch, &error)) {
        qWarning().noquote() << error;
        return Cli::ExitCode::InvalidArgs;
    }

    QJsonArray initialElements;
    if (!launch.elementsFile.isEmpty()
        && !Cli::loadElementsFile(launch.elementsFile, &initialElements, &error)) {
        qWarning().noquote() << error;
        return Cli::ExitCode::IoError;
    }

    // ========== Theme ==========
    std::unique_ptr<ThemeProvider> theme;
    if (launch.dark) {
        applyDarkPalette(app);
        theme = std::make_unique<StaticThemeProvider>(true);
    } else {
        theme = std::make_unique<PaletteThemeProvider>();
    }

    // ========== Launch Editor ==========
    HttpElementApi api(launch.editor.baseUrl, launch.editor.csrfToken);
    CanvasSettings settings;
    CanvasEditor editor(launch.editor, &api, theme.get(), &settings);

    const int loaded = editor.setElements(initialElements);
    qDebug() << "Main: loaded" << loaded << "element(s) for" << launch.editor.owner.fieldName()
             << launch.editor.owner.id;

    CanvasWindow window(&editor);
    window.show();

    return app.exec();
}
