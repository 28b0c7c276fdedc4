#include "CliParser.h"

#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace Cli {

// =============================================================================
// Parser Setup
// =============================================================================

void setupParser(QCommandLineParser& parser)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "NoteCanvas - Whiteboard editor for a note"));

    parser.addHelpOption();
    parser.addVersionOption();

    parser.addOption(QCommandLineOption(
        QStringLiteral("note-id"),
        QCoreApplication::translate("CLI", "Edit the canvas of this note"),
        QStringLiteral("id")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("shared-note-id"),
        QCoreApplication::translate("CLI", "Edit the canvas of this shared note"),
        QStringLiteral("id")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("base-url"),
        QCoreApplication::translate("CLI", "Element service root URL"),
        QStringLiteral("url")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("csrf-token"),
        QCoreApplication::translate("CLI", "CSRF token sent with every request"),
        QStringLiteral("token")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("elements"),
        QCoreApplication::translate("CLI", "JSON file with the initial elements"),
        QStringLiteral("file")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("readonly"),
        QCoreApplication::translate("CLI", "Open without editing")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("dark"),
        QCoreApplication::translate("CLI", "Use the dark palette")));
}

// =============================================================================
// Option Parsing
// =============================================================================

bool parseLaunchOptions(const QCommandLineParser& parser, LaunchOptions* out, QString* error)
{
    const QString noteId = parser.value(QStringLiteral("note-id")).trimmed();
    const QString sharedId = parser.value(QStringLiteral("shared-note-id")).trimmed();

    if (noteId.isEmpty() == sharedId.isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("CLI",
                "Exactly one of --note-id and --shared-note-id is required");
        }
        return false;
    }

    LaunchOptions opts;
    opts.editor.owner = noteId.isEmpty() ? DocumentOwner::sharedNote(sharedId)
                                         : DocumentOwner::note(noteId);
    opts.editor.baseUrl = parser.value(QStringLiteral("base-url"));
    opts.editor.csrfToken = parser.value(QStringLiteral("csrf-token"));
    opts.editor.readonly = parser.isSet(QStringLiteral("readonly"));
    opts.elementsFile = parser.value(QStringLiteral("elements"));
    opts.dark = parser.isSet(QStringLiteral("dark"));

    *out = opts;
    return true;
}

bool loadElementsFile(const QString& path, QJsonArray* out, QString* error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QCoreApplication::translate("CLI", "Cannot open %1: %2")
                         .arg(path, file.errorString());
        }
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error) {
            *error = QCoreApplication::translate("CLI", "Invalid JSON in %1: %2")
                         .arg(path, parseError.errorString());
        }
        return false;
    }

    if (doc.isArray()) {
        *out = doc.array();
        return true;
    }
    if (doc.isObject() && doc.object().value(QStringLiteral("elements")).isArray()) {
        *out = doc.object().value(QStringLiteral("elements")).toArray();
        return true;
    }

    if (error) {
        *error = QCoreApplication::translate("CLI", "%1 does not contain an element array").arg(path);
    }
    return false;
}

} // namespace Cli
