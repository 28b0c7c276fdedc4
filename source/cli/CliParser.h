#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line options for launching a canvas editor.
 *
 * The host passes the document owner, the element service location and
 * credentials, and optionally a JSON file with the initial elements:
 *
 *   notecanvas --note-id 42 --base-url https://host --csrf-token abc
 *   notecanvas --shared-note-id 7 --elements elements.json --readonly --dark
 */

#include "../core/EditorOptions.h"

#include <QCommandLineParser>
#include <QJsonArray>
#include <QString>

namespace Cli {

// =============================================================================
// Exit Codes
// =============================================================================

namespace ExitCode {
    constexpr int Success = 0;        ///< Editor closed normally
    constexpr int InvalidArgs = 3;    ///< Bad command line arguments
    constexpr int IoError = 4;        ///< Can't read the elements file
}

// =============================================================================
// Launch Options
// =============================================================================

/**
 * @brief Everything the command line configures.
 */
struct LaunchOptions {
    EditorOptions editor;
    QString elementsFile;     ///< Empty: start with an empty canvas
    bool dark = false;        ///< --dark forces the dark palette
};

/**
 * @brief Register all options on a parser.
 */
void setupParser(QCommandLineParser& parser);

/**
 * @brief Turn parsed options into LaunchOptions.
 * @param[out] error Reason when parsing fails.
 * @return False if the owner is missing or ambiguous.
 *
 * Exactly one of --note-id and --shared-note-id must be given.
 */
bool parseLaunchOptions(const QCommandLineParser& parser, LaunchOptions* out, QString* error);

/**
 * @brief Read the initial elements from a JSON file.
 *
 * Accepts a bare array or an object with an "elements" array.
 * @param[out] error Reason when reading fails.
 */
bool loadElementsFile(const QString& path, QJsonArray* out, QString* error);

} // namespace Cli

#endif // CLIPARSER_H
