// ============================================================================
// NoteCanvas - Test Runner
// ============================================================================
// Usage: notecanvas_tests [--test-geometry | --test-elements | --test-viewport |
//                          --test-history | --test-interaction | --test-render]
// Without a flag every suite runs.
// ============================================================================

#include <QApplication>
#include <QDebug>
#include <QStringList>
#include <QTest>

#include "core/ViewportTests.h"
#include "elements/ElementTests.h"
#include "geometry/GeometryTests.h"
#include "history/HistoryManagerTests.h"
#include "input/InteractionControllerTests.h"
#include "render/RendererTests.h"

static int runTests(const QString& testType)
{
    if (testType == "geometry") {
        GeometryTests tests;
        return QTest::qExec(&tests);
    } else if (testType == "elements") {
        ElementTests tests;
        return QTest::qExec(&tests);
    } else if (testType == "viewport") {
        ViewportTests tests;
        return QTest::qExec(&tests);
    } else if (testType == "history") {
        HistoryManagerTests tests;
        return QTest::qExec(&tests);
    } else if (testType == "interaction") {
        InteractionControllerTests tests;
        return QTest::qExec(&tests);
    } else if (testType == "render") {
        RendererTests tests;
        return QTest::qExec(&tests);
    }
    qWarning() << "TestRunner: Unknown test suite" << testType;
    return 1;
}

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("NoteCanvas");
    app.setApplicationName("Tests");

    static const QStringList suites = {"geometry", "elements", "viewport",
                                       "history", "interaction", "render"};

    QStringList toRun;
    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg.startsWith("--test-")) {
            toRun.append(arg.mid(7));
        }
    }
    if (toRun.isEmpty()) {
        toRun = suites;
    }

    int failures = 0;
    for (const QString& suite : toRun) {
        failures += runTests(suite) != 0 ? 1 : 0;
    }
    return failures == 0 ? 0 : 1;
}
