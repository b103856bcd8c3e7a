// ============================================================================
// PdfPresenter - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QDebug>
#include <QStringList>
#include <QTest>

#include "MainWindow.h"

// Test includes
#include "core/NotesStoreTests.h"
#include "core/PageRegistryTests.h"
#include "core/PauseableTimerTests.h"
#include "core/PresentationSessionTests.h"
#include "core/PresentationSyncTests.h"
#include "core/PresenterSettingsTests.h"
#include "core/SlideOrderTests.h"
#include "pdf/MuPdfExporterTests.h"

// ============================================================================
// Test Runners
// ============================================================================

static int runTests(const QString& testType, char* programName)
{
    bool success = false;

    if (testType == "slideorder") {
        success = SlideOrderTests::runAllTests();
    } else if (testType == "registry") {
        success = PageRegistryTests::runAllTests();
    } else if (testType == "notes") {
        success = NotesStoreTests::runAllTests();
    } else if (testType == "exporter") {
        success = MuPdfExporterTests::runAllTests();
    } else if (testType == "settings") {
        success = PresenterSettingsTests::runAllTests();
    } else {
        // QtTest suites get the program name only; our own flags mean nothing to them
        char* testArgv[] = {programName, nullptr};
        if (testType == "timer") {
            PauseableTimerTests tests;
            return QTest::qExec(&tests, 1, testArgv);
        } else if (testType == "sync") {
            PresentationSyncTests tests;
            return QTest::qExec(&tests, 1, testArgv);
        } else if (testType == "session") {
            PresentationSessionTests tests;
            return QTest::qExec(&tests, 1, testArgv);
        }
        qWarning() << "Unknown test suite:" << testType;
        return 2;
    }

    return success ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("PdfPresenter");
    app.setApplicationName("App");

    // ========== Parse Command Line Arguments ==========
    QStringList inputFiles;
    QString testToRun;

    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg.startsWith("--test-")) {
            testToRun = arg.mid(7);
        } else if (!arg.startsWith("--")) {
            inputFiles << arg;
        } else {
            qWarning() << "Ignoring unknown option" << arg;
        }
    }

    // Handle test commands
    if (!testToRun.isEmpty()) {
        return runTests(testToRun, argv[0]);
    }

    // ========== Launch Application ==========
    auto* w = new MainWindow();
    w->setAttribute(Qt::WA_DeleteOnClose);
    w->show();

    if (!inputFiles.isEmpty()) {
        w->importFiles(inputFiles);
    }

    return app.exec();
}
