#pragma once

// ============================================================================
// PresenterSettingsTests - Unit tests for PresenterSettings
// ============================================================================
// Uses an INI file in a temporary directory so the user's real settings are
// never touched.
// ============================================================================

#include "PresenterSettings.h"

#include <QDebug>
#include <QFile>
#include <QSettings>
#include <QTemporaryDir>

namespace PresenterSettingsTests {

inline bool testDefaults()
{
    qDebug() << "=== Test: settings defaults ===";

    QTemporaryDir tempDir;
    QSettings ini(tempDir.filePath("empty.ini"), QSettings::IniFormat);
    const PresenterSettings s = PresenterSettings::load(ini);

    if (s.thumbnailWidth != 200 || s.fallbackProjectionWidth != 1920 ||
        s.timerIntervalMs != 500 || s.backend != PdfBackend::Auto || !s.recentImports.isEmpty()) {
        qDebug() << "FAIL: Empty store should yield defaults";
        return false;
    }

    qDebug() << "  - Defaults: OK";
    return true;
}

inline bool testRoundTrip()
{
    qDebug() << "=== Test: settings round trip ===";

    QTemporaryDir tempDir;
    const QString existing = tempDir.filePath("talk.pdf");
    {
        QFile f(existing);
        if (!f.open(QIODevice::WriteOnly)) {
            qDebug() << "FAIL: Could not create placeholder file";
            return false;
        }
    }

    PresenterSettings s;
    s.thumbnailWidth = 160;
    s.timerIntervalMs = 250;
    s.backend = PdfBackend::MuPdf;
    s.lastDirectory = tempDir.path();
    s.addRecentImport(tempDir.filePath("deleted.pdf"));
    s.addRecentImport(existing);

    {
        QSettings ini(tempDir.filePath("app.ini"), QSettings::IniFormat);
        s.save(ini);
    }

    QSettings ini(tempDir.filePath("app.ini"), QSettings::IniFormat);
    const PresenterSettings loaded = PresenterSettings::load(ini);

    bool success = true;
    if (loaded.thumbnailWidth != 160 || loaded.timerIntervalMs != 250 ||
        loaded.backend != PdfBackend::MuPdf || loaded.lastDirectory != tempDir.path()) {
        qDebug() << "FAIL: Values did not survive a save/load cycle";
        success = false;
    }
    if (loaded.recentImports != QStringList({existing})) {
        qDebug() << "FAIL: Recent imports should drop missing files, got" << loaded.recentImports;
        success = false;
    }

    if (success) {
        qDebug() << "  - Round trip: OK";
    }
    return success;
}

inline bool testInvalidValues()
{
    qDebug() << "=== Test: invalid settings ===";

    QTemporaryDir tempDir;
    QSettings ini(tempDir.filePath("bad.ini"), QSettings::IniFormat);
    ini.setValue("thumbnails/width", "wide");
    ini.setValue("timer/updateIntervalMs", -5);
    ini.setValue("pdf/backend", "ghostscript");

    const PresenterSettings s = PresenterSettings::load(ini);
    if (s.thumbnailWidth != PresenterSettings::DEFAULT_THUMBNAIL_WIDTH ||
        s.timerIntervalMs != PresenterSettings::DEFAULT_TIMER_INTERVAL_MS ||
        s.backend != PdfBackend::Auto) {
        qDebug() << "FAIL: Invalid values should fall back to defaults";
        return false;
    }

    qDebug() << "  - Invalid values ignored: OK";
    return true;
}

inline bool testRecentLimit()
{
    qDebug() << "=== Test: recent imports limit ===";

    PresenterSettings s;
    for (int i = 0; i < PresenterSettings::MAX_RECENT + 5; ++i) {
        s.addRecentImport(QStringLiteral("/talks/%1.pdf").arg(i));
    }
    s.addRecentImport(QStringLiteral("/talks/10.pdf"));

    if (s.recentImports.size() != PresenterSettings::MAX_RECENT ||
        s.recentImports.first() != "/talks/10.pdf" ||
        s.recentImports.count("/talks/10.pdf") != 1) {
        qDebug() << "FAIL: Recent list should be capped, newest first, no duplicates";
        return false;
    }

    qDebug() << "  - Recent limit: OK";
    return true;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running PresenterSettings Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testDefaults();
    qDebug() << "";

    allPass &= testRoundTrip();
    qDebug() << "";

    allPass &= testInvalidValues();
    qDebug() << "";

    allPass &= testRecentLimit();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL SETTINGS TESTS PASSED!";
    } else {
        qDebug() << "SOME SETTINGS TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace PresenterSettingsTests
