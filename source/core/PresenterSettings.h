#pragma once

// ============================================================================
// PresenterSettings - Persistent application configuration
// ============================================================================
// Thin value type over QSettings. The application reads it once at startup
// and writes it back whenever a value changes (e.g. the last import folder).
//
// Keys:
//   thumbnails/width            Organizer thumbnail width in pixels
//   presentation/fallbackWidth  Projection width when no screen is known
//   timer/updateIntervalMs      Stopwatch refresh interval
//   pdf/backend                 "auto", "mupdf" or "poppler"
//   files/lastDirectory         Last folder used in the import dialog
//   files/recentImports         Most recently imported PDFs, newest first
// ============================================================================

#include "../pdf/PdfProvider.h"

#include <QString>
#include <QStringList>

class QSettings;

class PresenterSettings {
public:
    static constexpr int DEFAULT_THUMBNAIL_WIDTH = 200;
    static constexpr int DEFAULT_FALLBACK_WIDTH = 1920;
    static constexpr int DEFAULT_TIMER_INTERVAL_MS = 500;
    static constexpr int MAX_RECENT = 10;

    int thumbnailWidth = DEFAULT_THUMBNAIL_WIDTH;
    int fallbackProjectionWidth = DEFAULT_FALLBACK_WIDTH;
    int timerIntervalMs = DEFAULT_TIMER_INTERVAL_MS;
    PdfBackend backend = PdfBackend::Auto;
    QString lastDirectory;
    QStringList recentImports;

    /**
     * @brief Read settings, falling back to defaults for missing or bad values.
     * @param settings Source. Recent imports that no longer exist are dropped.
     */
    static PresenterSettings load(QSettings& settings);

    /**
     * @brief Read from the application's default QSettings store.
     */
    static PresenterSettings loadDefault();

    void save(QSettings& settings) const;
    void saveDefault() const;

    /**
     * @brief Put @p path at the front of recentImports, trimming to MAX_RECENT.
     */
    void addRecentImport(const QString& path);
};
