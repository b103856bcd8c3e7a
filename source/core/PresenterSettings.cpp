// ============================================================================
// PresenterSettings - Implementation
// ============================================================================

#include "PresenterSettings.h"

#include <QDebug>
#include <QFileInfo>
#include <QSettings>

static const char* KEY_THUMBNAIL_WIDTH = "thumbnails/width";
static const char* KEY_FALLBACK_WIDTH = "presentation/fallbackWidth";
static const char* KEY_TIMER_INTERVAL = "timer/updateIntervalMs";
static const char* KEY_BACKEND = "pdf/backend";
static const char* KEY_LAST_DIRECTORY = "files/lastDirectory";
static const char* KEY_RECENT_IMPORTS = "files/recentImports";

// Reads a positive int, keeping the default for missing or bad values
static int readPositiveInt(QSettings& settings, const char* key, int fallback)
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    if (!ok || value <= 0) {
        qWarning() << "PresenterSettings: Ignoring invalid" << key << "=" << settings.value(key);
        return fallback;
    }
    return value;
}

PresenterSettings PresenterSettings::load(QSettings& settings)
{
    PresenterSettings result;
    result.thumbnailWidth = readPositiveInt(settings, KEY_THUMBNAIL_WIDTH, DEFAULT_THUMBNAIL_WIDTH);
    result.fallbackProjectionWidth = readPositiveInt(settings, KEY_FALLBACK_WIDTH, DEFAULT_FALLBACK_WIDTH);
    result.timerIntervalMs = readPositiveInt(settings, KEY_TIMER_INTERVAL, DEFAULT_TIMER_INTERVAL_MS);
    result.backend = PdfProvider::backendFromString(settings.value(KEY_BACKEND).toString());
    result.lastDirectory = settings.value(KEY_LAST_DIRECTORY).toString();

    const QStringList recent = settings.value(KEY_RECENT_IMPORTS).toStringList();
    for (const QString& path : recent) {
        if (QFileInfo::exists(path) && !result.recentImports.contains(path)) {
            result.recentImports.append(path);
        }
    }
    while (result.recentImports.size() > MAX_RECENT) {
        result.recentImports.removeLast();
    }

    return result;
}

PresenterSettings PresenterSettings::loadDefault()
{
    QSettings settings("PdfPresenter", "App");
    return load(settings);
}

void PresenterSettings::save(QSettings& settings) const
{
    settings.setValue(KEY_THUMBNAIL_WIDTH, thumbnailWidth);
    settings.setValue(KEY_FALLBACK_WIDTH, fallbackProjectionWidth);
    settings.setValue(KEY_TIMER_INTERVAL, timerIntervalMs);
    settings.setValue(KEY_BACKEND, PdfProvider::backendToString(backend));
    settings.setValue(KEY_LAST_DIRECTORY, lastDirectory);
    settings.setValue(KEY_RECENT_IMPORTS, recentImports);
    settings.sync();
}

void PresenterSettings::saveDefault() const
{
    QSettings settings("PdfPresenter", "App");
    save(settings);
}

void PresenterSettings::addRecentImport(const QString& path)
{
    if (path.isEmpty()) {
        return;
    }
    recentImports.removeAll(path);
    recentImports.prepend(path);
    while (recentImports.size() > MAX_RECENT) {
        recentImports.removeLast();
    }
}
