/**
 * @file appsettings.cpp
 * @brief AppSettings implementation: QSettings(ini) persistence.
 *
 * - Every save writes through immediately (sync)
 * - Default ini lives in the program directory: ./config.ini
 */

#include "appsettings.h"

#include <QSettings>
#include <QCoreApplication>
#include <QDir>

// ==============================
// ini path: ./config.ini unless overridden
// ==============================
static QString& overridePath()
{
    static QString path;
    return path;
}

static QSettings makeSettings()
{
    return QSettings(AppSettings::iniPath(), QSettings::IniFormat);
}

// ==============================
// Keys
// ==============================
namespace Keys
{
    // app
    static const char* kLastBrowseDir    = "app/lastBrowseDir";

    // runtime
    static const char* kWineCommand      = "runtime/wineCommand";
    static const char* kHostSpawnCommand = "runtime/hostSpawnCommand";

    // window
    static const char* kWindowGeometry   = "window/geometry";
}

static QString nonBlank(const QString& value, const QString& fallback)
{
    const QString v = value.trimmed();
    return v.isEmpty() ? fallback : v;
}

QString AppSettings::iniPath()
{
    if (!overridePath().isEmpty())
        return overridePath();
    const QString dir = QCoreApplication::applicationDirPath();
    return QDir(dir).filePath("config.ini");
}

void AppSettings::setIniPath(const QString &path)
{
    overridePath() = path;
}

// ==============================
// full load
// ==============================
SettingsData AppSettings::load()
{
    QSettings s = makeSettings();
    SettingsData d;
    const RuntimeConfig defaults;

    d.lastBrowseDir = s.value(Keys::kLastBrowseDir, "").toString();

    d.runtime.wineCommand      = nonBlank(s.value(Keys::kWineCommand, defaults.wineCommand).toString(),
                                          defaults.wineCommand);
    d.runtime.hostSpawnCommand = nonBlank(s.value(Keys::kHostSpawnCommand, defaults.hostSpawnCommand).toString(),
                                          defaults.hostSpawnCommand);

    d.windowGeometry = s.value(Keys::kWindowGeometry).toByteArray();
    return d;
}

// ==============================
// full save (overwrite)
// ==============================
void AppSettings::save(const SettingsData &data)
{
    QSettings s = makeSettings();

    s.setValue(Keys::kLastBrowseDir, data.lastBrowseDir);
    s.setValue(Keys::kWineCommand, data.runtime.wineCommand);
    s.setValue(Keys::kHostSpawnCommand, data.runtime.hostSpawnCommand);
    s.setValue(Keys::kWindowGeometry, data.windowGeometry);

    s.sync();
}

// ==============================
// per-block saves
// ==============================
void AppSettings::saveLastBrowseDir(const QString &dir)
{
    QSettings s = makeSettings();
    s.setValue(Keys::kLastBrowseDir, dir);
    s.sync();
}

void AppSettings::saveRuntime(const RuntimeConfig &runtime)
{
    QSettings s = makeSettings();
    s.setValue(Keys::kWineCommand, runtime.wineCommand);
    s.setValue(Keys::kHostSpawnCommand, runtime.hostSpawnCommand);
    s.sync();
}

void AppSettings::saveWindowGeometry(const QByteArray &geometry)
{
    QSettings s = makeSettings();
    s.setValue(Keys::kWindowGeometry, geometry);
    s.sync();
}
