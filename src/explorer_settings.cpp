#include "explorer_settings.h"

#include <QCoreApplication>
#include <QDir>

namespace {
const char* kCurrentPath = "Explorer/CurrentPath";
const char* kIconMode = "Explorer/IconMode";
const char* kTextureDir = "Explorer/TextureDir";
const char* kWindowGeometry = "Explorer/WindowGeometry";
const char* kSplitterState = "Explorer/SplitterState";
}

ExplorerSettings::ExplorerSettings()
    : m_settings(std::make_unique<QSettings>("KExplorer", "KExplorer"))
{
}

ExplorerSettings::ExplorerSettings(const QString& iniPath)
    : m_settings(std::make_unique<QSettings>(iniPath, QSettings::IniFormat))
{
}

QString ExplorerSettings::currentPath() const
{
    return m_settings->value(kCurrentPath, QDir::homePath()).toString();
}

void ExplorerSettings::setCurrentPath(const QString& path)
{
    m_settings->setValue(kCurrentPath, path);
}

bool ExplorerSettings::iconMode() const
{
    return m_settings->value(kIconMode, false).toBool();
}

void ExplorerSettings::setIconMode(bool on)
{
    m_settings->setValue(kIconMode, on);
}

QString ExplorerSettings::textureDir() const
{
    return m_settings->value(kTextureDir, defaultTextureDir()).toString();
}

void ExplorerSettings::setTextureDir(const QString& dir)
{
    m_settings->setValue(kTextureDir, dir);
}

QByteArray ExplorerSettings::windowGeometry() const
{
    return m_settings->value(kWindowGeometry).toByteArray();
}

void ExplorerSettings::setWindowGeometry(const QByteArray& geometry)
{
    m_settings->setValue(kWindowGeometry, geometry);
}

QByteArray ExplorerSettings::splitterState() const
{
    return m_settings->value(kSplitterState).toByteArray();
}

void ExplorerSettings::setSplitterState(const QByteArray& state)
{
    m_settings->setValue(kSplitterState, state);
}

QString ExplorerSettings::defaultTextureDir()
{
    return QCoreApplication::applicationDirPath() + "/textures";
}

void ExplorerSettings::sync()
{
    m_settings->sync();
}
