#pragma once

#include <QByteArray>
#include <QSettings>
#include <QString>

#include <memory>

// Persistent explorer preferences, stored under the "Explorer/" group.
// Default-constructed it uses QSettings("KExplorer", "KExplorer"); tests pass
// an INI file path instead.
class ExplorerSettings {
public:
    ExplorerSettings();
    explicit ExplorerSettings(const QString& iniPath);

    QString currentPath() const;
    void setCurrentPath(const QString& path);

    bool iconMode() const;
    void setIconMode(bool on);

    QString textureDir() const;
    void setTextureDir(const QString& dir);

    QByteArray windowGeometry() const;
    void setWindowGeometry(const QByteArray& geometry);

    QByteArray splitterState() const;
    void setSplitterState(const QByteArray& state);

    static QString defaultTextureDir();

    void sync();

private:
    std::unique_ptr<QSettings> m_settings;
};
