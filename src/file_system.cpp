#include "file_system.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDebug>

namespace {

bool setError(QString* errorOut, const QString& msg)
{
    if (errorOut) *errorOut = msg;
    return false;
}

// exists() that also reports dangling symlinks, which QFileInfo::exists() hides
bool entryExists(const QString& path)
{
    const QFileInfo fi(path);
    return fi.exists() || fi.isSymLink();
}

} // namespace

bool LocalFileSystem::exists(const QString& path) const
{
    return entryExists(path);
}

bool LocalFileSystem::isDir(const QString& path) const
{
    return QFileInfo(path).isDir();
}

bool LocalFileSystem::copyFile(const QString& src, const QString& dst, QString* errorOut)
{
    if (entryExists(dst))
        return setError(errorOut, QObject::tr("Destination already exists: %1").arg(dst));

    QFile in(src);
    if (!in.exists())
        return setError(errorOut, QObject::tr("Source not found: %1").arg(src));
    if (!in.copy(dst))
        return setError(errorOut, QObject::tr("Failed to copy %1 to %2: %3").arg(src, dst, in.errorString()));

    // QFile::copy keeps permissions; carry the modification time over as well
    const QDateTime mtime = QFileInfo(src).lastModified();
    QFile out(dst);
    if (mtime.isValid() && out.open(QIODevice::ReadWrite)) {
        if (!out.setFileTime(mtime, QFileDevice::FileModificationTime))
            qWarning() << "[FileSystem] could not preserve mtime on" << dst;
        out.close();
    }
    return true;
}

bool LocalFileSystem::copyTree(const QString& src, const QString& dst, QString* errorOut)
{
    const QFileInfo sfi(src);
    if (!sfi.isDir())
        return copyFile(src, dst, errorOut);

    if (entryExists(dst))
        return setError(errorOut, QObject::tr("Destination already exists: %1").arg(dst));
    if (!QDir().mkpath(dst))
        return setError(errorOut, QObject::tr("Failed to create directory: %1").arg(dst));

    QDir srcDir(src);
    const QFileInfoList entries = srcDir.entryInfoList(QDir::NoDotAndDotDot | QDir::AllEntries | QDir::Hidden | QDir::System,
                                                       QDir::Name | QDir::DirsFirst);
    for (const QFileInfo &e : entries) {
        const QString target = QDir(dst).filePath(e.fileName());
        // links to directories are followed and copied as real directories
        if (e.isDir()) {
            if (!copyTree(e.absoluteFilePath(), target, errorOut)) return false;
        } else {
            if (!copyFile(e.absoluteFilePath(), target, errorOut)) return false;
        }
    }
    return true;
}

bool LocalFileSystem::move(const QString& src, const QString& dst, QString* errorOut)
{
    if (entryExists(dst))
        return setError(errorOut, QObject::tr("Destination already exists: %1").arg(dst));

    const QFileInfo sfi(src);
    if (sfi.isDir() && !sfi.isSymLink()) {
        QDir parent(sfi.absolutePath());
        if (!parent.rename(sfi.fileName(), dst))
            return setError(errorOut, QObject::tr("Failed to move %1 to %2").arg(src, dst));
        return true;
    }

    QFile f(src);
    if (!f.rename(dst))
        return setError(errorOut, QObject::tr("Failed to move %1 to %2: %3").arg(src, dst, f.errorString()));
    return true;
}

bool LocalFileSystem::removeFile(const QString& path, QString* errorOut)
{
    QFile f(path);
    if (!f.remove())
        return setError(errorOut, QObject::tr("Failed to delete file %1: %2").arg(path, f.errorString()));
    return true;
}

bool LocalFileSystem::removeTree(const QString& path, QString* errorOut)
{
    const QFileInfo fi(path);
    if (!fi.isDir() || fi.isSymLink())
        return removeFile(path, errorOut);

    QDir dir(path);
    const QFileInfoList list = dir.entryInfoList(QDir::NoDotAndDotDot | QDir::AllEntries | QDir::Hidden | QDir::System);
    for (const QFileInfo &e : list) {
        if (!removeTree(e.absoluteFilePath(), errorOut)) return false;
    }
    if (!dir.rmdir(path))
        return setError(errorOut, QObject::tr("Failed to delete directory: %1").arg(path));
    return true;
}
