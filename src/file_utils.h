#pragma once

#include <QDir>
#include <QFileInfo>
#include <QString>

/**
 * FileUtils - path helpers shared by the reconciler, navigation and the window.
 *
 * Everything here is pure string work on top of QDir/QFileInfo; none of these
 * helpers touch the filesystem except the exists/isDir probes at the bottom.
 */
namespace FileUtils {

/**
 * Resolve a user-supplied path to an absolute, cleaned form.
 * "~" and "~/..." expand to the home directory. Trailing separators are
 * dropped (except for the root itself).
 */
inline QString absolutePath(const QString& path)
{
    const QString trimmed = path.trimmed();
    if (trimmed.isEmpty()) return QString();
    if (trimmed == QLatin1String("~")) return QDir::cleanPath(QDir::homePath());
    if (trimmed.startsWith(QLatin1String("~/")))
        return QDir::cleanPath(QDir::homePath() + trimmed.mid(1));
    return QDir::cleanPath(QDir(trimmed).absolutePath());
}

// Absolute path with symlinks resolved; falls back to absolutePath() when
// the path does not exist
inline QString canonicalPath(const QString& path)
{
    const QString abs = absolutePath(path);
    if (abs.isEmpty()) return abs;
    const QString canonical = QFileInfo(abs).canonicalFilePath();
    return canonical.isEmpty() ? abs : canonical;
}

// Compare two paths after absolute resolution
inline bool samePath(const QString& a, const QString& b)
{
    return absolutePath(a) == absolutePath(b);
}

/**
 * True when child lies strictly below parent (not equal to it).
 */
inline bool isStrictDescendant(const QString& child, const QString& parent)
{
    const QString c = absolutePath(child);
    QString p = absolutePath(parent);
    if (c.isEmpty() || p.isEmpty() || c == p) return false;
    if (!p.endsWith(QLatin1Char('/'))) p += QLatin1Char('/');
    return c.startsWith(p);
}

inline QString joinPath(const QString& dir, const QString& name)
{
    return QDir::cleanPath(QDir(dir).filePath(name));
}

// Last path component of an absolute path ("/a/b/" -> "b")
inline QString baseName(const QString& path)
{
    return QFileInfo(QDir::cleanPath(path)).fileName();
}

inline QString parentPath(const QString& path)
{
    const QString cleaned = absolutePath(path);
    QDir d(cleaned);
    if (!d.cdUp()) return cleaned;
    return QDir::cleanPath(d.absolutePath());
}

inline bool isRoot(const QString& path)
{
    return QDir(absolutePath(path)).isRoot();
}

inline bool dirExists(const QString& dirPath)
{
    QFileInfo fi(dirPath);
    return fi.exists() && fi.isDir();
}

inline bool pathExists(const QString& path)
{
    return QFileInfo::exists(path);
}

} // namespace FileUtils
