#include "paste_planner.h"
#include "file_utils.h"

namespace PastePlanner {

void splitExtension(const QString& name, QString* stem, QString* ext)
{
    int dot = name.lastIndexOf(QLatin1Char('.'));
    // skip a run of leading dots (".bashrc", "..hidden")
    int firstNonDot = 0;
    while (firstNonDot < name.size() && name.at(firstNonDot) == QLatin1Char('.')) ++firstNonDot;
    if (dot < firstNonDot) dot = -1;

    if (dot < 0) {
        if (stem) *stem = name;
        if (ext) ext->clear();
        return;
    }
    if (stem) *stem = name.left(dot);
    if (ext) *ext = name.mid(dot);
}

QString conflictName(const QString& name, bool isDir)
{
    if (isDir) return name + QLatin1String(ConflictSuffix);
    QString stem, ext;
    splitExtension(name, &stem, &ext);
    return stem + QLatin1String(ConflictSuffix) + ext;
}

bool isSelfPaste(const QString& src, const QString& destDir)
{
    if (FileUtils::samePath(src, destDir)) return true;
    if (FileUtils::isStrictDescendant(destDir, src)) return true;

    // a destination reached through a symlink can still sit inside src
    const QString realSrc = FileUtils::canonicalPath(src);
    const QString realDest = FileUtils::canonicalPath(destDir);
    return realSrc == realDest || FileUtils::isStrictDescendant(realDest, realSrc);
}

QString resolveDestination(const QString& src, const QString& destDir, bool srcIsDir,
                           const std::function<bool(const QString&)>& occupied)
{
    const QString name = FileUtils::baseName(src);
    const QString plain = FileUtils::joinPath(destDir, name);
    if (!occupied || !occupied(plain)) return plain;
    return FileUtils::joinPath(destDir, conflictName(name, srcIsDir));
}

} // namespace PastePlanner
