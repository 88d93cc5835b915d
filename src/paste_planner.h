#pragma once

#include <QString>

#include <functional>

/**
 * PastePlanner - naming and rejection rules applied to every paste entry.
 *
 * Nothing here touches the filesystem; occupancy of a destination is asked
 * through the predicate handed to resolveDestination().
 */
namespace PastePlanner {

// Suffix inserted before the extension when the destination name is taken
inline constexpr const char* ConflictSuffix = "_copy";

/**
 * Split a file name into stem and extension at the last dot.
 * Leading dots do not start an extension: ".bashrc" -> (".bashrc", "").
 * "archive.tar.gz" -> ("archive.tar", ".gz").
 */
void splitExtension(const QString& name, QString* stem, QString* ext);

// "a.txt" -> "a_copy.txt"; directories get the suffix on the whole name
QString conflictName(const QString& name, bool isDir);

/**
 * True when src may not be pasted into destDir: src is destDir itself, or
 * destDir lies inside src so a recursive copy would never terminate. Existing
 * paths are also compared with symlinks resolved.
 */
bool isSelfPaste(const QString& src, const QString& destDir);

/**
 * Destination path for src inside destDir. If the plain name is taken the
 * conflict name is returned; the suffix is applied once only, so the caller
 * may still find the returned path occupied.
 */
QString resolveDestination(const QString& src, const QString& destDir, bool srcIsDir,
                           const std::function<bool(const QString&)>& occupied);

} // namespace PastePlanner
