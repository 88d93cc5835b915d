#include "clipboard_reconciler.h"

#include "file_system.h"
#include "file_utils.h"
#include "log_manager.h"
#include "paste_planner.h"
#include "system_clipboard.h"

#include <QObject>

QStringList PasteOutcome::failedPaths() const
{
    QStringList out;
    for (const EntryFailure& f : failures) out << f.path;
    return out;
}

ClipboardReconciler::ClipboardReconciler(FileSystem& fs, SystemClipboard& clipboard)
    : m_fs(fs), m_clipboard(clipboard)
{
}

bool ClipboardReconciler::stage(ExplorerSession& session, const QStringList& paths, bool cut)
{
    QStringList cleaned;
    for (const QString& p : paths) {
        const QString abs = FileUtils::absolutePath(p);
        if (!abs.isEmpty() && !cleaned.contains(abs)) cleaned << abs;
    }
    if (cleaned.isEmpty()) {
        LogManager::instance().addLog("[Reconciler] stage ignored: empty selection", "DEBUG");
        return false;
    }

    session.clipboard.paths = cleaned;
    session.clipboard.isCut = cut;
    m_clipboard.placePaths(cleaned, cut);

    LogManager::instance().addLog(QString("[Reconciler] staged %1 item(s) for %2")
                                  .arg(cleaned.size()).arg(cut ? "cut" : "copy"));
    return true;
}

PasteOutcome ClipboardReconciler::paste(ExplorerSession& session, const QString& destDir)
{
    PasteOutcome out;
    out.destinationDir = FileUtils::absolutePath(destDir);

    if (out.destinationDir.isEmpty() || !m_fs.isDir(out.destinationDir)) {
        out.status = PasteStatus::InvalidTarget;
        LogManager::instance().addLog("[Reconciler] paste aborted, invalid target: " + destDir, "WARN");
        return out;
    }

    // One read of the OS clipboard per paste
    const ClipboardSnapshot snap = m_clipboard.snapshot();

    QStringList sources;
    if (snap.hasFiles() && !snap.ownedByExplorer) {
        out.source = PasteSource::External;
        out.cut = false;
        sources = snap.localPaths;
    } else if (!session.clipboard.isEmpty()) {
        out.source = PasteSource::Internal;
        out.cut = session.clipboard.isCut;
        sources = session.clipboard.paths;
    } else {
        out.status = PasteStatus::EmptyClipboard;
        LogManager::instance().addLog("[Reconciler] paste: clipboard is empty");
        return out;
    }

    LogManager::instance().addLog(QString("[Reconciler] paste %1 item(s) from %2 clipboard into %3 (%4)")
                                  .arg(sources.size())
                                  .arg(out.source == PasteSource::External ? "system" : "internal")
                                  .arg(out.destinationDir)
                                  .arg(out.cut ? "cut" : "copy"));

    QStringList remaining;
    for (const QString& src : sources) {
        const EntryResult r = pasteEntry(src, out.destinationDir, out.cut, out);
        if (r == EntryResult::Rejected || r == EntryResult::Failed) remaining << src;
    }

    if (out.source == PasteSource::Internal && out.cut) {
        if (remaining.isEmpty()) {
            session.clipboard.clear();
        } else {
            // keep what did not move so the user can retry; cut flag stays set
            session.clipboard.paths = remaining;
        }
    }

    LogManager::instance().addLog(QString("[Reconciler] paste finished: %1 ok, %2 skipped, %3 failed")
                                  .arg(out.succeeded).arg(out.skipped).arg(out.failures.size()),
                                  out.failures.isEmpty() ? "INFO" : "WARN");
    return out;
}

ClipboardReconciler::EntryResult ClipboardReconciler::pasteEntry(const QString& src, const QString& destDir,
                                                                 bool cut, PasteOutcome& out)
{
    if (!m_fs.exists(src)) {
        ++out.skipped;
        LogManager::instance().addLog("[Reconciler] source vanished, skipped: " + src, "DEBUG");
        return EntryResult::Vanished;
    }

    if (PastePlanner::isSelfPaste(src, destDir)) {
        recordFailure(out.failures, src,
                      QObject::tr("Cannot paste '%1' into itself.").arg(FileUtils::baseName(src)),
                      FailureKind::SelfPaste);
        return EntryResult::Rejected;
    }

    const bool isDir = m_fs.isDir(src);
    const QString dst = PastePlanner::resolveDestination(src, destDir, isDir,
                                                         [this](const QString& p) { return m_fs.exists(p); });
    if (m_fs.exists(dst)) {
        recordFailure(out.failures, src, QObject::tr("Destination already exists: %1").arg(dst),
                      FailureKind::EntryFailure);
        return EntryResult::Failed;
    }

    QString err;
    const bool ok = cut ? moveEntry(src, dst, isDir, &err) : copyEntry(src, dst, isDir, &err);
    if (!ok) {
        recordFailure(out.failures, src, err, FailureKind::EntryFailure);
        return EntryResult::Failed;
    }

    ++out.succeeded;
    LogManager::instance().addLog(QString("[Reconciler] %1 %2 -> %3").arg(cut ? "moved" : "copied", src, dst), "DEBUG");
    return EntryResult::Succeeded;
}

bool ClipboardReconciler::copyEntry(const QString& src, const QString& dst, bool isDir, QString* errorOut)
{
    const bool ok = isDir ? m_fs.copyTree(src, dst, errorOut) : m_fs.copyFile(src, dst, errorOut);
    if (!ok && m_fs.exists(dst)) {
        // dst did not exist before this entry, so whatever is there now is ours
        QString cleanupErr;
        if (!m_fs.removeTree(dst, &cleanupErr))
            LogManager::instance().addLog("[Reconciler] could not remove partial copy: " + cleanupErr, "WARN");
    }
    return ok;
}

bool ClipboardReconciler::moveEntry(const QString& src, const QString& dst, bool isDir, QString* errorOut)
{
    QString moveErr;
    if (m_fs.move(src, dst, &moveErr)) return true;

    LogManager::instance().addLog("[Reconciler] rename failed, falling back to copy+delete: " + moveErr, "DEBUG");

    if (!copyEntry(src, dst, isDir, errorOut)) return false;

    QString removeErr;
    const bool removed = isDir ? m_fs.removeTree(src, &removeErr) : m_fs.removeFile(src, &removeErr);
    if (removed) return true;

    if (errorOut) *errorOut = removeErr;
    if (isDir) {
        // the source tree may already be partly gone; the copy is the only complete one left
        LogManager::instance().addLog("[Reconciler] kept copied directory after failed source removal: " + dst, "WARN");
        return false;
    }

    QString rollbackErr;
    if (!m_fs.removeFile(dst, &rollbackErr))
        LogManager::instance().addLog("[Reconciler] could not roll back copy: " + rollbackErr, "WARN");
    return false;
}

DeleteOutcome ClipboardReconciler::remove(const QStringList& paths)
{
    DeleteOutcome out;
    for (const QString& p : paths) {
        ++out.attempted;
        if (!m_fs.exists(p)) {
            ++out.skipped;
            continue;
        }
        QString err;
        const bool ok = m_fs.isDir(p) ? m_fs.removeTree(p, &err) : m_fs.removeFile(p, &err);
        if (ok) {
            ++out.removed;
        } else {
            recordFailure(out.failures, p, err, FailureKind::EntryFailure);
        }
    }
    LogManager::instance().addLog(QString("[Reconciler] delete: %1 attempted, %2 removed, %3 skipped, %4 failed")
                                  .arg(out.attempted).arg(out.removed).arg(out.skipped).arg(out.failures.size()),
                                  out.failures.isEmpty() ? "INFO" : "WARN");
    return out;
}

void ClipboardReconciler::recordFailure(QList<EntryFailure>& failures, const QString& path,
                                        const QString& reason, FailureKind kind)
{
    failures.append(EntryFailure{path, reason, kind});
    LogManager::instance().addLog(QString("[Reconciler] %1: %2").arg(path, reason), "WARN");
}

QString ClipboardReconciler::stageSummary(int count, bool cut)
{
    return cut ? QObject::tr("Cut %1 items").arg(count) : QObject::tr("Copied %1 items").arg(count);
}

QString ClipboardReconciler::summary(const PasteOutcome& outcome)
{
    switch (outcome.status) {
    case PasteStatus::InvalidTarget:
        return QObject::tr("Current location is not a directory.");
    case PasteStatus::EmptyClipboard:
        return QObject::tr("Nothing to paste.");
    case PasteStatus::Ok:
        break;
    }

    const int failed = outcome.failures.size();
    if (outcome.source == PasteSource::External) {
        if (failed > 0)
            return QObject::tr("Pasted %1 item(s) from system clipboard, %2 failed").arg(outcome.succeeded).arg(failed);
        return QObject::tr("Pasted %1 item(s) from system clipboard").arg(outcome.succeeded);
    }
    if (failed > 0)
        return QObject::tr("Paste partially completed (%1 item(s), %2 failed)").arg(outcome.succeeded).arg(failed);
    if (outcome.cut)
        return QObject::tr("Cut/Paste completed (%1 item(s))").arg(outcome.succeeded);
    return QObject::tr("Paste completed (%1 item(s))").arg(outcome.succeeded);
}

QString ClipboardReconciler::summary(const DeleteOutcome& outcome)
{
    if (!outcome.failures.isEmpty())
        return QObject::tr("Deleted %1 items, %2 failed").arg(outcome.removed).arg(outcome.failures.size());
    return QObject::tr("Deleted %1 items").arg(outcome.removed);
}
