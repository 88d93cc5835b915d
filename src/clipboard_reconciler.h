#pragma once

#include "explorer_session.h"

#include <QList>
#include <QString>
#include <QStringList>

class FileSystem;
class SystemClipboard;

enum class PasteStatus {
    Ok,             // entries were processed (some may still have failed)
    InvalidTarget,  // destination missing or not a directory; nothing touched
    EmptyClipboard  // neither clipboard had anything to paste
};

enum class PasteSource { None, External, Internal };

enum class FailureKind {
    SelfPaste,   // rejected before any mutation
    EntryFailure // a filesystem primitive failed
};

struct EntryFailure {
    QString path;
    QString reason;
    FailureKind kind = FailureKind::EntryFailure;
};

struct PasteOutcome {
    PasteStatus status = PasteStatus::Ok;
    PasteSource source = PasteSource::None;
    bool cut = false;
    int succeeded = 0;
    int skipped = 0; // sources that vanished before the paste reached them
    QList<EntryFailure> failures;
    QString destinationDir;

    bool ok() const { return status == PasteStatus::Ok && failures.isEmpty(); }
    QStringList failedPaths() const;
};

struct DeleteOutcome {
    int attempted = 0;
    int removed = 0;
    int skipped = 0;
    QList<EntryFailure> failures;

    bool ok() const { return failures.isEmpty(); }
};

/**
 * ClipboardReconciler - turns staged or externally supplied paths into
 * filesystem mutations.
 *
 * stage() records the selection in the session and on the OS clipboard.
 * paste() snapshots the OS clipboard once; foreign file references win and
 * are always copied, otherwise the session's entry is used with its cut flag.
 * Each entry is handled independently: a failure is recorded and the next
 * entry still runs. remove() deletes permanently, again per entry.
 */
class ClipboardReconciler {
public:
    ClipboardReconciler(FileSystem& fs, SystemClipboard& clipboard);

    // Returns false (and leaves the session alone) if nothing usable was given
    bool stage(ExplorerSession& session, const QStringList& paths, bool cut);

    PasteOutcome paste(ExplorerSession& session, const QString& destDir);

    // Caller is responsible for having confirmed with the user
    DeleteOutcome remove(const QStringList& paths);

    static QString stageSummary(int count, bool cut);
    static QString summary(const PasteOutcome& outcome);
    static QString summary(const DeleteOutcome& outcome);

private:
    enum class EntryResult { Succeeded, Vanished, Rejected, Failed };

    EntryResult pasteEntry(const QString& src, const QString& destDir, bool cut, PasteOutcome& out);
    bool copyEntry(const QString& src, const QString& dst, bool isDir, QString* errorOut);
    bool moveEntry(const QString& src, const QString& dst, bool isDir, QString* errorOut);
    void recordFailure(QList<EntryFailure>& failures, const QString& path, const QString& reason, FailureKind kind);

    FileSystem& m_fs;
    SystemClipboard& m_clipboard;
};
