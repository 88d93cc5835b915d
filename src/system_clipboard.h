#pragma once

#include <QString>
#include <QStringList>

class QMimeData;

// What the OS clipboard held at the moment it was read
struct ClipboardSnapshot {
    QStringList localPaths;     // local file references, in clipboard order
    bool ownedByExplorer = false; // payload was staged by this process

    bool hasFiles() const { return !localPaths.isEmpty(); }
};

class SystemClipboard {
public:
    virtual ~SystemClipboard() = default;

    virtual ClipboardSnapshot snapshot() const = 0;
    virtual void placePaths(const QStringList& paths, bool cut) = 0;
};

/**
 * QtSystemClipboard - QGuiApplication::clipboard() adapter.
 *
 * Writes text/uri-list, the freedesktop x-special/gnome-copied-files hint and
 * a private owner marker carrying the process id, so a later snapshot can tell
 * its own payload apart from one placed by another application.
 */
class QtSystemClipboard : public SystemClipboard {
public:
    static constexpr const char* OwnerMimeType = "application/x-kexplorer-owner";
    static constexpr const char* GnomeCopiedFilesMimeType = "x-special/gnome-copied-files";

    ClipboardSnapshot snapshot() const override;
    void placePaths(const QStringList& paths, bool cut) override;

    // Payload builders, usable without a running clipboard
    static QMimeData* buildMimeData(const QStringList& paths, bool cut);
    static ClipboardSnapshot readMimeData(const QMimeData* md);
};
