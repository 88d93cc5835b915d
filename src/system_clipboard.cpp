#include "system_clipboard.h"
#include "log_manager.h"

#include <QClipboard>
#include <QCoreApplication>
#include <QGuiApplication>
#include <QList>
#include <QMimeData>
#include <QUrl>

namespace {

QByteArray ownerToken()
{
    return QByteArray::number(QCoreApplication::applicationPid());
}

} // namespace

QMimeData* QtSystemClipboard::buildMimeData(const QStringList& paths, bool cut)
{
    auto* md = new QMimeData();
    QList<QUrl> urls;
    urls.reserve(paths.size());
    for (const QString& p : paths) urls << QUrl::fromLocalFile(p);
    md->setUrls(urls);

    QByteArray gnome = cut ? QByteArray("cut") : QByteArray("copy");
    for (const QUrl& u : urls) {
        gnome += '\n';
        gnome += u.toEncoded();
    }
    md->setData(QString::fromLatin1(GnomeCopiedFilesMimeType), gnome);
    md->setData(QString::fromLatin1(OwnerMimeType), ownerToken());
    return md;
}

ClipboardSnapshot QtSystemClipboard::readMimeData(const QMimeData* md)
{
    ClipboardSnapshot snap;
    if (!md) return snap;

    if (md->hasUrls()) {
        const QList<QUrl> urls = md->urls();
        for (const QUrl& u : urls) {
            if (!u.isLocalFile()) continue;
            const QString local = u.toLocalFile();
            if (!local.isEmpty() && !snap.localPaths.contains(local)) snap.localPaths << local;
        }
    }
    snap.ownedByExplorer = md->hasFormat(QString::fromLatin1(OwnerMimeType))
                           && md->data(QString::fromLatin1(OwnerMimeType)) == ownerToken();
    return snap;
}

ClipboardSnapshot QtSystemClipboard::snapshot() const
{
    QClipboard* cb = QGuiApplication::clipboard();
    if (!cb) return ClipboardSnapshot();
    return readMimeData(cb->mimeData());
}

void QtSystemClipboard::placePaths(const QStringList& paths, bool cut)
{
    QClipboard* cb = QGuiApplication::clipboard();
    if (!cb) {
        LogManager::instance().addLog("[Clipboard] no system clipboard available", "WARN");
        return;
    }
    // QClipboard takes ownership of the mime data
    cb->setMimeData(buildMimeData(paths, cut));
    LogManager::instance().addLog(QString("[Clipboard] placed %1 path(s) (%2)")
                                  .arg(paths.size()).arg(cut ? "cut" : "copy"), "DEBUG");
}
