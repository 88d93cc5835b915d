#include <QtTest>
#include <QClipboard>
#include <QGuiApplication>
#include <QMimeData>
#include <QUrl>
#include <memory>
#include "../src/system_clipboard.h"

class TestSystemClipboard : public QObject {
    Q_OBJECT
private slots:
    void testPayloadCarriesUrisAndHints();
    void testForeignPayloadIsNotOwned();
    void testNonLocalUrlsIgnored();
    void testRoundTripThroughClipboard();
};

void TestSystemClipboard::testPayloadCarriesUrisAndHints()
{
    std::unique_ptr<QMimeData> md(QtSystemClipboard::buildMimeData({"/tmp/a b.txt", "/tmp/dir"}, true));
    QVERIFY(md->hasUrls());
    QCOMPARE(md->urls().size(), 2);
    QCOMPARE(md->urls().first().toLocalFile(), QString("/tmp/a b.txt"));

    const QByteArray gnome = md->data(QtSystemClipboard::GnomeCopiedFilesMimeType);
    QVERIFY(gnome.startsWith("cut\nfile:///tmp/a%20b.txt\n"));
    QVERIFY(gnome.endsWith("file:///tmp/dir"));

    const ClipboardSnapshot snap = QtSystemClipboard::readMimeData(md.get());
    QVERIFY(snap.ownedByExplorer);
    QCOMPARE(snap.localPaths, QStringList({"/tmp/a b.txt", "/tmp/dir"}));

    std::unique_ptr<QMimeData> copy(QtSystemClipboard::buildMimeData({"/x"}, false));
    QVERIFY(copy->data(QtSystemClipboard::GnomeCopiedFilesMimeType).startsWith("copy\n"));
}

void TestSystemClipboard::testForeignPayloadIsNotOwned()
{
    QMimeData md;
    md.setUrls({QUrl::fromLocalFile("/home/u/photo.jpg")});
    ClipboardSnapshot snap = QtSystemClipboard::readMimeData(&md);
    QVERIFY(snap.hasFiles());
    QVERIFY(!snap.ownedByExplorer);

    // another explorer process stamps its own pid
    md.setData(QtSystemClipboard::OwnerMimeType, QByteArray("-1"));
    snap = QtSystemClipboard::readMimeData(&md);
    QVERIFY(!snap.ownedByExplorer);
}

void TestSystemClipboard::testNonLocalUrlsIgnored()
{
    QMimeData md;
    md.setUrls({QUrl("https://example.com/file.zip"), QUrl::fromLocalFile("/srv/x"), QUrl::fromLocalFile("/srv/x")});
    const ClipboardSnapshot snap = QtSystemClipboard::readMimeData(&md);
    QCOMPARE(snap.localPaths, QStringList({"/srv/x"}));

    md.clear();
    md.setText("just text");
    QVERIFY(!QtSystemClipboard::readMimeData(&md).hasFiles());
    QVERIFY(!QtSystemClipboard::readMimeData(nullptr).hasFiles());
}

void TestSystemClipboard::testRoundTripThroughClipboard()
{
    QtSystemClipboard clipboard;
    clipboard.placePaths({"/tmp/one", "/tmp/two"}, false);
    const QMimeData* md = QGuiApplication::clipboard()->mimeData();
    if (!md || !md->hasUrls())
        QSKIP("platform clipboard does not hold data in this environment");

    const ClipboardSnapshot snap = clipboard.snapshot();
    QVERIFY(snap.ownedByExplorer);
    QCOMPARE(snap.localPaths, QStringList({"/tmp/one", "/tmp/two"}));

    auto* foreign = new QMimeData();
    foreign->setUrls({QUrl::fromLocalFile("/tmp/three")});
    QGuiApplication::clipboard()->setMimeData(foreign);
    QVERIFY(!clipboard.snapshot().ownedByExplorer);
}

QTEST_MAIN(TestSystemClipboard)
#include "test_system_clipboard.moc"
