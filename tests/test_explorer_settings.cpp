#include <QtTest>
#include <QDir>
#include <QTemporaryDir>
#include "../src/explorer_settings.h"

class TestExplorerSettings : public QObject {
    Q_OBJECT
private slots:
    void testDefaults();
    void testRoundTripThroughFile();
};

void TestExplorerSettings::testDefaults()
{
    QTemporaryDir tmp;
    ExplorerSettings s(tmp.filePath("fresh.ini"));
    QCOMPARE(s.currentPath(), QDir::homePath());
    QVERIFY(!s.iconMode());
    QVERIFY(s.textureDir().endsWith("/textures"));
    QVERIFY(s.windowGeometry().isEmpty());
    QVERIFY(s.splitterState().isEmpty());
}

void TestExplorerSettings::testRoundTripThroughFile()
{
    QTemporaryDir tmp;
    const QString ini = tmp.filePath("kexplorer.ini");
    {
        ExplorerSettings s(ini);
        s.setCurrentPath("/srv/share");
        s.setIconMode(true);
        s.setTextureDir("/opt/skins");
        s.setWindowGeometry(QByteArray("\x01\x02geom", 6));
        s.setSplitterState(QByteArray("split"));
        s.sync();
    }
    ExplorerSettings reopened(ini);
    QCOMPARE(reopened.currentPath(), QString("/srv/share"));
    QVERIFY(reopened.iconMode());
    QCOMPARE(reopened.textureDir(), QString("/opt/skins"));
    QCOMPARE(reopened.windowGeometry(), QByteArray("\x01\x02geom", 6));
    QCOMPARE(reopened.splitterState(), QByteArray("split"));

    QSettings raw(ini, QSettings::IniFormat);
    QCOMPARE(raw.value("Explorer/CurrentPath").toString(), QString("/srv/share"));
}

QTEST_GUILESS_MAIN(TestExplorerSettings)
#include "test_explorer_settings.moc"
