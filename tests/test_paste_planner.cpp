#include <QtTest>
#include "../src/paste_planner.h"

class TestPastePlanner : public QObject {
    Q_OBJECT
private slots:
    void testSplitExtension_data();
    void testSplitExtension();
    void testConflictName();
    void testSelfPaste();
    void testResolveDestination();
};

void TestPastePlanner::testSplitExtension_data()
{
    QTest::addColumn<QString>("name");
    QTest::addColumn<QString>("stem");
    QTest::addColumn<QString>("ext");

    QTest::newRow("plain") << "a.txt" << "a" << ".txt";
    QTest::newRow("double") << "archive.tar.gz" << "archive.tar" << ".gz";
    QTest::newRow("none") << "Makefile" << "Makefile" << "";
    QTest::newRow("dotfile") << ".bashrc" << ".bashrc" << "";
    QTest::newRow("dotfile-ext") << ".config.bak" << ".config" << ".bak";
    QTest::newRow("trailing") << "name." << "name" << ".";
}

void TestPastePlanner::testSplitExtension()
{
    QFETCH(QString, name);
    QFETCH(QString, stem);
    QFETCH(QString, ext);

    QString s, e;
    PastePlanner::splitExtension(name, &s, &e);
    QCOMPARE(s, stem);
    QCOMPARE(e, ext);
}

void TestPastePlanner::testConflictName()
{
    QCOMPARE(PastePlanner::conflictName("a.txt", false), QString("a_copy.txt"));
    QCOMPARE(PastePlanner::conflictName("README", false), QString("README_copy"));
    QCOMPARE(PastePlanner::conflictName(".bashrc", false), QString(".bashrc_copy"));
    QCOMPARE(PastePlanner::conflictName("photos.2024", true), QString("photos.2024_copy"));
}

void TestPastePlanner::testSelfPaste()
{
    QVERIFY(PastePlanner::isSelfPaste("/home/u/docs", "/home/u/docs"));
    QVERIFY(PastePlanner::isSelfPaste("/home/u/docs/", "/home/u/docs"));
    QVERIFY(PastePlanner::isSelfPaste("/home/u/docs", "/home/u/docs/sub/deeper"));
    QVERIFY(!PastePlanner::isSelfPaste("/home/u/docs", "/home/u"));
    QVERIFY(!PastePlanner::isSelfPaste("/home/u/docs", "/home/u/docs2"));
    QVERIFY(!PastePlanner::isSelfPaste("/home/u/a.txt", "/home/u/other"));
}

void TestPastePlanner::testResolveDestination()
{
    auto nothingTaken = [](const QString&) { return false; };
    QCOMPARE(PastePlanner::resolveDestination("/src/a.txt", "/dst", false, nothingTaken), QString("/dst/a.txt"));

    auto plainTaken = [](const QString& p) { return p == "/dst/a.txt" || p == "/dst/dir"; };
    QCOMPARE(PastePlanner::resolveDestination("/src/a.txt", "/dst", false, plainTaken), QString("/dst/a_copy.txt"));
    QCOMPARE(PastePlanner::resolveDestination("/src/dir", "/dst", true, plainTaken), QString("/dst/dir_copy"));

    // suffix applied once only
    auto allTaken = [](const QString&) { return true; };
    QCOMPARE(PastePlanner::resolveDestination("/src/a.txt", "/dst", false, allTaken), QString("/dst/a_copy.txt"));
}

QTEST_APPLESS_MAIN(TestPastePlanner)
#include "test_paste_planner.moc"
