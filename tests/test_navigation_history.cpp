#include <QtTest>
#include "../src/navigation_history.h"

class TestNavigationHistory : public QObject {
    Q_OBJECT
private slots:
    void testVisitAppends();
    void testRevisitCurrentIsNoop();
    void testBackAndForward();
    void testVisitTruncatesForwardHistory();
    void testBackAtStart();
};

void TestNavigationHistory::testVisitAppends()
{
    NavigationHistory h;
    QVERIFY(h.current().isEmpty());
    QVERIFY(h.visit("/a"));
    QVERIFY(h.visit("/b"));
    QCOMPARE(h.current(), QString("/b"));
    QCOMPARE(h.size(), 2);
    QCOMPARE(h.index(), 1);
}

void TestNavigationHistory::testRevisitCurrentIsNoop()
{
    NavigationHistory h;
    h.visit("/a");
    QVERIFY(!h.visit("/a"));
    QVERIFY(!h.visit(QString()));
    QCOMPARE(h.size(), 1);
}

void TestNavigationHistory::testBackAndForward()
{
    NavigationHistory h;
    h.visit("/a");
    h.visit("/b");
    h.visit("/c");

    QCOMPARE(h.previous(), QString("/b"));
    QCOMPARE(h.back(), QString("/b"));
    QCOMPARE(h.back(), QString("/a"));
    QVERIFY(!h.canGoBack());
    QVERIFY(h.canGoForward());
    QCOMPARE(h.forward(), QString("/b"));
    QCOMPARE(h.current(), QString("/b"));
    QCOMPARE(h.size(), 3);

    // replaying the entry we landed on records nothing
    QVERIFY(!h.visit("/b"));
    QCOMPARE(h.next(), QString("/c"));
}

void TestNavigationHistory::testVisitTruncatesForwardHistory()
{
    NavigationHistory h;
    h.visit("/a");
    h.visit("/b");
    h.visit("/c");
    h.back();
    h.back();

    QVERIFY(h.visit("/x"));
    QCOMPARE(h.entries(), QStringList({"/a", "/x"}));
    QVERIFY(!h.canGoForward());
    QCOMPARE(h.back(), QString("/a"));
}

void TestNavigationHistory::testBackAtStart()
{
    NavigationHistory h;
    QVERIFY(h.back().isEmpty());
    h.visit("/only");
    QVERIFY(h.back().isEmpty());
    QVERIFY(h.forward().isEmpty());
    QCOMPARE(h.current(), QString("/only"));
}

QTEST_APPLESS_MAIN(TestNavigationHistory)
#include "test_navigation_history.moc"
