#include <QtTest>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include "../src/file_system.h"

class TestLocalFileSystem : public QObject {
    Q_OBJECT
private slots:
    void testCopyFilePreservesContentAndMtime();
    void testCopyFileNeverOverwrites();
    void testCopyTreeRecursive();
    void testCopyTreeRejectsExistingDestination();
    void testCopyTreeFollowsDirectoryLinks();
    void testMoveFileAndDirectory();
    void testRemoveTree();
    void testRemoveMissingFileReportsError();
    void testExistsAndIsDir();

private:
    static void writeFile(const QString& path, const QByteArray& data);
    static QByteArray readFile(const QString& path);
};

void TestLocalFileSystem::writeFile(const QString& path, const QByteArray& data)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write(data);
    f.close();
}

QByteArray TestLocalFileSystem::readFile(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return QByteArray();
    return f.readAll();
}

void TestLocalFileSystem::testCopyFilePreservesContentAndMtime()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = tmp.filePath("src.txt");
    const QString dst = tmp.filePath("dst.txt");
    writeFile(src, "hello world");

    const QDateTime past = QDateTime::currentDateTime().addDays(-3);
    {
        QFile f(src);
        QVERIFY(f.open(QIODevice::ReadWrite));
        QVERIFY(f.setFileTime(past, QFileDevice::FileModificationTime));
    }

    LocalFileSystem fs;
    QString err;
    QVERIFY2(fs.copyFile(src, dst, &err), qPrintable(err));
    QCOMPARE(readFile(dst), QByteArray("hello world"));
    QCOMPARE(QFileInfo(dst).lastModified().toSecsSinceEpoch(), past.toSecsSinceEpoch());
}

void TestLocalFileSystem::testCopyFileNeverOverwrites()
{
    QTemporaryDir tmp;
    const QString src = tmp.filePath("a");
    const QString dst = tmp.filePath("b");
    writeFile(src, "new");
    writeFile(dst, "old");

    LocalFileSystem fs;
    QString err;
    QVERIFY(!fs.copyFile(src, dst, &err));
    QVERIFY(err.contains("already exists"));
    QCOMPARE(readFile(dst), QByteArray("old"));
}

void TestLocalFileSystem::testCopyTreeRecursive()
{
    QTemporaryDir tmp;
    const QString src = tmp.filePath("tree");
    writeFile(src + "/top.txt", "1");
    writeFile(src + "/sub/deep.txt", "2");
    writeFile(src + "/sub/.hidden", "3");
    QDir().mkpath(src + "/empty");

    LocalFileSystem fs;
    QString err;
    const QString dst = tmp.filePath("copy");
    QVERIFY2(fs.copyTree(src, dst, &err), qPrintable(err));
    QCOMPARE(readFile(dst + "/top.txt"), QByteArray("1"));
    QCOMPARE(readFile(dst + "/sub/deep.txt"), QByteArray("2"));
    QCOMPARE(readFile(dst + "/sub/.hidden"), QByteArray("3"));
    QVERIFY(QFileInfo(dst + "/empty").isDir());
    QVERIFY(QFile::exists(src + "/top.txt"));
}

void TestLocalFileSystem::testCopyTreeRejectsExistingDestination()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("a/f"), "x");
    QDir().mkpath(tmp.filePath("b"));

    LocalFileSystem fs;
    QString err;
    QVERIFY(!fs.copyTree(tmp.filePath("a"), tmp.filePath("b"), &err));
    QVERIFY(!QFile::exists(tmp.filePath("b/f")));
}

void TestLocalFileSystem::testCopyTreeFollowsDirectoryLinks()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("shared/data.txt"), "shared");
    writeFile(tmp.filePath("tree/own.txt"), "own");
    QVERIFY(QFile::link(tmp.filePath("shared"), tmp.filePath("tree/linked")));

    LocalFileSystem fs;
    QString err;
    const QString dst = tmp.filePath("copy");
    QVERIFY2(fs.copyTree(tmp.filePath("tree"), dst, &err), qPrintable(err));
    QCOMPARE(readFile(dst + "/own.txt"), QByteArray("own"));
    QVERIFY(!QFileInfo(dst + "/linked").isSymLink());
    QVERIFY(QFileInfo(dst + "/linked").isDir());
    QCOMPARE(readFile(dst + "/linked/data.txt"), QByteArray("shared"));

    // removing the source tree leaves the link target alone
    QVERIFY2(fs.removeTree(tmp.filePath("tree"), &err), qPrintable(err));
    QCOMPARE(readFile(tmp.filePath("shared/data.txt")), QByteArray("shared"));
}

void TestLocalFileSystem::testMoveFileAndDirectory()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("f.txt"), "f");
    writeFile(tmp.filePath("d/inner.txt"), "i");
    QDir().mkpath(tmp.filePath("target"));

    LocalFileSystem fs;
    QString err;
    QVERIFY2(fs.move(tmp.filePath("f.txt"), tmp.filePath("target/f.txt"), &err), qPrintable(err));
    QVERIFY2(fs.move(tmp.filePath("d"), tmp.filePath("target/d"), &err), qPrintable(err));
    QVERIFY(!QFile::exists(tmp.filePath("f.txt")));
    QVERIFY(!QFile::exists(tmp.filePath("d")));
    QCOMPARE(readFile(tmp.filePath("target/d/inner.txt")), QByteArray("i"));

    // occupied destination
    writeFile(tmp.filePath("g.txt"), "g");
    QVERIFY(!fs.move(tmp.filePath("g.txt"), tmp.filePath("target/f.txt"), &err));
    QCOMPARE(readFile(tmp.filePath("target/f.txt")), QByteArray("f"));
}

void TestLocalFileSystem::testRemoveTree()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("r/a/b/c.txt"), "c");
    writeFile(tmp.filePath("r/.dot"), "d");

    LocalFileSystem fs;
    QString err;
    QVERIFY2(fs.removeTree(tmp.filePath("r"), &err), qPrintable(err));
    QVERIFY(!QFileInfo::exists(tmp.filePath("r")));
}

void TestLocalFileSystem::testRemoveMissingFileReportsError()
{
    QTemporaryDir tmp;
    LocalFileSystem fs;
    QString err;
    QVERIFY(!fs.removeFile(tmp.filePath("nope"), &err));
    QVERIFY(!err.isEmpty());
}

void TestLocalFileSystem::testExistsAndIsDir()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("file"), "x");
    LocalFileSystem fs;
    QVERIFY(fs.exists(tmp.filePath("file")));
    QVERIFY(!fs.isDir(tmp.filePath("file")));
    QVERIFY(fs.isDir(tmp.path()));
    QVERIFY(!fs.exists(tmp.filePath("missing")));
}

QTEST_GUILESS_MAIN(TestLocalFileSystem)
#include "test_local_file_system.moc"
