#include <QApplication>
#include <QDebug>
#include <QDir>
#include <QStandardPaths>

#include "explorer_settings.h"
#include "file_system.h"
#include "log_manager.h"
#include "system_clipboard.h"
#include "widgets/explorer_window.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Identify app for QSettings
    QCoreApplication::setOrganizationName("KExplorer");
    QCoreApplication::setOrganizationDomain("kexplorer.local");
    QCoreApplication::setApplicationName("KExplorer");

    const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(dataDir);
    auto& logManager = LogManager::instance();
    if (!logManager.setLogFilePath(dataDir + "/kexplorer.log"))
        qWarning() << "Logging to file disabled; could not open" << dataDir + "/kexplorer.log";
    qInstallMessageHandler(customMessageHandler);
    logManager.addLog("[MAIN] Application started; log file=" + logManager.logFilePath());

    ExplorerSettings settings;
    const QString textureDir = settings.textureDir();
    if (!QDir(textureDir).exists()) {
        qWarning().noquote() << QString("'%1' not found. Create a folder named 'textures' next to the executable "
                                        "and add 'close.png' and 'minimize.png' (32x32) and button1..4.png (40x40).")
                                .arg(textureDir);
    }

    LocalFileSystem fs;
    QtSystemClipboard clipboard;
    ExplorerWindow window(settings, fs, clipboard);
    window.show();

    const int rc = app.exec();
    logManager.addLog(QString("[MAIN] Exiting with code %1").arg(rc));
    return rc;
}
