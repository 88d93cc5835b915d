#pragma once

#include "clipboard_reconciler.h"
#include "explorer_session.h"

#include <QModelIndex>
#include <QString>
#include <QWidget>

class QFileSystemModel;
class QLabel;
class QLineEdit;
class QListView;
class QPushButton;
class QSplitter;
class QToolButton;
class QTreeView;
class ExplorerSettings;
class FileSystem;
class SystemClipboard;
class TitleBar;

/**
 * ExplorerWindow - frameless top-level explorer.
 *
 * Layout: title bar, controls row (back/up/address/view toggle), action row
 * (copy/cut/delete/paste), tree | list splitter, status label. All clipboard
 * work goes through ClipboardReconciler against the window's ExplorerSession.
 */
class ExplorerWindow : public QWidget
{
    Q_OBJECT

public:
    static constexpr int ActionButtonSize = 40;

    ExplorerWindow(ExplorerSettings& settings, FileSystem& fs, SystemClipboard& clipboard, QWidget* parent = nullptr);

    const ExplorerSession& session() const { return m_session; }
    QString currentPath() const { return m_session.currentDir; }
    QString statusText() const;
    bool isIconMode() const;

    QListView* listView() const { return m_list; }
    QTreeView* treeView() const { return m_tree; }
    QLineEdit* addressBar() const { return m_address; }
    TitleBar* titleBar() const { return m_titleBar; }

    // Returns false (after notifying) if path does not exist or is not a directory
    bool navigateTo(const QString& path);

    // Selection of the list view, in absolute paths
    QStringList selectedPaths() const;
    void selectPaths(const QStringList& paths);

public slots:
    void goBack();
    void goForward();
    void goUp();
    void setIconMode(bool icons);

    void copySelection();
    void cutSelection();
    void pasteIntoCurrent();
    void deleteSelection();

protected:
    enum class NoticeKind { Information, Warning };

    // Blocking dialogs; overridable so automated runs can answer them
    virtual bool confirm(const QString& title, const QString& text);
    virtual void notify(NoticeKind kind, const QString& title, const QString& text);

    void closeEvent(QCloseEvent* event) override;

private slots:
    void onAddressEntered();
    void onTreeClicked(const QModelIndex& index);
    void onItemDoubleClicked(const QModelIndex& index);

private:
    void setupUi();
    void setupShortcuts();
    QPushButton* makeActionButton(const QString& texture, const QString& fallbackText, const QString& tip);
    bool showDirectory(const QString& path);
    void refreshListing();
    void stageSelection(bool cut);
    void reportFailures(const QString& title, const QList<EntryFailure>& failures);
    void setStatus(const QString& text);
    void saveState();

    ExplorerSettings& m_settings;
    ClipboardReconciler m_reconciler;
    ExplorerSession m_session;
    QString m_textureDir;

    TitleBar* m_titleBar = nullptr;
    QToolButton* m_backBtn = nullptr;
    QToolButton* m_upBtn = nullptr;
    QLineEdit* m_address = nullptr;
    QToolButton* m_viewToggle = nullptr;
    QPushButton* m_copyBtn = nullptr;
    QPushButton* m_cutBtn = nullptr;
    QPushButton* m_deleteBtn = nullptr;
    QPushButton* m_pasteBtn = nullptr;
    QSplitter* m_splitter = nullptr;
    QFileSystemModel* m_treeModel = nullptr;
    QFileSystemModel* m_listModel = nullptr;
    QTreeView* m_tree = nullptr;
    QListView* m_list = nullptr;
    QLabel* m_status = nullptr;
};
