#include "widgets/explorer_window.h"

#include "explorer_settings.h"
#include "file_utils.h"
#include "log_manager.h"
#include "selection_collector.h"
#include "ui/icon_helpers.h"
#include "widgets/title_bar.h"

#include <QCloseEvent>
#include <QDesktopServices>
#include <QDir>
#include <QFileSystemModel>
#include <QHBoxLayout>
#include <QItemSelectionModel>
#include <QLabel>
#include <QLineEdit>
#include <QListView>
#include <QMessageBox>
#include <QPushButton>
#include <QShortcut>
#include <QSignalBlocker>
#include <QSplitter>
#include <QToolButton>
#include <QTreeView>
#include <QUrl>
#include <QVBoxLayout>

#include <functional>

ExplorerWindow::ExplorerWindow(ExplorerSettings& settings, FileSystem& fs, SystemClipboard& clipboard, QWidget* parent)
    : QWidget(parent)
    , m_settings(settings)
    , m_reconciler(fs, clipboard)
    , m_textureDir(settings.textureDir())
{
    setWindowFlags(Qt::Window | Qt::FramelessWindowHint);
    setMinimumSize(900, 600);
    setWindowTitle("Custom File Explorer");

    setupUi();
    setupShortcuts();

    const QByteArray geometry = m_settings.windowGeometry();
    if (!geometry.isEmpty()) restoreGeometry(geometry);
    const QByteArray splitter = m_settings.splitterState();
    if (!splitter.isEmpty()) m_splitter->restoreState(splitter);
    setIconMode(m_settings.iconMode());

    QString start = FileUtils::absolutePath(m_settings.currentPath());
    if (!FileUtils::dirExists(start)) {
        LogManager::instance().addLog("[Explorer] saved path missing, starting at home: " + start, "WARN");
        start = QDir::homePath();
    }
    const QModelIndex treeRoot = m_treeModel->index(start);
    m_tree->setRootIndex(treeRoot);
    showDirectory(start);
}

void ExplorerWindow::setupUi()
{
    auto* v = new QVBoxLayout(this);
    v->setContentsMargins(0, 0, 0, 0);
    v->setSpacing(0);

    m_titleBar = new TitleBar(windowTitle(), m_textureDir, this);
    connect(m_titleBar, &TitleBar::minimizeRequested, this, &QWidget::showMinimized);
    connect(m_titleBar, &TitleBar::closeRequested, this, &QWidget::close);
    v->addWidget(m_titleBar);

    auto* content = new QWidget(this);
    content->setObjectName("explorerContent");
    auto* contentLayout = new QVBoxLayout(content);
    contentLayout->setContentsMargins(12, 12, 12, 12);
    contentLayout->setSpacing(8);

    // Controls: back, up, address, view toggle
    auto* ctrlRow = new QHBoxLayout();
    ctrlRow->setSpacing(6);

    m_backBtn = new QToolButton(content);
    m_backBtn->setIcon(icoBack());
    m_backBtn->setToolTip(tr("Back"));
    connect(m_backBtn, &QToolButton::clicked, this, &ExplorerWindow::goBack);
    ctrlRow->addWidget(m_backBtn);

    m_upBtn = new QToolButton(content);
    m_upBtn->setIcon(icoUp());
    m_upBtn->setToolTip(tr("Up"));
    connect(m_upBtn, &QToolButton::clicked, this, &ExplorerWindow::goUp);
    ctrlRow->addWidget(m_upBtn);

    m_address = new QLineEdit(content);
    connect(m_address, &QLineEdit::returnPressed, this, &ExplorerWindow::onAddressEntered);
    ctrlRow->addWidget(m_address, 1);

    m_viewToggle = new QToolButton(content);
    m_viewToggle->setCheckable(true);
    m_viewToggle->setToolButtonStyle(Qt::ToolButtonTextBesideIcon);
    connect(m_viewToggle, &QToolButton::toggled, this, &ExplorerWindow::setIconMode);
    ctrlRow->addWidget(m_viewToggle);

    contentLayout->addLayout(ctrlRow);

    // Actions: four 40x40 texture buttons
    auto* buttonRow = new QHBoxLayout();
    buttonRow->setSpacing(10);

    m_copyBtn = makeActionButton("button2.png", tr("Copy"),
        tr("Copy File (can be pasted in this File Explorer and outside to your general File Explorer to be exported from here)"));
    connect(m_copyBtn, &QPushButton::clicked, this, &ExplorerWindow::copySelection);
    buttonRow->addWidget(m_copyBtn);

    m_cutBtn = makeActionButton("button1.png", tr("Cut"),
        tr("Cut File (can be pasted in this File Explorer and outside to your general File Explorer to be exported from here)"));
    connect(m_cutBtn, &QPushButton::clicked, this, &ExplorerWindow::cutSelection);
    buttonRow->addWidget(m_cutBtn);

    m_deleteBtn = makeActionButton("button3.png", tr("Del"), tr("Delete File"));
    connect(m_deleteBtn, &QPushButton::clicked, this, &ExplorerWindow::deleteSelection);
    buttonRow->addWidget(m_deleteBtn);

    m_pasteBtn = makeActionButton("button4.png", tr("Paste"),
        tr("Paste File (paste from our internal clipboard or system clipboard)"));
    connect(m_pasteBtn, &QPushButton::clicked, this, &ExplorerWindow::pasteIntoCurrent);
    buttonRow->addWidget(m_pasteBtn);

    buttonRow->addStretch();
    contentLayout->addLayout(buttonRow);

    // Tree (directories) | list (entries)
    m_splitter = new QSplitter(content);

    m_treeModel = new QFileSystemModel(this);
    m_treeModel->setFilter(QDir::AllDirs | QDir::NoDotAndDotDot | QDir::Drives);
    m_treeModel->setRootPath(QDir::rootPath());

    m_tree = new QTreeView(m_splitter);
    m_tree->setModel(m_treeModel);
    m_tree->setHeaderHidden(false);
    m_tree->setAnimated(false);
    m_tree->setMinimumWidth(250);
    connect(m_tree, &QTreeView::clicked, this, &ExplorerWindow::onTreeClicked);

    m_listModel = new QFileSystemModel(this);
    m_listModel->setFilter(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden);
    m_listModel->setReadOnly(true);

    m_list = new QListView(m_splitter);
    m_list->setModel(m_listModel);
    m_list->setSelectionMode(QAbstractItemView::ExtendedSelection);
    m_list->setResizeMode(QListView::Adjust);
    connect(m_list, &QListView::doubleClicked, this, &ExplorerWindow::onItemDoubleClicked);

    m_splitter->addWidget(m_tree);
    m_splitter->addWidget(m_list);
    m_splitter->setStretchFactor(1, 1);
    contentLayout->addWidget(m_splitter, 1);

    auto* statusRow = new QHBoxLayout();
    m_status = new QLabel(content);
    statusRow->addWidget(m_status);
    statusRow->addStretch();
    contentLayout->addLayout(statusRow);

    content->setStyleSheet(
        "#explorerContent { border: 2px solid #535353;"
        " background: qlineargradient(x1:0, y1:0, x2:0, y2:1, stop:0 #a8a8a8, stop:1 #6d6d6d); }"
        "QPushButton { background: transparent; border: none; }"
        "QPushButton:hover { background-color: rgba(255,255,255,0.06); border-radius: 6px; }");
    v->addWidget(content, 1);

    setStyleSheet("QToolTip { background-color: #333333; color: white; border: 1px solid #222222; padding: 2px; font-size: 11pt; }");
}

QPushButton* ExplorerWindow::makeActionButton(const QString& texture, const QString& fallbackText, const QString& tip)
{
    auto* btn = new QPushButton(this);
    btn->setFlat(true);
    btn->setCursor(Qt::PointingHandCursor);
    btn->setFixedSize(ActionButtonSize, ActionButtonSize);
    btn->setToolTip(tip);
    const QIcon icon = loadTextureIcon(m_textureDir, texture, ActionButtonSize);
    if (!icon.isNull()) {
        btn->setIcon(icon);
        btn->setIconSize(QSize(ActionButtonSize, ActionButtonSize));
    } else {
        btn->setText(fallbackText);
    }
    return btn;
}

void ExplorerWindow::setupShortcuts()
{
    auto mk = [this](const QKeySequence& key, std::function<void()> handler) {
        auto* sc = new QShortcut(key, this);
        sc->setContext(Qt::WindowShortcut);
        connect(sc, &QShortcut::activated, this, [this, handler]() {
            // keep text editing shortcuts inside the address bar
            if (m_address->hasFocus()) return;
            handler();
        });
    };

    mk(QKeySequence::Copy, [this]() { copySelection(); });
    mk(QKeySequence::Cut, [this]() { cutSelection(); });
    mk(QKeySequence::Paste, [this]() { pasteIntoCurrent(); });
    mk(QKeySequence::Delete, [this]() { deleteSelection(); });
    mk(QKeySequence(Qt::Key_Backspace), [this]() { goUp(); });

    auto* esc = new QShortcut(QKeySequence(Qt::Key_Escape), this);
    connect(esc, &QShortcut::activated, this, &QWidget::close);
    auto* back = new QShortcut(QKeySequence(Qt::ALT | Qt::Key_Left), this);
    connect(back, &QShortcut::activated, this, &ExplorerWindow::goBack);
    auto* fwd = new QShortcut(QKeySequence(Qt::ALT | Qt::Key_Right), this);
    connect(fwd, &QShortcut::activated, this, &ExplorerWindow::goForward);
}

QString ExplorerWindow::statusText() const
{
    return m_status->text();
}

bool ExplorerWindow::isIconMode() const
{
    return m_list->viewMode() == QListView::IconMode;
}

void ExplorerWindow::setStatus(const QString& text)
{
    m_status->setText(text);
}

bool ExplorerWindow::navigateTo(const QString& path)
{
    const QString abs = FileUtils::absolutePath(path);
    if (abs.isEmpty() || !FileUtils::pathExists(abs)) {
        notify(NoticeKind::Warning, tr("Path not found"), tr("The path does not exist:\n%1").arg(path));
        m_address->setText(m_session.currentDir);
        return false;
    }
    if (!FileUtils::dirExists(abs)) {
        notify(NoticeKind::Warning, tr("Invalid path"), tr("Cannot open path:\n%1").arg(path));
        m_address->setText(m_session.currentDir);
        return false;
    }
    return showDirectory(abs);
}

bool ExplorerWindow::showDirectory(const QString& path)
{
    const QModelIndex idx = m_listModel->setRootPath(path);
    if (!idx.isValid()) {
        notify(NoticeKind::Warning, tr("Invalid path"), tr("Cannot open path:\n%1").arg(path));
        return false;
    }
    m_list->setRootIndex(idx);
    m_list->clearSelection();

    const QModelIndex treeIdx = m_treeModel->index(path);
    if (treeIdx.isValid()) {
        m_tree->setCurrentIndex(treeIdx);
        m_tree->expand(treeIdx);
    }

    m_session.currentDir = path;
    m_session.history.visit(path);
    m_address->setText(path);
    m_backBtn->setEnabled(m_session.history.canGoBack());
    m_upBtn->setEnabled(!FileUtils::isRoot(path));
    setStatus(path);
    LogManager::instance().addLog("[Explorer] navigated to " + path, "DEBUG");
    return true;
}

void ExplorerWindow::refreshListing()
{
    const QString path = m_session.currentDir;
    if (path.isEmpty()) return;
    const QModelIndex idx = m_listModel->setRootPath(path);
    m_list->setRootIndex(idx);
}

void ExplorerWindow::goBack()
{
    const QString target = m_session.history.previous();
    if (target.isEmpty()) return;
    if (!FileUtils::dirExists(target)) {
        notify(NoticeKind::Warning, tr("Path not found"), tr("The path does not exist:\n%1").arg(target));
        return;
    }
    m_session.history.back();
    showDirectory(target);
}

void ExplorerWindow::goForward()
{
    const QString target = m_session.history.next();
    if (target.isEmpty()) return;
    if (!FileUtils::dirExists(target)) {
        notify(NoticeKind::Warning, tr("Path not found"), tr("The path does not exist:\n%1").arg(target));
        return;
    }
    m_session.history.forward();
    showDirectory(target);
}

void ExplorerWindow::goUp()
{
    if (m_session.currentDir.isEmpty() || FileUtils::isRoot(m_session.currentDir)) return;
    navigateTo(FileUtils::parentPath(m_session.currentDir));
}

void ExplorerWindow::setIconMode(bool icons)
{
    m_list->setViewMode(icons ? QListView::IconMode : QListView::ListMode);
    if (icons) {
        m_list->setGridSize(QSize(96, 80));
        m_list->setWordWrap(true);
    } else {
        m_list->setGridSize(QSize());
    }

    {
        const QSignalBlocker block(m_viewToggle);
        m_viewToggle->setChecked(icons);
    }
    m_viewToggle->setIcon(icons ? icoList() : icoGrid());
    m_viewToggle->setText(icons ? tr("List") : tr("Icons"));
    m_viewToggle->setToolTip(icons ? tr("Switch to List View") : tr("Switch to Icon View"));
}

QStringList ExplorerWindow::selectedPaths() const
{
    return SelectionCollector::collect(m_list->selectionModel());
}

void ExplorerWindow::selectPaths(const QStringList& paths)
{
    QItemSelectionModel* sel = m_list->selectionModel();
    sel->clearSelection();
    for (const QString& p : paths) {
        const QModelIndex idx = m_listModel->index(p);
        if (idx.isValid()) sel->select(idx, QItemSelectionModel::Select);
    }
}

void ExplorerWindow::stageSelection(bool cut)
{
    const QStringList paths = selectedPaths();
    if (paths.isEmpty()) {
        notify(NoticeKind::Information, tr("No selection"),
               cut ? tr("Select files/folders to cut.") : tr("Select files/folders to copy."));
        return;
    }
    if (!m_reconciler.stage(m_session, paths, cut)) return;
    setStatus(ClipboardReconciler::stageSummary(m_session.clipboard.paths.size(), cut));
}

void ExplorerWindow::copySelection()
{
    stageSelection(false);
}

void ExplorerWindow::cutSelection()
{
    stageSelection(true);
}

void ExplorerWindow::pasteIntoCurrent()
{
    const PasteOutcome outcome = m_reconciler.paste(m_session, m_session.currentDir);
    switch (outcome.status) {
    case PasteStatus::InvalidTarget:
        notify(NoticeKind::Warning, tr("Invalid Target"), ClipboardReconciler::summary(outcome));
        return;
    case PasteStatus::EmptyClipboard:
        notify(NoticeKind::Information, tr("Clipboard is empty"), ClipboardReconciler::summary(outcome));
        return;
    case PasteStatus::Ok:
        break;
    }

    refreshListing();
    setStatus(ClipboardReconciler::summary(outcome));
    if (!outcome.failures.isEmpty())
        reportFailures(outcome.cut ? tr("Cut/Paste Error") : tr("Paste Error"), outcome.failures);
}

void ExplorerWindow::deleteSelection()
{
    const QStringList paths = selectedPaths();
    if (paths.isEmpty()) {
        notify(NoticeKind::Information, tr("No selection"), tr("Select files/folders to delete."));
        return;
    }
    if (!confirm(tr("Delete?"), tr("Delete %1 items? This will permanently delete them.").arg(paths.size())))
        return;

    const DeleteOutcome outcome = m_reconciler.remove(paths);
    refreshListing();
    setStatus(ClipboardReconciler::summary(outcome));
    if (!outcome.failures.isEmpty())
        reportFailures(tr("Delete error"), outcome.failures);
}

void ExplorerWindow::reportFailures(const QString& title, const QList<EntryFailure>& failures)
{
    QStringList lines;
    for (const EntryFailure& f : failures)
        lines << QString("%1: %2").arg(FileUtils::baseName(f.path), f.reason);
    notify(NoticeKind::Warning, title,
           tr("%n item(s) failed:", nullptr, int(failures.size())) + "\n" + lines.join('\n'));
}

void ExplorerWindow::onAddressEntered()
{
    const QString path = m_address->text().trimmed();
    if (!path.isEmpty()) navigateTo(path);
}

void ExplorerWindow::onTreeClicked(const QModelIndex& index)
{
    navigateTo(m_treeModel->filePath(index));
}

void ExplorerWindow::onItemDoubleClicked(const QModelIndex& index)
{
    const QString path = m_listModel->filePath(index);
    if (m_listModel->isDir(index)) {
        navigateTo(path);
        return;
    }
    if (!QDesktopServices::openUrl(QUrl::fromLocalFile(path)))
        LogManager::instance().addLog("[Explorer] no handler could open " + path, "WARN");
}

bool ExplorerWindow::confirm(const QString& title, const QString& text)
{
    return QMessageBox::question(this, title, text) == QMessageBox::Yes;
}

void ExplorerWindow::notify(NoticeKind kind, const QString& title, const QString& text)
{
    if (kind == NoticeKind::Warning)
        QMessageBox::warning(this, title, text);
    else
        QMessageBox::information(this, title, text);
}

void ExplorerWindow::saveState()
{
    m_settings.setCurrentPath(m_session.currentDir);
    m_settings.setIconMode(isIconMode());
    m_settings.setWindowGeometry(saveGeometry());
    m_settings.setSplitterState(m_splitter->saveState());
    m_settings.sync();
}

void ExplorerWindow::closeEvent(QCloseEvent* event)
{
    saveState();
    LogManager::instance().addLog("[Explorer] window closed at " + m_session.currentDir);
    QWidget::closeEvent(event);
}
