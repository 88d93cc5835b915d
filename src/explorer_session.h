#pragma once

#include "navigation_history.h"

#include <QString>
#include <QStringList>

// Paths staged by copy/cut. Replaced wholesale on every stage.
struct ClipboardEntry {
    QStringList paths;
    bool isCut = false;

    bool isEmpty() const { return paths.isEmpty(); }
    void clear() { paths.clear(); isCut = false; }
};

// Per-window explorer state handed to every operation
struct ExplorerSession {
    QString currentDir;
    NavigationHistory history;
    ClipboardEntry clipboard;
};
