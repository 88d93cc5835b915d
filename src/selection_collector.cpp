#include "selection_collector.h"
#include "file_utils.h"

#include <QFileSystemModel>
#include <QItemSelectionModel>
#include <QSet>

namespace SelectionCollector {

QStringList collect(const QModelIndexList& indexes)
{
    QStringList paths;
    QSet<QString> seen;
    for (const QModelIndex& i : indexes) {
        if (!i.isValid() || i.column() != 0) continue;
        const QString p = FileUtils::absolutePath(i.data(QFileSystemModel::FilePathRole).toString());
        if (p.isEmpty() || seen.contains(p)) continue;
        seen.insert(p);
        paths << p;
    }
    return paths;
}

QStringList collect(const QItemSelectionModel* selection)
{
    if (!selection) return QStringList();
    return collect(selection->selectedIndexes());
}

} // namespace SelectionCollector
