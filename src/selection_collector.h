#pragma once

#include <QAbstractItemModel>
#include <QStringList>

class QItemSelectionModel;

// Turns a view selection into absolute paths, first-seen order, no duplicates.
// Only column 0 is considered. Paths come from QFileSystemModel::FilePathRole.
namespace SelectionCollector {

QStringList collect(const QModelIndexList& indexes);
QStringList collect(const QItemSelectionModel* selection);

} // namespace SelectionCollector
