#pragma once

#include <QString>
#include <QStringList>

// Ordered list of visited directories with a cursor.
// Visiting truncates everything ahead of the cursor; back/forward only move it.
class NavigationHistory {
public:
    // Returns false if path equals the current entry (nothing recorded)
    bool visit(const QString& path);

    bool canGoBack() const { return m_index > 0; }
    bool canGoForward() const { return m_index >= 0 && m_index + 1 < m_entries.size(); }

    // Entry that back()/forward() would land on, or empty
    QString previous() const;
    QString next() const;

    // Move the cursor and return the new current entry; empty if not possible
    QString back();
    QString forward();

    QString current() const;
    int index() const { return m_index; }
    int size() const { return m_entries.size(); }
    QStringList entries() const { return m_entries; }
    void clear();

private:
    QStringList m_entries;
    int m_index = -1;
};
