#include "navigation_history.h"

bool NavigationHistory::visit(const QString& path)
{
    if (path.isEmpty()) return false;
    if (m_index >= 0 && m_entries.at(m_index) == path) return false;

    // drop forward history
    while (m_entries.size() > m_index + 1) m_entries.removeLast();
    m_entries.append(path);
    m_index = m_entries.size() - 1;
    return true;
}

QString NavigationHistory::previous() const
{
    return canGoBack() ? m_entries.at(m_index - 1) : QString();
}

QString NavigationHistory::next() const
{
    return canGoForward() ? m_entries.at(m_index + 1) : QString();
}

QString NavigationHistory::back()
{
    if (!canGoBack()) return QString();
    --m_index;
    return m_entries.at(m_index);
}

QString NavigationHistory::forward()
{
    if (!canGoForward()) return QString();
    ++m_index;
    return m_entries.at(m_index);
}

QString NavigationHistory::current() const
{
    return m_index >= 0 ? m_entries.at(m_index) : QString();
}

void NavigationHistory::clear()
{
    m_entries.clear();
    m_index = -1;
}
