// ============================================================================
// SlideOrder - Implementation
// ============================================================================

#include "SlideOrder.h"

#include <QDebug>

int SlideOrder::slideIdAt(int position) const
{
    return isValidPosition(position) ? m_ids.at(position) : -1;
}

int SlideOrder::positionOf(int slideId) const
{
    return m_ids.indexOf(slideId);
}

int SlideOrder::append(const QVector<int>& slideIds)
{
    int appended = 0;
    for (int id : slideIds) {
        if (m_ids.contains(id)) {
            qWarning() << "SlideOrder: Skipping duplicate slide id" << id;
            continue;
        }
        m_ids.append(id);
        ++appended;
    }
    return appended;
}

bool SlideOrder::move(int from, int to)
{
    if (!isValidPosition(from) || !isValidPosition(to) || from == to) {
        return false;
    }

    const int id = m_ids.takeAt(from);
    m_ids.insert(to, id);

    // Keep the current position on the same slide
    if (m_current == from) {
        m_current = to;
    } else if (from < m_current && m_current <= to) {
        --m_current;
    } else if (to <= m_current && m_current < from) {
        ++m_current;
    }

    return true;
}

bool SlideOrder::remove(int position)
{
    if (m_ids.size() <= 1 || !isValidPosition(position)) {
        return false;
    }

    m_ids.removeAt(position);

    if (m_current >= m_ids.size()) {
        m_current = m_ids.size() - 1;
    } else if (m_current > position) {
        --m_current;
    }

    return true;
}

void SlideOrder::clear()
{
    m_ids.clear();
    m_current = 0;
}

bool SlideOrder::setCurrentPosition(int position)
{
    if (!isValidPosition(position)) {
        return false;
    }
    m_current = position;
    return true;
}
