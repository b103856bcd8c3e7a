#pragma once

// ============================================================================
// SlideOrder - The presentation sequence of slide ids
// ============================================================================
// Holds the order in which slides are presented, which is independent of the
// order of pages inside their source PDFs. Also owns the current position,
// so every mutation can keep it pointing at a valid slide.
//
// Positions are 0-based indices into the sequence. Out-of-range positions are
// never an error here: the operation is a no-op and returns false, because
// requests usually come from UI state that may already be stale.
// ============================================================================

#include <QVector>

/**
 * @brief Ordered list of global slide ids plus the current position.
 *
 * Invariants:
 * - No id appears twice.
 * - 0 <= currentPosition() < count() whenever the order is non-empty;
 *   currentPosition() is 0 when empty.
 */
class SlideOrder {
public:
    SlideOrder() = default;

    // ===== Queries =====

    int count() const { return m_ids.size(); }
    bool isEmpty() const { return m_ids.isEmpty(); }
    const QVector<int>& slideIds() const { return m_ids; }

    /**
     * @brief Slide id at a position.
     * @return The id, or -1 if position is out of range.
     */
    int slideIdAt(int position) const;

    /**
     * @brief Position of a slide id.
     * @return The position, or -1 if the id is not in the order.
     */
    int positionOf(int slideId) const;

    bool contains(int slideId) const { return m_ids.contains(slideId); }

    // ===== Mutation =====

    /**
     * @brief Append slide ids to the end of the order.
     * @param slideIds Ids to append, in presentation order.
     * @return Number of ids actually appended (ids already present are skipped).
     */
    int append(const QVector<int>& slideIds);

    /**
     * @brief Move the slide at @p from so it ends up at @p to.
     * @return True if the order changed. False if either index is out of
     *         range or from == to.
     *
     * The current position follows the slide it pointed at.
     */
    bool move(int from, int to);

    /**
     * @brief Remove the slide at a position.
     * @return True if removed. False if out of range or it is the last slide.
     */
    bool remove(int position);

    /**
     * @brief Remove all slides and reset the current position.
     */
    void clear();

    // ===== Current Position =====

    int currentPosition() const { return m_current; }

    /**
     * @brief Id of the slide at the current position, or -1 when empty.
     */
    int currentSlideId() const { return slideIdAt(m_current); }

    /**
     * @brief Set the current position.
     * @return False (no change) if position is out of range.
     */
    bool setCurrentPosition(int position);

private:
    bool isValidPosition(int position) const {
        return position >= 0 && position < m_ids.size();
    }

    QVector<int> m_ids;     ///< Global slide ids in presentation order
    int m_current = 0;      ///< Index into m_ids
};
