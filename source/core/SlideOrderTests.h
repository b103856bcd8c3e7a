#pragma once

// ============================================================================
// SlideOrderTests - Unit tests for the SlideOrder class
// ============================================================================
// Tests:
// - append (empty input, duplicates)
// - move (including every current-position rule)
// - remove (last-slide guard, current-position clamping)
// - current position stays valid across random mutation sequences
// ============================================================================

#include "SlideOrder.h"

#include <QDebug>
#include <QRandomGenerator>

namespace SlideOrderTests {

inline SlideOrder makeOrder(int count, int current = 0)
{
    SlideOrder order;
    QVector<int> ids;
    for (int i = 0; i < count; ++i) {
        ids.append(i);
    }
    order.append(ids);
    order.setCurrentPosition(current);
    return order;
}

/**
 * @brief Test append().
 */
inline bool testAppend()
{
    qDebug() << "=== Test: append ===";
    bool success = true;

    SlideOrder order;
    if (order.append({}) != 0 || !order.isEmpty() || order.currentPosition() != 0) {
        qDebug() << "FAIL: Appending nothing should leave an empty order at position 0";
        success = false;
    }

    if (order.append({3, 4, 5}) != 3 || order.slideIds() != QVector<int>({3, 4, 5})) {
        qDebug() << "FAIL: append should keep insertion order, got" << order.slideIds();
        success = false;
    }

    // Duplicates are skipped
    if (order.append({5, 6}) != 1 || order.slideIds() != QVector<int>({3, 4, 5, 6})) {
        qDebug() << "FAIL: Duplicate ids should be skipped, got" << order.slideIds();
        success = false;
    }

    if (order.slideIdAt(1) != 4 || order.slideIdAt(9) != -1 || order.positionOf(6) != 3 ||
        order.positionOf(42) != -1) {
        qDebug() << "FAIL: slideIdAt/positionOf lookups are wrong";
        success = false;
    }

    if (success) {
        qDebug() << "  - append: OK";
    }
    return success;
}

/**
 * @brief Test move() and how it carries the current position.
 */
inline bool testMove()
{
    qDebug() << "=== Test: move ===";
    bool success = true;

    // Reorder semantics
    {
        SlideOrder order = makeOrder(5);
        order.move(0, 3);
        if (order.slideIds() != QVector<int>({1, 2, 3, 0, 4})) {
            qDebug() << "FAIL: move(0,3) gave" << order.slideIds();
            success = false;
        }
        order.move(3, 0);
        if (order.slideIds() != QVector<int>({0, 1, 2, 3, 4})) {
            qDebug() << "FAIL: move(3,0) should undo move(0,3), gave" << order.slideIds();
            success = false;
        }
    }

    // Current slide itself is moved
    {
        SlideOrder order = makeOrder(5, 1);
        order.move(1, 4);
        if (order.currentPosition() != 4 || order.currentSlideId() != 1) {
            qDebug() << "FAIL: Current should follow moved slide, at" << order.currentPosition();
            success = false;
        }
    }

    // from < current <= to: current shifts back
    {
        SlideOrder order = makeOrder(5, 2);
        order.move(0, 3);
        if (order.currentPosition() != 1 || order.currentSlideId() != 2) {
            qDebug() << "FAIL: from < current <= to should decrement, at" << order.currentPosition();
            success = false;
        }
    }

    // to <= current < from: current shifts forward
    {
        SlideOrder order = makeOrder(5, 2);
        order.move(4, 1);
        if (order.currentPosition() != 3 || order.currentSlideId() != 2) {
            qDebug() << "FAIL: to <= current < from should increment, at" << order.currentPosition();
            success = false;
        }
    }

    // Unaffected range
    {
        SlideOrder order = makeOrder(5, 0);
        order.move(2, 4);
        if (order.currentPosition() != 0) {
            qDebug() << "FAIL: Move after current should not shift it";
            success = false;
        }
    }

    // No-ops
    {
        SlideOrder order = makeOrder(3, 1);
        const bool changed = order.move(1, 1) || order.move(-1, 2) || order.move(0, 3);
        if (changed || order.slideIds() != QVector<int>({0, 1, 2}) || order.currentPosition() != 1) {
            qDebug() << "FAIL: Same or out-of-range indices should be no-ops";
            success = false;
        }
    }

    if (success) {
        qDebug() << "  - move: OK";
    }
    return success;
}

/**
 * @brief Test remove() and current-position clamping.
 */
inline bool testRemove()
{
    qDebug() << "=== Test: remove ===";
    bool success = true;

    // Last slide can't be removed
    {
        SlideOrder order = makeOrder(1);
        if (order.remove(0) || order.count() != 1) {
            qDebug() << "FAIL: The only slide must not be removed";
            success = false;
        }
    }

    // Out of range
    {
        SlideOrder order = makeOrder(3);
        if (order.remove(3) || order.remove(-1) || order.count() != 3) {
            qDebug() << "FAIL: Out-of-range remove should be a no-op";
            success = false;
        }
    }

    // Removing before current shifts it back
    {
        SlideOrder order = makeOrder(4, 2);
        order.remove(0);
        if (order.currentPosition() != 1 || order.currentSlideId() != 2) {
            qDebug() << "FAIL: Remove before current should decrement, at" << order.currentPosition();
            success = false;
        }
    }

    // Removing the current last slide clamps to the new end
    {
        SlideOrder order = makeOrder(4, 3);
        order.remove(3);
        if (order.currentPosition() != 2) {
            qDebug() << "FAIL: Current should clamp to count-1, at" << order.currentPosition();
            success = false;
        }
    }

    // Removing the current middle slide keeps the position
    {
        SlideOrder order = makeOrder(4, 1);
        order.remove(1);
        if (order.currentPosition() != 1 || order.currentSlideId() != 2) {
            qDebug() << "FAIL: Removing current should show the following slide";
            success = false;
        }
    }

    if (success) {
        qDebug() << "  - remove: OK";
    }
    return success;
}

/**
 * @brief Random move/remove/jump sequences keep the position valid.
 */
inline bool testCurrentPositionInvariant()
{
    qDebug() << "=== Test: current position invariant ===";

    QRandomGenerator rng(1234);
    SlideOrder order = makeOrder(12, 5);

    for (int step = 0; step < 2000; ++step) {
        const int n = order.count();
        switch (rng.bounded(4)) {
            case 0: order.move(rng.bounded(-1, n + 1), rng.bounded(-1, n + 1)); break;
            case 1: order.remove(rng.bounded(-1, n + 1)); break;
            case 2: order.setCurrentPosition(rng.bounded(-1, n + 1)); break;
            default: order.append({100 + step}); break;
        }

        if (order.currentPosition() < 0 || order.currentPosition() >= order.count()) {
            qDebug() << "FAIL: Position" << order.currentPosition() << "out of range after step" << step;
            return false;
        }
    }

    qDebug() << "  - 2000 random mutations: OK";
    return true;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running SlideOrder Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testAppend();
    qDebug() << "";

    allPass &= testMove();
    qDebug() << "";

    allPass &= testRemove();
    qDebug() << "";

    allPass &= testCurrentPositionInvariant();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL SLIDEORDER TESTS PASSED!";
    } else {
        qDebug() << "SOME SLIDEORDER TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace SlideOrderTests
