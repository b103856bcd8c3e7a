#pragma once

// ============================================================================
// PresentationSync - Shared navigation state of presenter and projector
// ============================================================================
// Both windows render from the same current position (stored in SlideOrder)
// and the same vertical offset, so they can never disagree about which slide
// or which part of a slide is shown.
//
// Slides whose projection image is taller than the projector viewport are
// shown in two steps: top half first (offset 0.0), bottom part second
// (offset 1.0). next() and previous() walk through these steps before
// changing slides.
// ============================================================================

#include <QObject>
#include <QRectF>
#include <QSize>

class SlideOrder;
class SlideImageCache;

/**
 * @brief Where to copy a slide image from and where to draw it.
 */
struct ProjectorLayout {
    QRectF sourceRect;      ///< Part of the image to show (image pixels)
    QRectF targetRect;      ///< Where it goes in the viewport (viewport pixels)
    bool scrolls = false;   ///< Image is taller than the viewport

    bool isValid() const { return !sourceRect.isEmpty() && !targetRect.isEmpty(); }
};

class PresentationSync : public QObject {
    Q_OBJECT

public:
    PresentationSync(SlideOrder* order, const SlideImageCache* images, QObject* parent = nullptr);

    // ===== State =====

    int currentPosition() const;
    int currentSlideId() const;
    qreal verticalOffset() const { return m_offset; }

    /**
     * @brief Size of the projector drawing area.
     *
     * Determines which slides count as tall.
     */
    void setViewportSize(const QSize& size);
    QSize viewportSize() const { return m_viewport; }

    bool isSlideTall(int slideId) const;
    bool isCurrentSlideTall() const { return isSlideTall(currentSlideId()); }

    /**
     * @brief Layout of the current slide's projection image in the viewport.
     */
    ProjectorLayout currentLayout() const;

    /**
     * @brief Compute where a slide image goes in the projector viewport.
     * @param imageSize Size of the rendered slide.
     * @param viewport Size of the drawing area.
     * @param verticalOffset 0.0 (top) to 1.0 (bottom) for tall images.
     *
     * Images that fit vertically are centered. Taller images show a
     * viewport-high slice starting at (imageHeight - viewportHeight) * offset.
     * Horizontally the image is always centered.
     */
    static ProjectorLayout computeLayout(const QSize& imageSize, const QSize& viewport,
                                         qreal verticalOffset);

    /**
     * @brief Shrink (or grow) a projector layout into a smaller view.
     *
     * The viewport is fitted into targetSize keeping its aspect ratio and
     * centered; the target rect follows, the source rect is unchanged.
     * Used by the presenter preview to show exactly what is projected.
     */
    static ProjectorLayout scaleLayout(const ProjectorLayout& layout, const QSize& viewport,
                                       const QSize& targetSize);

public slots:
    /**
     * @brief Go to a position, showing the top of the slide.
     * @return False if position is out of range.
     */
    bool jumpTo(int position);

    /**
     * @brief Scroll to the bottom of a tall slide, or advance one slide.
     * @return False if already at the end.
     */
    bool next();

    /**
     * @brief Scroll back to the top of a slide, or go back one slide.
     *
     * Going back onto a tall slide lands on its bottom part, mirroring next().
     * @return False if already at the start.
     */
    bool previous();

    /**
     * @brief Re-read the current position after SlideOrder was mutated.
     *
     * Resets the offset if a different slide is now current.
     */
    void resync();

signals:
    void currentSlideChanged(int position, int slideId);
    void verticalOffsetChanged(qreal offset);
    void viewsNeedRepaint();

private:
    void setOffset(qreal offset);
    void announce();

    SlideOrder* m_order;
    const SlideImageCache* m_images;
    QSize m_viewport;
    qreal m_offset = 0.0;
    int m_lastPosition = -1;
    int m_lastSlideId = -1;
};
