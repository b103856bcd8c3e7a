// ============================================================================
// PresentationSync - Implementation
// ============================================================================

#include "PresentationSync.h"
#include "SlideImageCache.h"
#include "SlideOrder.h"

#include <QDebug>

PresentationSync::PresentationSync(SlideOrder* order, const SlideImageCache* images, QObject* parent)
    : QObject(parent)
    , m_order(order)
    , m_images(images)
{
    m_lastPosition = currentPosition();
    m_lastSlideId = currentSlideId();
}

// ===== State =====

int PresentationSync::currentPosition() const
{
    return m_order ? m_order->currentPosition() : 0;
}

int PresentationSync::currentSlideId() const
{
    return m_order ? m_order->currentSlideId() : -1;
}

void PresentationSync::setViewportSize(const QSize& size)
{
    if (size == m_viewport) {
        return;
    }
    m_viewport = size;

    // A slide that stopped being tall has nothing to scroll
    if (m_offset > 0.0 && !isCurrentSlideTall()) {
        setOffset(0.0);
    }
    emit viewsNeedRepaint();
}

bool PresentationSync::isSlideTall(int slideId) const
{
    if (!m_images || slideId < 0 || !m_viewport.isValid()) {
        return false;
    }
    const QSize size = m_images->imageSize(slideId, SlideImageCache::Kind::Projection);
    return size.isValid() && size.height() > m_viewport.height();
}

ProjectorLayout PresentationSync::currentLayout() const
{
    if (!m_images) {
        return ProjectorLayout();
    }
    const QSize size = m_images->imageSize(currentSlideId(), SlideImageCache::Kind::Projection);
    return computeLayout(size, m_viewport, m_offset);
}

ProjectorLayout PresentationSync::computeLayout(const QSize& imageSize, const QSize& viewport,
                                                qreal verticalOffset)
{
    ProjectorLayout layout;
    if (imageSize.isEmpty() || viewport.isEmpty()) {
        return layout;
    }

    const qreal offset = qBound<qreal>(0.0, verticalOffset, 1.0);
    const qreal imgW = imageSize.width();
    const qreal imgH = imageSize.height();
    const qreal viewW = viewport.width();
    const qreal viewH = viewport.height();

    // Horizontal: centered, cropped symmetrically if wider than the viewport
    qreal srcX = 0;
    qreal dstX = (viewW - imgW) / 2.0;
    qreal width = imgW;
    if (imgW > viewW) {
        srcX = (imgW - viewW) / 2.0;
        dstX = 0;
        width = viewW;
    }

    if (imgH <= viewH) {
        layout.sourceRect = QRectF(srcX, 0, width, imgH);
        layout.targetRect = QRectF(dstX, (viewH - imgH) / 2.0, width, imgH);
        layout.scrolls = false;
    } else {
        const qreal srcY = (imgH - viewH) * offset;
        layout.sourceRect = QRectF(srcX, srcY, width, viewH);
        layout.targetRect = QRectF(dstX, 0, width, viewH);
        layout.scrolls = true;
    }
    return layout;
}

ProjectorLayout PresentationSync::scaleLayout(const ProjectorLayout& layout, const QSize& viewport,
                                              const QSize& targetSize)
{
    if (!layout.isValid() || viewport.isEmpty() || targetSize.isEmpty()) {
        return ProjectorLayout();
    }

    const qreal scale = qMin(static_cast<qreal>(targetSize.width()) / viewport.width(),
                             static_cast<qreal>(targetSize.height()) / viewport.height());
    const qreal originX = (targetSize.width() - viewport.width() * scale) / 2.0;
    const qreal originY = (targetSize.height() - viewport.height() * scale) / 2.0;

    ProjectorLayout scaled = layout;
    const QRectF& r = layout.targetRect;
    scaled.targetRect = QRectF(originX + r.x() * scale, originY + r.y() * scale,
                               r.width() * scale, r.height() * scale);
    return scaled;
}

// ===== Navigation =====

bool PresentationSync::jumpTo(int position)
{
    if (!m_order || !m_order->setCurrentPosition(position)) {
        return false;
    }
    setOffset(0.0);
    announce();
    return true;
}

bool PresentationSync::next()
{
    if (!m_order || m_order->isEmpty()) {
        return false;
    }

    // First press on a tall slide reveals its lower part
    if (isCurrentSlideTall() && m_offset < 1.0) {
        setOffset(1.0);
        emit viewsNeedRepaint();
        return true;
    }

    const int target = currentPosition() + 1;
    if (target >= m_order->count()) {
        return false;
    }
    m_order->setCurrentPosition(target);
    setOffset(0.0);
    announce();
    return true;
}

bool PresentationSync::previous()
{
    if (!m_order || m_order->isEmpty()) {
        return false;
    }

    if (m_offset > 0.0) {
        setOffset(0.0);
        emit viewsNeedRepaint();
        return true;
    }

    const int target = currentPosition() - 1;
    if (target < 0) {
        return false;
    }
    m_order->setCurrentPosition(target);
    setOffset(isSlideTall(m_order->slideIdAt(target)) ? 1.0 : 0.0);
    announce();
    return true;
}

void PresentationSync::resync()
{
    if (currentSlideId() != m_lastSlideId) {
        setOffset(0.0);
    }
    announce();
}

// ===== Helpers =====

void PresentationSync::setOffset(qreal offset)
{
    offset = qBound<qreal>(0.0, offset, 1.0);
    if (qFuzzyCompare(1.0 + offset, 1.0 + m_offset)) {
        return;
    }
    m_offset = offset;
    emit verticalOffsetChanged(m_offset);
}

void PresentationSync::announce()
{
    const int position = currentPosition();
    const int slideId = currentSlideId();
    if (position != m_lastPosition || slideId != m_lastSlideId) {
        m_lastPosition = position;
        m_lastSlideId = slideId;
        emit currentSlideChanged(position, slideId);
    }
    emit viewsNeedRepaint();
}
