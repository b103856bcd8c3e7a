#include "SlideView.h"
#include "../core/PresentationSession.h"
#include "../core/PresentationSync.h"

#include <QPainter>

SlideView::SlideView(PresentationSession* session, QWidget* parent)
    : QWidget(parent)
    , m_session(session)
{
    setAttribute(Qt::WA_OpaquePaintEvent, true);
    setMinimumSize(160, 120);

    if (m_session) {
        connect(m_session->sync(), &PresentationSync::viewsNeedRepaint,
                this, QOverload<>::of(&QWidget::update));
        connect(m_session->sync(), &PresentationSync::verticalOffsetChanged,
                this, QOverload<>::of(&QWidget::update));
    }
}

void SlideView::setBackgroundColor(const QColor& color)
{
    m_background = color;
    update();
}

void SlideView::setPlaceholderText(const QString& text)
{
    m_placeholderText = text;
    update();
}

QSize SlideView::sizeHint() const
{
    return QSize(640, 480);
}

QImage SlideView::currentImage() const
{
    if (!m_session) {
        return QImage();
    }
    const int slideId = m_session->currentSlideId();
    QImage image = m_session->images().image(slideId, SlideImageCache::Kind::Projection);
    if (image.isNull()) {
        // Outside presentation mode only thumbnails exist
        image = m_session->images().image(slideId, SlideImageCache::Kind::Thumbnail);
    }
    return image;
}

void SlideView::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), m_background);

    const QImage image = currentImage();
    if (image.isNull() || image.width() <= 0 || image.height() <= 0) {
        if (!m_placeholderText.isEmpty()) {
            painter.setPen(QColor(160, 160, 160));
            painter.drawText(rect(), Qt::AlignCenter, m_placeholderText);
        }
        return;
    }

    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);

    // In presentation mode show the projector's view, scaled into this widget
    PresentationSync* sync = m_session->sync();
    if (m_session->images().contains(m_session->currentSlideId(), SlideImageCache::Kind::Projection)
        && sync->viewportSize().isValid()) {
        const ProjectorLayout projected = PresentationSync::scaleLayout(
            sync->currentLayout(), sync->viewportSize(), size());
        if (projected.isValid()) {
            painter.drawImage(projected.targetRect, image, projected.sourceRect);
        }
        return;
    }

    const bool tall = sync->isCurrentSlideTall();
    const qreal scaleToWidth = static_cast<qreal>(width()) / image.width();
    const qreal scale = tall
        ? scaleToWidth
        : qMin(scaleToWidth, static_cast<qreal>(height()) / image.height());

    const QSize scaledSize(qRound(image.width() * scale), qRound(image.height() * scale));
    const ProjectorLayout layout = PresentationSync::computeLayout(
        scaledSize, size(), sync->verticalOffset());
    if (!layout.isValid()) {
        return;
    }

    // Map the slice back into image pixels
    const QRectF source(layout.sourceRect.x() / scale, layout.sourceRect.y() / scale,
                        layout.sourceRect.width() / scale, layout.sourceRect.height() / scale);
    painter.drawImage(layout.targetRect, image, source);
}
