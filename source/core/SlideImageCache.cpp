// ============================================================================
// SlideImageCache - Implementation
// ============================================================================

#include "SlideImageCache.h"
#include "PageRegistry.h"

#include <QDebug>

SlideImageCache::SlideImageCache(const PageRegistry* registry)
    : m_registry(registry)
{
}

qreal SlideImageCache::dpiForWidth(const QSizeF& pageSizePt, int targetWidth)
{
    if (pageSizePt.width() <= 0 || targetWidth <= 0) {
        return 0;
    }
    return targetWidth * 72.0 / pageSizePt.width();
}

QImage SlideImageCache::renderAtWidth(int slideId, int width) const
{
    if (!m_registry || width <= 0) {
        return QImage();
    }

    const SlideSource source = m_registry->resolve(slideId);
    if (!source.isValid()) {
        return QImage();
    }

    const QSizeF pageSize = source.document->pageSize(source.pageIndex);
    const qreal dpi = dpiForWidth(pageSize, width);
    if (dpi <= 0) {
        qWarning() << "SlideImageCache: Page has no size, slide" << slideId;
        return QImage();
    }

    QImage image = source.document->renderPageToImage(source.pageIndex, dpi);
    if (image.isNull()) {
        qWarning() << "SlideImageCache: Render failed for slide" << slideId;
        return QImage();
    }

    // Backends round the pixel size differently; normalize to the exact width
    if (image.width() != width) {
        image = image.scaledToWidth(width, Qt::SmoothTransformation);
    }
    return image;
}

bool SlideImageCache::renderThumbnail(int slideId, int width)
{
    QImage image = renderAtWidth(slideId, width);
    if (image.isNull()) {
        return false;
    }
    m_thumbnails.insert(slideId, image);
    return true;
}

int SlideImageCache::renderProjectionImages(const QVector<int>& slideIds, int targetWidth)
{
    m_projection.clear();
    m_projectionWidth = targetWidth;

    int rendered = 0;
    for (int id : slideIds) {
        QImage image = renderAtWidth(id, targetWidth);
        if (image.isNull()) {
            continue;
        }
        m_projection.insert(id, image);
        ++rendered;
    }

    qDebug() << "SlideImageCache: Rendered" << rendered << "of" << slideIds.size()
             << "projection images at width" << targetWidth;
    return rendered;
}

QImage SlideImageCache::image(int slideId, Kind kind) const
{
    return images(kind).value(slideId);
}

bool SlideImageCache::contains(int slideId, Kind kind) const
{
    return images(kind).contains(slideId);
}

int SlideImageCache::count(Kind kind) const
{
    return images(kind).size();
}

void SlideImageCache::clear(Kind kind)
{
    images(kind).clear();
    if (kind == Kind::Projection) {
        m_projectionWidth = 0;
    }
}

QSize SlideImageCache::imageSize(int slideId, Kind kind) const
{
    auto it = images(kind).constFind(slideId);
    if (it == images(kind).constEnd()) {
        return QSize();
    }
    return it->size();
}
