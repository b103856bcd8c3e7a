#pragma once

// ============================================================================
// SlideImageCache - Rendered slide bitmaps keyed by slide id
// ============================================================================
// Two independent image sets are kept:
// - Thumbnail: small images for the slide organizer (rendered on import)
// - Projection: full-width images for presentation mode (rendered on entry
//   and again when the projector size changes)
//
// Rendering a slide replaces its previous entry, so repeating a render is
// always safe.
// ============================================================================

#include <QHash>
#include <QImage>
#include <QSize>
#include <QSizeF>
#include <QVector>

class PageRegistry;

class SlideImageCache {
public:
    enum class Kind {
        Thumbnail,
        Projection
    };

    explicit SlideImageCache(const PageRegistry* registry);

    // ===== Rendering =====

    /**
     * @brief Render a thumbnail for a slide.
     * @param slideId Global slide id.
     * @param width Target width in pixels.
     * @return True if an image was rendered and stored.
     */
    bool renderThumbnail(int slideId, int width);

    /**
     * @brief Replace the projection set with images for @p slideIds.
     * @param targetWidth Width of the projector output in pixels.
     * @return Number of slides rendered.
     */
    int renderProjectionImages(const QVector<int>& slideIds, int targetWidth);

    /**
     * @brief Render one slide at an exact width without caching it.
     * @return Null image if the slide is unknown or rendering failed.
     */
    QImage renderAtWidth(int slideId, int width) const;

    // ===== Access =====

    QImage image(int slideId, Kind kind) const;
    bool contains(int slideId, Kind kind) const;
    int count(Kind kind) const;
    void clear(Kind kind);

    /// Pixel size of a cached image, or an invalid QSize if absent.
    QSize imageSize(int slideId, Kind kind) const;

    /// Width the projection set was last rendered at (0 if never).
    int projectionWidth() const { return m_projectionWidth; }

    /**
     * @brief DPI that renders a page of @p pageSizePt at @p targetWidth pixels.
     */
    static qreal dpiForWidth(const QSizeF& pageSizePt, int targetWidth);

private:
    QHash<int, QImage>& images(Kind kind) {
        return kind == Kind::Thumbnail ? m_thumbnails : m_projection;
    }
    const QHash<int, QImage>& images(Kind kind) const {
        return kind == Kind::Thumbnail ? m_thumbnails : m_projection;
    }

    const PageRegistry* m_registry;
    QHash<int, QImage> m_thumbnails;
    QHash<int, QImage> m_projection;
    int m_projectionWidth = 0;
};
