#pragma once

// ============================================================================
// PdfProvider - Abstract interface for PDF operations
// ============================================================================
// Part of the PdfPresenter rendering layer
//
// This abstraction layer enables:
// - Swapping PDF backends (Poppler on glibc desktops, MuPDF elsewhere)
// - Easier testing with mock providers (see MockPdfProvider.h)
//
// Design: Uses simple data types instead of passing backend-specific types.
// This ensures any implementation can provide the same interface. The slide
// model only ever sees this interface; a provider is immutable once opened.
// ============================================================================

#include <QString>
#include <QSizeF>
#include <QImage>
#include <QPixmap>
#include <memory>

/**
 * @brief Rendering backends that can be selected at runtime.
 */
enum class PdfBackend {
    Auto,       ///< Platform default (Poppler on glibc desktops, MuPDF otherwise)
    MuPdf,      ///< Force MuPDF
    Poppler     ///< Force Poppler-Qt6
};

/**
 * @brief Abstract interface for PDF document operations.
 *
 * Implemented by MuPdfProvider and PopplerPdfProvider.
 */
class PdfProvider {
public:
    virtual ~PdfProvider() = default;

    // ===== Document Info =====

    /**
     * @brief Check if the PDF was loaded successfully.
     * @return True if a valid, unlocked PDF with at least one page is loaded.
     */
    virtual bool isValid() const = 0;

    /**
     * @brief Check if the PDF is password-protected and locked.
     * @return True if the PDF requires a password.
     */
    virtual bool isLocked() const = 0;

    /**
     * @brief Get the total number of pages.
     * @return Page count, or 0 if invalid.
     */
    virtual int pageCount() const = 0;

    /**
     * @brief Get the PDF title from metadata.
     * @return Title string, or empty if not available.
     */
    virtual QString title() const = 0;

    /**
     * @brief Get the file path this provider was loaded from.
     * @return The PDF file path.
     */
    virtual QString filePath() const = 0;

    // ===== Page Info =====

    /**
     * @brief Get the size of a page in points (1/72 inch).
     * @param pageIndex 0-based page index.
     * @return Page size in points, or empty QSizeF if invalid.
     */
    virtual QSizeF pageSize(int pageIndex) const = 0;

    // ===== Rendering =====

    /**
     * @brief Render a page to a QImage.
     * @param pageIndex 0-based page index.
     * @param dpi Resolution in dots per inch.
     * @return Rendered image, or null QImage on error.
     */
    virtual QImage renderPageToImage(int pageIndex, qreal dpi) const = 0;

    /**
     * @brief Render a page to a QPixmap.
     *
     * Default implementation converts from renderPageToImage().
     */
    virtual QPixmap renderPageToPixmap(int pageIndex, qreal dpi) const {
        QImage img = renderPageToImage(pageIndex, dpi);
        return img.isNull() ? QPixmap() : QPixmap::fromImage(img);
    }

    // ===== Factory =====

    /**
     * @brief Create a PdfProvider for the given file.
     * @param pdfPath Path to the PDF file.
     * @param backend Backend to use; Auto picks the platform default.
     *
     * The returned provider may be invalid, so callers can tell a locked
     * file apart from a broken one.
     */
    static std::unique_ptr<PdfProvider> open(const QString& pdfPath,
                                             PdfBackend backend = PdfBackend::Auto);

    /**
     * @brief The backend Auto resolves to on this platform.
     */
    static PdfBackend defaultBackend();

    /**
     * @brief Parse a backend name ("auto", "mupdf", "poppler").
     * @return Auto for unknown names.
     */
    static PdfBackend backendFromString(const QString& name);
    static QString backendToString(PdfBackend backend);
};
