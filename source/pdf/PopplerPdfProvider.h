#pragma once

// ============================================================================
// PopplerPdfProvider - Poppler-Qt6 implementation of PdfProvider
// ============================================================================
// Wraps Poppler-Qt6 to render slide pages. Default backend on desktop
// platforms (Windows, Linux with glibc, macOS).
// ============================================================================

#include "PdfProvider.h"
#include <poppler/qt6/poppler-qt6.h>
#include <memory>

/**
 * @brief PdfProvider implementation using Poppler-Qt6.
 *
 * Applies antialiasing and text hinting for high-quality rendering.
 */
class PopplerPdfProvider : public PdfProvider {
public:
    /**
     * @brief Construct a provider for the given PDF file.
     * @param pdfPath Path to the PDF file.
     *
     * Check isValid() after construction to verify the PDF loaded successfully.
     */
    explicit PopplerPdfProvider(const QString& pdfPath);

    ~PopplerPdfProvider() override = default;

    // ===== Document Info =====
    bool isValid() const override;
    bool isLocked() const override;
    int pageCount() const override;
    QString title() const override;
    QString filePath() const override;

    // ===== Page Info =====
    QSizeF pageSize(int pageIndex) const override;

    // ===== Rendering =====
    QImage renderPageToImage(int pageIndex, qreal dpi) const override;

private:
    /**
     * @brief Get a Poppler page object.
     * @param pageIndex 0-based page index.
     * @return Unique pointer to page, or nullptr if invalid.
     */
    std::unique_ptr<Poppler::Page> getPage(int pageIndex) const;

    std::unique_ptr<Poppler::Document> m_document;  ///< The loaded PDF document
    QString m_path;                                   ///< Path to the PDF file
};
