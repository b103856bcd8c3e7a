#pragma once

// ============================================================================
// PageRegistry - Document cache and slide id allocation
// ============================================================================
// Every imported page gets a global slide id. Ids are handed out in import
// order starting at 0, are never reused, and always resolve to the same
// (document, page) pair for the lifetime of the registry.
//
// Documents are cached by absolute path: importing the same path twice reuses
// the open document (but allocates new ids for its pages).
// ============================================================================

#include "../pdf/PdfProvider.h"

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>
#include <memory>
#include <vector>

/**
 * @brief Where a slide comes from.
 */
struct SlideSource {
    const PdfProvider* document = nullptr;  ///< Owning registry keeps it alive
    QString documentPath;                   ///< Absolute path of the source PDF
    int pageIndex = -1;                     ///< 0-based page in the source PDF

    bool isValid() const { return document != nullptr && pageIndex >= 0; }
};

/**
 * @brief Owns open PDF documents and maps global slide ids to their pages.
 */
class PageRegistry {
public:
    /// Opens a document; returns nullptr if it can't be opened.
    using ProviderFactory = std::function<std::unique_ptr<PdfProvider>(const QString&)>;

    /**
     * @brief Registry using PdfProvider::open() with the given backend.
     */
    explicit PageRegistry(PdfBackend backend = PdfBackend::Auto);

    /**
     * @brief Registry using a custom provider factory (mock providers in tests).
     */
    explicit PageRegistry(ProviderFactory factory);

    // Non-copyable (owns providers)
    PageRegistry(const PageRegistry&) = delete;
    PageRegistry& operator=(const PageRegistry&) = delete;

    // ===== Documents =====

    /**
     * @brief Open a document, or return the cached one for this path.
     * @param path File path (relative paths are made absolute).
     * @param errorMsg Optional output for a user-facing error.
     * @return Document handle, or nullptr if it could not be opened.
     */
    const PdfProvider* registerDocument(const QString& path, QString* errorMsg = nullptr);

    /**
     * @brief Cached document for a path, or nullptr if never registered.
     */
    const PdfProvider* document(const QString& path) const;

    /**
     * @brief Absolute paths of all open documents, in registration order.
     */
    QStringList documentPaths() const;

    int documentCount() const { return static_cast<int>(m_documents.size()); }

    // ===== Slides =====

    /**
     * @brief Allocate slide ids for the first @p count pages of a document.
     * @param document Handle returned by registerDocument().
     * @param count Number of pages; clamped to the document's page count.
     * @return New ids, in page order. Empty if the handle is unknown.
     */
    QVector<int> addPages(const PdfProvider* document, int count);

    /**
     * @brief Allocate slide ids for every page of a document.
     */
    QVector<int> addAllPages(const PdfProvider* document);

    /**
     * @brief Find the source of a slide.
     * @return Invalid SlideSource if the id was never allocated.
     */
    SlideSource resolve(int slideId) const;

    bool contains(int slideId) const { return m_slides.contains(slideId); }

    /// Number of ids ever allocated.
    int slideCount() const { return m_slides.size(); }

    /// The id the next allocated page will get.
    int nextSlideId() const { return m_nextId; }

    static QString normalizedPath(const QString& path);

private:
    struct SlideEntry {
        int documentIndex = -1;
        int pageIndex = -1;
    };

    int indexOfDocument(const PdfProvider* document) const;

    ProviderFactory m_factory;
    std::vector<std::unique_ptr<PdfProvider>> m_documents;  ///< Registration order
    QHash<QString, int> m_documentIndexByPath;              ///< Absolute path -> index
    QHash<int, SlideEntry> m_slides;                        ///< Slide id -> source
    int m_nextId = 0;
};
