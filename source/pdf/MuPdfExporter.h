#pragma once

// ============================================================================
// MuPdfExporter - Slide deck export using MuPDF
// ============================================================================
// Writes the current presentation sequence to a new PDF file.
// Key features:
// - Page grafting: slides are copied from their source PDFs without
//   re-rendering, so text and vector content stay intact
// - Multiple sources: each source PDF is opened once and gets its own graft
//   map, so shared resources (fonts, images) are copied once per source
// - Slide ranges: export a subset by presentation position ("1-3, 5")
// - Metadata: Producer and Title are written to the Info dictionary
//
// Export only reads SlideOrder and PageRegistry; a failed export never
// changes them.
// ============================================================================

#include <QObject>
#include <QString>
#include <QVector>

#include <atomic>
#include <map>

class SlideOrder;
class PageRegistry;

// Forward declarations for MuPDF types (avoid exposing mupdf headers in public API)
struct fz_context;
struct fz_document;
struct pdf_document;
struct pdf_graft_map;

/**
 * @brief Export options for PDF generation.
 */
struct PdfExportOptions {
    QString outputPath;             ///< Path to output PDF file
    QString slideRange;             ///< Positions (e.g., "1-10, 15") or empty for all
    bool writeMetadata = true;      ///< Write Producer/Title to the Info dictionary
    QString title;                  ///< Document title (only if writeMetadata)
};

/**
 * @brief Result of a PDF export operation.
 */
struct PdfExportResult {
    bool success = false;
    bool cancelled = false;         ///< Stopped by cancel(), not an error
    QString errorMessage;
    int pagesExported = 0;
    qint64 fileSizeBytes = 0;
};

/**
 * @brief PDF export engine for slide decks.
 *
 * Thread Safety: This class is NOT thread-safe. Export runs on the calling
 * thread; progress signals are emitted for UI updates.
 *
 * Usage:
 * @code
 * MuPdfExporter exporter;
 * exporter.setSlides(&slideOrder, &registry);
 *
 * PdfExportOptions options;
 * options.outputPath = "/path/to/talk.pdf";
 *
 * PdfExportResult result = exporter.exportPdf(options);
 * if (!result.success) {
 *     qWarning() << "Export failed:" << result.errorMessage;
 * }
 * @endcode
 */
class MuPdfExporter : public QObject {
    Q_OBJECT

public:
    explicit MuPdfExporter(QObject* parent = nullptr);
    ~MuPdfExporter() override;

    // Disable copy (MuPDF context is not copyable)
    MuPdfExporter(const MuPdfExporter&) = delete;
    MuPdfExporter& operator=(const MuPdfExporter&) = delete;

    /**
     * @brief Set the slides to export.
     * @param order Presentation sequence (must remain valid during export).
     * @param registry Resolves slide ids to source pages.
     */
    void setSlides(const SlideOrder* order, const PageRegistry* registry);

    /**
     * @brief Export the selected slides to PDF.
     * @return Result containing success status and any error message.
     *
     * This is a blocking operation. Connect to progressUpdated() for UI updates.
     */
    PdfExportResult exportPdf(const PdfExportOptions& options);

    /**
     * @brief Cancel an ongoing export at the next slide boundary.
     */
    void cancel();

    bool isExporting() const { return m_isExporting; }

    /**
     * @brief Parse a range string into a list of 0-based positions.
     * @param rangeString Range like "1-10, 15, 20-30" (1-based for user display)
     * @param total Number of slides
     * @return Sorted, de-duplicated positions, or empty if nothing valid
     *
     * Examples:
     * - "1-5" -> {0, 1, 2, 3, 4}
     * - "1-3, 7-9" -> {0, 1, 2, 6, 7, 8}
     * - "" or "all" -> all positions
     */
    static QVector<int> parsePageRange(const QString& rangeString, int total);

signals:
    /**
     * @brief Emitted before each slide is written.
     * @param current Slide being processed (1-based)
     * @param total Slides to export
     */
    void progressUpdated(int current, int total);

    void exportComplete();
    void exportCancelled();
    void exportFailed(const QString& errorMessage);

private:
    /// An open source PDF and its graft map into the output document.
    struct SourcePdf {
        fz_document* doc = nullptr;
        pdf_document* pdf = nullptr;    ///< Same object as doc, PDF view
        pdf_graft_map* graftMap = nullptr;
        int pageCount = 0;
    };

    // ===== Initialization =====

    bool initContext();
    void cleanup();

    /**
     * @brief Open (or reuse) a source PDF for grafting.
     * @return nullptr if the file can't be opened as a PDF.
     */
    SourcePdf* openSource(const QString& path);

    // ===== Page Processing =====

    /**
     * @brief Append one slide to the output document.
     * @param slideId Global slide id.
     * @param errorMsg Filled with a user-facing reason on failure.
     */
    bool graftSlide(int slideId, QString* errorMsg);

    bool writeMetadata(const QString& title);
    bool saveDocument(const QString& outputPath);

    /// True if outputPath is one of the registry's open PDFs.
    bool isSourceDocument(const QString& outputPath) const;

    PdfExportResult fail(PdfExportResult result, const QString& message);

private:
    const SlideOrder* m_order = nullptr;
    const PageRegistry* m_registry = nullptr;

    fz_context* m_ctx = nullptr;
    pdf_document* m_outputDoc = nullptr;
    std::map<QString, SourcePdf> m_sources;     ///< Keyed by absolute path

    bool m_isExporting = false;
    std::atomic<bool> m_cancelled{false};
};
