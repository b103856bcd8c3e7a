// ============================================================================
// MuPdfExporter - Slide deck export using MuPDF
// ============================================================================

#include "MuPdfExporter.h"

#include "../core/PageRegistry.h"
#include "../core/SlideOrder.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSet>

#include <algorithm> // for std::sort

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfExporter::MuPdfExporter(QObject* parent)
    : QObject(parent)
{
}

MuPdfExporter::~MuPdfExporter()
{
    cleanup();
}

// ============================================================================
// Public API
// ============================================================================

void MuPdfExporter::setSlides(const SlideOrder* order, const PageRegistry* registry)
{
    m_order = order;
    m_registry = registry;
}

PdfExportResult MuPdfExporter::fail(PdfExportResult result, const QString& message)
{
    result.success = false;
    result.errorMessage = message;
    qWarning() << "[MuPdfExporter] Export failed:" << message;
    cleanup();
    m_isExporting = false;
    emit exportFailed(message);
    return result;
}

PdfExportResult MuPdfExporter::exportPdf(const PdfExportOptions& options)
{
    PdfExportResult result;

    // Validate inputs
    if (!m_order || !m_registry || m_order->isEmpty()) {
        return fail(result, tr("No slides to export."));
    }

    if (options.outputPath.isEmpty()) {
        return fail(result, tr("No output path specified"));
    }

    if (isSourceDocument(options.outputPath)) {
        return fail(result, tr("Cannot export over a presented PDF: %1").arg(options.outputPath));
    }

    const QVector<int> positions = parsePageRange(options.slideRange, m_order->count());
    if (positions.isEmpty()) {
        return fail(result, tr("Invalid slide range: %1").arg(options.slideRange));
    }

    m_isExporting = true;
    m_cancelled.store(false);

    qDebug() << "[MuPdfExporter] Starting export:" << positions.size()
             << "slides to" << options.outputPath;

    if (!initContext()) {
        return fail(result, tr("Failed to initialize PDF engine"));
    }

    const int total = positions.size();
    for (int i = 0; i < total; ++i) {
        if (m_cancelled.load()) {
            result.cancelled = true;
            result.errorMessage = tr("Export cancelled");
            cleanup();
            m_isExporting = false;
            emit exportCancelled();
            return result;
        }

        emit progressUpdated(i + 1, total);

        const int position = positions.at(i);
        QString reason;
        if (!graftSlide(m_order->slideIdAt(position), &reason)) {
            return fail(result, tr("Failed to export slide %1: %2").arg(position + 1).arg(reason));
        }
        result.pagesExported++;
    }

    if (options.writeMetadata && !writeMetadata(options.title)) {
        qWarning() << "[MuPdfExporter] Failed to write metadata (non-fatal)";
    }

    const bool outputExisted = QFileInfo::exists(options.outputPath);
    if (!saveDocument(options.outputPath)) {
        // Don't leave a truncated file behind, but never delete one we didn't create
        if (!outputExisted) {
            QFile::remove(options.outputPath);
        }
        result.pagesExported = 0;
        return fail(result, tr("Failed to save PDF file %1").arg(options.outputPath));
    }

    result.fileSizeBytes = QFileInfo(options.outputPath).size();

    cleanup();
    result.success = true;
    m_isExporting = false;

    qDebug() << "[MuPdfExporter] Export complete:"
             << result.pagesExported << "slides,"
             << (result.fileSizeBytes / 1024) << "KB";

    emit exportComplete();
    return result;
}

bool MuPdfExporter::isSourceDocument(const QString& outputPath) const
{
    const QString output = PageRegistry::normalizedPath(outputPath);
    const QString canonicalOutput = QFileInfo(outputPath).canonicalFilePath();

    for (const QString& source : m_registry->documentPaths()) {
        if (source == output) {
            return true;
        }
        // Same file through a symlink
        if (!canonicalOutput.isEmpty() && QFileInfo(source).canonicalFilePath() == canonicalOutput) {
            return true;
        }
    }
    return false;
}

void MuPdfExporter::cancel()
{
    m_cancelled.store(true);
}

QVector<int> MuPdfExporter::parsePageRange(const QString& rangeString, int total)
{
    QVector<int> result;

    if (total <= 0) {
        return result;
    }

    QString range = rangeString.trimmed().toLower();

    // Empty or "all" means every slide
    if (range.isEmpty() || range == "all") {
        result.reserve(total);
        for (int i = 0; i < total; ++i) {
            result.append(i);
        }
        return result;
    }

    QStringList parts = range.split(',', Qt::SkipEmptyParts);
    QSet<int> seen;

    static const QRegularExpression rangePattern("^\\s*(\\d+)\\s*-\\s*(\\d+)\\s*$");
    static const QRegularExpression singlePattern("^\\s*(\\d+)\\s*$");

    for (const QString& part : parts) {
        QRegularExpressionMatch rangeMatch = rangePattern.match(part);
        if (rangeMatch.hasMatch()) {
            int start = rangeMatch.captured(1).toInt();
            int end = rangeMatch.captured(2).toInt();

            // Convert to 0-based and clamp
            start = qMax(1, qMin(start, total)) - 1;
            end = qMax(1, qMin(end, total)) - 1;

            if (start > end) {
                qSwap(start, end);
            }

            for (int i = start; i <= end; ++i) {
                if (!seen.contains(i)) {
                    result.append(i);
                    seen.insert(i);
                }
            }
            continue;
        }

        QRegularExpressionMatch singleMatch = singlePattern.match(part);
        if (singleMatch.hasMatch()) {
            int position = qMax(1, qMin(singleMatch.captured(1).toInt(), total)) - 1;
            if (!seen.contains(position)) {
                result.append(position);
                seen.insert(position);
            }
            continue;
        }

        qWarning() << "[MuPdfExporter] Invalid range part:" << part;
    }

    std::sort(result.begin(), result.end());
    return result;
}

// ============================================================================
// Initialization
// ============================================================================

bool MuPdfExporter::initContext()
{
    cleanup();

    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to create MuPDF context";
        return false;
    }

    bool ok = true;
    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
        m_outputDoc = pdf_create_document(m_ctx);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to create output PDF:" << fz_caught_message(m_ctx);
        ok = false;
    }

    if (!ok) {
        cleanup();
        return false;
    }
    return true;
}

void MuPdfExporter::cleanup()
{
    if (!m_ctx) {
        m_sources.clear();
        m_outputDoc = nullptr;
        return;
    }

    // Graft maps reference both documents, drop them first
    for (auto& entry : m_sources) {
        if (entry.second.graftMap) {
            pdf_drop_graft_map(m_ctx, entry.second.graftMap);
        }
    }
    // pdf and doc are the same object; drop once via the fz_document handle
    for (auto& entry : m_sources) {
        if (entry.second.doc) {
            fz_drop_document(m_ctx, entry.second.doc);
        }
    }
    m_sources.clear();

    if (m_outputDoc) {
        pdf_drop_document(m_ctx, m_outputDoc);
        m_outputDoc = nullptr;
    }

    fz_drop_context(m_ctx);
    m_ctx = nullptr;
}

MuPdfExporter::SourcePdf* MuPdfExporter::openSource(const QString& path)
{
    auto it = m_sources.find(path);
    if (it != m_sources.end()) {
        return &it->second;
    }

    if (!QFile::exists(path)) {
        qWarning() << "[MuPdfExporter] Source PDF not found:" << path;
        return nullptr;
    }

    QByteArray pathUtf8 = path.toUtf8();
    SourcePdf source;
    bool ok = true;

    fz_try(m_ctx) {
        source.doc = fz_open_document(m_ctx, pathUtf8.constData());
        source.pdf = pdf_document_from_fz_document(m_ctx, source.doc);
        if (source.pdf) {
            source.pageCount = pdf_count_pages(m_ctx, source.pdf);
            source.graftMap = pdf_new_graft_map(m_ctx, m_outputDoc);
        }
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to open source PDF:" << path
                   << "-" << fz_caught_message(m_ctx);
        ok = false;
    }

    if (ok && !source.pdf) {
        qWarning() << "[MuPdfExporter] Source is not a PDF document:" << path;
        ok = false;
    }

    if (!ok) {
        if (source.graftMap) pdf_drop_graft_map(m_ctx, source.graftMap);
        if (source.doc) fz_drop_document(m_ctx, source.doc);
        return nullptr;
    }

    qDebug() << "[MuPdfExporter] Opened source PDF:" << path
             << "with" << source.pageCount << "pages";

    auto inserted = m_sources.emplace(path, source);
    return &inserted.first->second;
}

// ============================================================================
// Page Processing
// ============================================================================

bool MuPdfExporter::graftSlide(int slideId, QString* errorMsg)
{
    const SlideSource slide = m_registry->resolve(slideId);
    if (!slide.isValid()) {
        *errorMsg = tr("unknown slide id %1").arg(slideId);
        return false;
    }

    SourcePdf* source = openSource(slide.documentPath);
    if (!source) {
        *errorMsg = tr("cannot open %1").arg(slide.documentPath);
        return false;
    }

    if (slide.pageIndex >= source->pageCount) {
        qWarning() << "[MuPdfExporter] PDF page" << slide.pageIndex
                   << "out of range (source has" << source->pageCount << "pages)";
        *errorMsg = tr("page %1 is missing from %2").arg(slide.pageIndex + 1).arg(slide.documentPath);
        return false;
    }

    bool ok = true;
    fz_try(m_ctx) {
        // -1 appends to the end of the output document
        pdf_graft_mapped_page(m_ctx, source->graftMap, -1, source->pdf, slide.pageIndex);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to graft slide" << slideId
                   << "(PDF page" << slide.pageIndex << "):" << fz_caught_message(m_ctx);
        ok = false;
    }

    if (!ok) {
        *errorMsg = tr("copying page %1 of %2 failed").arg(slide.pageIndex + 1).arg(slide.documentPath);
    }
    return ok;
}

// ============================================================================
// Metadata
// ============================================================================

bool MuPdfExporter::writeMetadata(const QString& title)
{
    if (!m_outputDoc || !m_ctx) {
        return false;
    }

    QByteArray titleUtf8 = title.toUtf8();
    bool ok = true;

    fz_try(m_ctx) {
        pdf_obj* trailer = pdf_trailer(m_ctx, m_outputDoc);
        pdf_obj* info = pdf_dict_get(m_ctx, trailer, PDF_NAME(Info));
        if (!info) {
            info = pdf_add_new_dict(m_ctx, m_outputDoc, 4);
            pdf_dict_put_drop(m_ctx, trailer, PDF_NAME(Info), info);
        }

        pdf_dict_put_text_string(m_ctx, info, PDF_NAME(Producer), "PdfPresenter");
        if (!titleUtf8.isEmpty()) {
            pdf_dict_put_text_string(m_ctx, info, PDF_NAME(Title), titleUtf8.constData());
        }
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to write metadata:" << fz_caught_message(m_ctx);
        ok = false;
    }

    return ok;
}

// ============================================================================
// Finalization
// ============================================================================

bool MuPdfExporter::saveDocument(const QString& outputPath)
{
    if (!m_outputDoc || !m_ctx) {
        return false;
    }

    QByteArray pathUtf8 = outputPath.toUtf8();
    bool ok = true;

    fz_try(m_ctx) {
        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = 1;
        opts.do_compress_images = 1;
        opts.do_compress_fonts = 1;
        opts.do_garbage = 1;        // Drop objects left over from partial grafts

        pdf_save_document(m_ctx, m_outputDoc, pathUtf8.constData(), &opts);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to save document:" << fz_caught_message(m_ctx);
        ok = false;
    }

    if (ok) {
        qDebug() << "[MuPdfExporter] Saved to" << outputPath;
    }
    return ok;
}
