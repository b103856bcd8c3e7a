#pragma once

// ============================================================================
// PageRegistryTests - Unit tests for the PageRegistry class
// ============================================================================
// Uses MockPdfProvider so no PDF files are needed, except for the backend
// test at the end which checks LoadError with the real providers.
// ============================================================================

#include "PageRegistry.h"
#include "../pdf/MockPdfProvider.h"
#include "../pdf/SamplePdf.h"

#include <QDebug>
#include <QFile>
#include <QTemporaryDir>

namespace PageRegistryTests {

/**
 * @brief Ids are allocated monotonically across documents.
 */
inline bool testIdAllocation()
{
    qDebug() << "=== Test: slide id allocation ===";
    bool success = true;

    PageRegistry registry(MockPdfProvider::factory({{"/talks/a.pdf", 3}, {"/talks/b.pdf", 2}}));

    const PdfProvider* a = registry.registerDocument("/talks/a.pdf");
    const PdfProvider* b = registry.registerDocument("/talks/b.pdf");
    if (!a || !b) {
        qDebug() << "FAIL: Mock documents should open";
        return false;
    }

    const QVector<int> idsA = registry.addAllPages(a);
    const QVector<int> idsB = registry.addAllPages(b);
    if (idsA != QVector<int>({0, 1, 2}) || idsB != QVector<int>({3, 4})) {
        qDebug() << "FAIL: Expected ids 0-2 and 3-4, got" << idsA << idsB;
        success = false;
    }

    const SlideSource src = registry.resolve(4);
    if (!src.isValid() || src.document != b || src.pageIndex != 1 ||
        src.documentPath != QStringLiteral("/talks/b.pdf")) {
        qDebug() << "FAIL: Slide 4 should resolve to b.pdf page 1, got"
                 << src.documentPath << src.pageIndex;
        success = false;
    }

    // Count is clamped to the page count
    const QVector<int> more = registry.addPages(b, 10);
    if (more != QVector<int>({5, 6}) || registry.slideCount() != 7 || registry.nextSlideId() != 7) {
        qDebug() << "FAIL: addPages should clamp to the page count, got" << more;
        success = false;
    }

    if (!registry.addPages(nullptr, 2).isEmpty() || !registry.addPages(a, 0).isEmpty()) {
        qDebug() << "FAIL: Unknown handle or zero count should allocate nothing";
        success = false;
    }

    if (success) {
        qDebug() << "  - Monotonic ids across documents: OK";
    }
    return success;
}

/**
 * @brief The same path is opened once, but each import gets fresh ids.
 */
inline bool testDocumentCache()
{
    qDebug() << "=== Test: document cache ===";
    bool success = true;

    int opened = 0;
    auto mock = MockPdfProvider::factory({{"/deck.pdf", 2}});
    PageRegistry registry([&opened, mock](const QString& path) {
        ++opened;
        return mock(path);
    });

    const PdfProvider* first = registry.registerDocument("/deck.pdf");
    const PdfProvider* second = registry.registerDocument("/tmp/../deck.pdf");

    if (!first || first != second || opened != 1 || registry.documentCount() != 1) {
        qDebug() << "FAIL: Re-registering a path should reuse the document, opened" << opened;
        success = false;
    }

    const QVector<int> idsFirst = registry.addAllPages(first);
    const QVector<int> idsSecond = registry.addAllPages(second);
    if (idsFirst == idsSecond || idsSecond != QVector<int>({2, 3})) {
        qDebug() << "FAIL: Each import should allocate new ids, got" << idsSecond;
        success = false;
    }

    // Id mapping never changes
    if (registry.resolve(0).pageIndex != 0 || registry.resolve(3).pageIndex != 1) {
        qDebug() << "FAIL: Ids should keep their page mapping";
        success = false;
    }

    if (success) {
        qDebug() << "  - Path-based caching: OK";
    }
    return success;
}

/**
 * @brief Load errors and unknown ids.
 */
inline bool testErrors()
{
    qDebug() << "=== Test: load errors and unknown ids ===";
    bool success = true;

    PageRegistry registry(MockPdfProvider::factory({{"/good.pdf", 1}}));

    QString error;
    if (registry.registerDocument("/missing.pdf", &error) || error.isEmpty()) {
        qDebug() << "FAIL: Missing file should fail with a message";
        success = false;
    }

    error.clear();
    if (registry.registerDocument(QString(), &error) || error.isEmpty()) {
        qDebug() << "FAIL: Empty path should fail with a message";
        success = false;
    }

    if (registry.documentCount() != 0) {
        qDebug() << "FAIL: Failed loads must not be cached";
        success = false;
    }

    if (registry.resolve(0).isValid() || registry.resolve(-3).isValid()) {
        qDebug() << "FAIL: Unknown ids should resolve to an invalid source";
        success = false;
    }

    if (success) {
        qDebug() << "  - LoadError / unknown id: OK";
    }
    return success;
}

/**
 * @brief Real backends reject broken files and accept a generated PDF.
 */
inline bool testRealBackends()
{
    qDebug() << "=== Test: real backends ===";
    bool success = true;

    QTemporaryDir tempDir;
    if (!tempDir.isValid()) {
        qDebug() << "FAIL: Could not create temp dir";
        return false;
    }

    const QString junkPath = tempDir.filePath("junk.pdf");
    {
        QFile junk(junkPath);
        if (!junk.open(QIODevice::WriteOnly) || junk.write("this is not a pdf") < 0) {
            qDebug() << "FAIL: Could not write junk file";
            return false;
        }
    }

    const QString goodPath = tempDir.filePath("good.pdf");
    if (!SamplePdf::write(goodPath, SamplePdf::steppedSizes(2, 720, 540, 0))) {
        qDebug() << "FAIL: Could not write sample PDF";
        return false;
    }

    for (PdfBackend backend : {PdfBackend::MuPdf, PdfBackend::Poppler}) {
        const QString name = PdfProvider::backendToString(backend);
        PageRegistry registry(backend);

        QString error;
        if (registry.registerDocument(junkPath, &error)) {
            qDebug() << "FAIL:" << name << "accepted a non-PDF file";
            success = false;
        }

        const PdfProvider* doc = registry.registerDocument(goodPath, &error);
        if (!doc || doc->pageCount() != 2) {
            qDebug() << "FAIL:" << name << "could not open the sample PDF:" << error;
            success = false;
            continue;
        }

        const QImage image = doc->renderPageToImage(0, 72);
        if (image.isNull() || qAbs(image.width() - 720) > 1) {
            qDebug() << "FAIL:" << name << "render at 72 dpi should be ~720px wide, got" << image.width();
            success = false;
        } else {
            qDebug() << "  -" << name << ": OK";
        }
    }

    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running PageRegistry Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testIdAllocation();
    qDebug() << "";

    allPass &= testDocumentCache();
    qDebug() << "";

    allPass &= testErrors();
    qDebug() << "";

    allPass &= testRealBackends();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL PAGEREGISTRY TESTS PASSED!";
    } else {
        qDebug() << "SOME PAGEREGISTRY TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace PageRegistryTests
