// ============================================================================
// PdfProviderFactory - Platform-specific PDF provider creation
// ============================================================================
// This file contains the factory methods for PdfProvider.
// Both backends are always built; Auto selects based on the target platform:
//   - Alpine Linux (musl): MuPDF (avoids symbol collision with Poppler/OpenJPEG)
//   - Desktop (glibc, Windows, macOS): Poppler (feature-rich, system library)
// The "pdf/backend" setting can force either one.
// ============================================================================

#include "PdfProvider.h"
#include "MuPdfProvider.h"
#include "PopplerPdfProvider.h"

#include <QDebug>
#include <memory>

// ============================================================================
// Platform Detection
// ============================================================================
// On Alpine Linux (musl libc), both MuPDF and Poppler use OpenJPEG for JPEG2000.
// When both are loaded as shared libraries, MuPDF's custom allocators get called
// by Poppler's OpenJPEG, causing crashes. Solution: Use MuPDF by default on musl.
//
// Detection: musl libc doesn't define __GLIBC__, while glibc does.
// ============================================================================

#if defined(__linux__) && !defined(__GLIBC__)
    #define PDFPRESENTER_DEFAULT_MUPDF 1
#endif

// ============================================================================
// Factory Methods
// ============================================================================

PdfBackend PdfProvider::defaultBackend()
{
#ifdef PDFPRESENTER_DEFAULT_MUPDF
    return PdfBackend::MuPdf;
#else
    return PdfBackend::Poppler;
#endif
}

std::unique_ptr<PdfProvider> PdfProvider::open(const QString& pdfPath, PdfBackend backend)
{
    if (backend == PdfBackend::Auto) {
        backend = defaultBackend();
    }

    if (backend == PdfBackend::MuPdf) {
        return std::make_unique<MuPdfProvider>(pdfPath);
    }
    return std::make_unique<PopplerPdfProvider>(pdfPath);
}

PdfBackend PdfProvider::backendFromString(const QString& name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("mupdf")) {
        return PdfBackend::MuPdf;
    }
    if (key == QLatin1String("poppler")) {
        return PdfBackend::Poppler;
    }
    if (!key.isEmpty() && key != QLatin1String("auto")) {
        qWarning() << "PdfProvider: Unknown backend" << name << "- using auto";
    }
    return PdfBackend::Auto;
}

QString PdfProvider::backendToString(PdfBackend backend)
{
    switch (backend) {
        case PdfBackend::MuPdf:   return QStringLiteral("mupdf");
        case PdfBackend::Poppler: return QStringLiteral("poppler");
        case PdfBackend::Auto:    break;
    }
    return QStringLiteral("auto");
}
