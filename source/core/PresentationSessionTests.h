#ifndef PRESENTATIONSESSIONTESTS_H
#define PRESENTATIONSESSIONTESTS_H

#include <QFile>
#include <QObject>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>
#include <QUrl>

#include "PauseableTimer.h"
#include "PresentationSession.h"
#include "PresentationSync.h"
#include "../pdf/MockPdfProvider.h"
#include "../pdf/SamplePdf.h"

/**
 * Unit tests for PresentationSession, the object behind all windows.
 * Run with: pdfpresenter --test-session
 */
class PresentationSessionTests : public QObject {
    Q_OBJECT

private:
    static PageRegistry::ProviderFactory mockFactory() {
        return MockPdfProvider::factory({{"/talks/intro.pdf", 3}, {"/talks/demo.pdf", 2}});
    }

private slots:
    void testImportAppendsInOrder() {
        PresentationSession session(mockFactory());
        QSignalSpy changed(&session, &PresentationSession::slidesChanged);

        ImportReport report = session.importFiles({"/talks/intro.pdf", "/talks/demo.pdf"});

        QVERIFY(!report.hasFailures());
        QCOMPARE(report.addedSlideIds, QVector<int>({0, 1, 2, 3, 4}));
        QCOMPARE(session.slideOrder().slideIds(), QVector<int>({0, 1, 2, 3, 4}));
        QCOMPARE(session.primaryDocumentPath(), QString("/talks/intro.pdf"));
        QCOMPARE(session.currentPosition(), 0);
        QCOMPARE(changed.count(), 1);

        // Thumbnails are rendered at the configured width
        QCOMPARE(session.thumbnail(4).width(), PresenterSettings::DEFAULT_THUMBNAIL_WIDTH);
        QCOMPARE(session.slideLabel(3), QString("#4 (Page 1)"));
    }

    // One bad file does not abort the batch
    void testPartialImportFailure() {
        PresentationSession session(mockFactory());
        QSignalSpy failed(&session, &PresentationSession::importFailed);

        ImportReport report = session.importFiles({"/talks/intro.pdf", "/talks/broken.pdf",
                                                   "/talks/demo.pdf"});

        QCOMPARE(report.failedFiles, QStringList({"/talks/broken.pdf"}));
        QCOMPARE(report.errorMessages.size(), 1);
        QCOMPARE(report.addedSlideIds.size(), 5);
        QCOMPARE(session.slideCount(), 5);
        QCOMPARE(failed.count(), 1);
        QCOMPARE(failed.last().at(0).toStringList(), QStringList({"/talks/broken.pdf"}));
    }

    void testFileUrlsAreAccepted() {
        PresentationSession session(mockFactory());
        ImportReport report = session.importFiles({"file:///talks/demo.pdf"});
        QVERIFY(!report.hasFailures());
        QCOMPARE(session.slideCount(), 2);
        QCOMPARE(PresentationSession::localPathFromInput(" /a b.pdf "), QString("/a b.pdf"));
    }

    void testRemoveAndMoveKeepCurrentValid() {
        PresentationSession session(mockFactory());
        session.importFiles({"/talks/intro.pdf", "/talks/demo.pdf"});
        QSignalSpy slideSpy(&session, &PresentationSession::currentSlideChanged);

        QVERIFY(session.jumpTo(4));
        QVERIFY(session.removeSlide(4));
        QCOMPARE(session.currentPosition(), 3);
        QCOMPARE(session.currentSlideId(), 3);

        QVERIFY(session.moveSlide(3, 0));
        QCOMPARE(session.currentPosition(), 0);
        QCOMPARE(session.currentSlideId(), 3);

        // Stale UI indices are ignored
        QVERIFY(!session.removeSlide(10));
        QVERIFY(!session.moveSlide(0, 10));
        QVERIFY(slideSpy.count() >= 3);
    }

    void testLastSlideCannotBeRemoved() {
        PresentationSession session(MockPdfProvider::factory({{"/one.pdf", 1}}));
        session.importFiles({"/one.pdf"});
        QVERIFY(!session.removeSlide(0));
        QCOMPARE(session.slideCount(), 1);
    }

    // Notes are keyed by slide id and follow their slide when it moves
    void testNotesFollowSlides() {
        PresentationSession session(mockFactory());
        session.importFiles({"/talks/intro.pdf"});
        QSignalSpy notesSpy(&session, &PresentationSession::currentNotesChanged);

        session.jumpTo(1);
        session.setCurrentNotes("about slide one");
        QVERIFY(session.hasUnsavedNotes());

        QVERIFY(session.moveSlide(1, 2));
        session.jumpTo(1);
        QCOMPARE(session.currentNotes(), QString());
        session.jumpTo(2);
        QCOMPARE(session.currentSlideId(), 1);
        QCOMPARE(session.currentNotes(), QString("about slide one"));
        QCOMPARE(notesSpy.last().at(0).toString(), QString("about slide one"));

        // Deleted slides keep their notes
        QVERIFY(session.removeSlide(2));
        QCOMPARE(session.notes().note(1), QString("about slide one"));
    }

    void testSaveNotesWithoutDocumentFails() {
        PresentationSession session(mockFactory());
        QString error;
        QVERIFY(!session.saveNotes(&error));
        QVERIFY(!error.isEmpty());
    }

    // Real PDFs: notes sidecar is loaded on import and saved next to the PDF
    void testNotesPersistNextToPrimaryDocument() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString pdf = dir.filePath("talk.pdf");
        QVERIFY(SamplePdf::write(pdf, SamplePdf::steppedSizes(3, 720, 540, 0)));

        {
            PresentationSession session;
            ImportReport report = session.importFiles({pdf});
            QVERIFY2(!report.hasFailures(), qPrintable(report.errorMessages.join("; ")));
            session.jumpTo(2);
            session.setCurrentNotes("closing\nremarks");
            QString error;
            QVERIFY2(session.saveNotes(&error), qPrintable(error));
            QVERIFY(!session.hasUnsavedNotes());
        }

        QVERIFY(QFile::exists(pdf + ".notes"));

        PresentationSession reopened;
        reopened.importFiles({pdf});
        QCOMPARE(reopened.notes().note(2), QString("closing\nremarks"));
    }

    void testClearedNoteStaysCleared() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString pdf = dir.filePath("talk.pdf");
        QVERIFY(SamplePdf::write(pdf, SamplePdf::steppedSizes(2, 720, 540, 0)));

        QFile sidecar(pdf + ".notes");
        QVERIFY(sidecar.open(QIODevice::WriteOnly | QIODevice::Text));
        sidecar.write("==XXslide0\nhello\n");
        sidecar.close();

        {
            PresentationSession session;
            session.importFiles({pdf});
            QCOMPARE(session.currentNotes(), QString("hello"));
            session.setCurrentNotes(QString());
            QString error;
            QVERIFY2(session.saveNotes(&error), qPrintable(error));
        }

        PresentationSession reopened;
        reopened.importFiles({pdf});
        QCOMPARE(reopened.notes().note(0), QString());
    }

    void testPresentationMode() {
        PresentationSession session(mockFactory());
        session.importFiles({"/talks/intro.pdf"});
        QSignalSpy modeSpy(&session, &PresentationSession::presentationModeChanged);

        session.enterPresentationMode(1024);
        QVERIFY(session.isPresenting());
        QCOMPARE(session.images().count(SlideImageCache::Kind::Projection), 3);
        QCOMPARE(session.images().image(0, SlideImageCache::Kind::Projection).width(), 1024);

        // Thumbnails are independent of the projection set
        QCOMPARE(session.thumbnail(0).width(), PresenterSettings::DEFAULT_THUMBNAIL_WIDTH);

        session.timer()->start();
        session.leavePresentationMode();
        QVERIFY(!session.isPresenting());
        QVERIFY(!session.timer()->isRunning());
        QCOMPARE(session.images().count(SlideImageCache::Kind::Projection), 0);
        QCOMPARE(modeSpy.count(), 2);
    }

    void testPresentationFallbackWidth() {
        PresenterSettings settings;
        settings.fallbackProjectionWidth = 640;
        PresentationSession session(mockFactory(), settings);
        session.importFiles({"/talks/demo.pdf"});

        session.enterPresentationMode(0);
        QCOMPARE(session.images().projectionWidth(), 640);
    }

    void testEmptyDeckDoesNotPresent() {
        PresentationSession session(mockFactory());
        session.enterPresentationMode(800);
        QVERIFY(!session.isPresenting());
    }

    void testExportWithoutSlidesFails() {
        PresentationSession session(mockFactory());
        PdfExportOptions options;
        options.outputPath = "/tmp/never-written.pdf";
        PdfExportResult result = session.exportPdf(options);
        QVERIFY(!result.success);
        QVERIFY(!result.errorMessage.isEmpty());
    }
};

#endif // PRESENTATIONSESSIONTESTS_H
