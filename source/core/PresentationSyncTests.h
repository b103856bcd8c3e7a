#ifndef PRESENTATIONSYNCTESTS_H
#define PRESENTATIONSYNCTESTS_H

#include <QObject>
#include <QSignalSpy>
#include <QTest>

#include "PageRegistry.h"
#include "PresentationSync.h"
#include "SlideImageCache.h"
#include "SlideOrder.h"
#include "../pdf/MockPdfProvider.h"

/**
 * Unit tests for PresentationSync navigation and projector layout.
 * Run with: pdfpresenter --test-sync
 *
 * Deck used by most tests (projection width 800, viewport 800x600):
 *   slide 0: 4:3 page   -> 800x600, fits
 *   slide 1: tall page  -> 800x1600, scrolls
 *   slide 2: 4:3 page   -> 800x600, fits
 *   slide 3: tall page  -> 800x1600, scrolls
 */
class PresentationSyncTests : public QObject {
    Q_OBJECT

private:
    static QVector<QSizeF> deckSizes() {
        return {QSizeF(720, 540), QSizeF(720, 1440), QSizeF(720, 540), QSizeF(720, 1440)};
    }

    struct Fixture {
        PageRegistry registry{MockPdfProvider::factoryWithSizes({{"/deck.pdf", deckSizes()}})};
        SlideOrder order;
        SlideImageCache images{&registry};
        PresentationSync sync{&order, &images};

        Fixture() {
            order.append(registry.addAllPages(registry.registerDocument("/deck.pdf")));
            images.renderProjectionImages(order.slideIds(), 800);
            sync.setViewportSize(QSize(800, 600));
        }
    };

private slots:
    void testProjectionImagesRenderedAtWidth() {
        Fixture f;
        QCOMPARE(f.images.count(SlideImageCache::Kind::Projection), 4);
        QCOMPARE(f.images.imageSize(0, SlideImageCache::Kind::Projection), QSize(800, 600));
        QCOMPARE(f.images.imageSize(1, SlideImageCache::Kind::Projection), QSize(800, 1600));
        QVERIFY(!f.sync.isSlideTall(0));
        QVERIFY(f.sync.isSlideTall(1));
    }

    void testNextScrollsTallSlideFirst() {
        Fixture f;
        QSignalSpy slideSpy(&f.sync, &PresentationSync::currentSlideChanged);

        QVERIFY(f.sync.next());                 // 0 -> 1
        QCOMPARE(f.sync.currentPosition(), 1);
        QCOMPARE(f.sync.verticalOffset(), 0.0);

        QVERIFY(f.sync.next());                 // scroll within slide 1
        QCOMPARE(f.sync.currentPosition(), 1);
        QCOMPARE(f.sync.verticalOffset(), 1.0);

        QVERIFY(f.sync.next());                 // 1 -> 2
        QCOMPARE(f.sync.currentPosition(), 2);
        QCOMPARE(f.sync.verticalOffset(), 0.0);

        QCOMPARE(slideSpy.count(), 2);
    }

    void testNextAtEndIsNoop() {
        Fixture f;
        QVERIFY(f.sync.jumpTo(3));
        QVERIFY(f.sync.next());                 // scroll tall last slide
        QVERIFY(!f.sync.next());
        QCOMPARE(f.sync.currentPosition(), 3);
        QCOMPARE(f.sync.verticalOffset(), 1.0);
    }

    void testPreviousScrollsBackThenLandsAtBottom() {
        Fixture f;
        QVERIFY(f.sync.jumpTo(3));
        QVERIFY(f.sync.next());                 // bottom of slide 3
        QVERIFY(f.sync.previous());             // top of slide 3
        QCOMPARE(f.sync.currentPosition(), 3);
        QCOMPARE(f.sync.verticalOffset(), 0.0);

        QVERIFY(f.sync.previous());             // slide 2 fits
        QCOMPARE(f.sync.currentPosition(), 2);
        QCOMPARE(f.sync.verticalOffset(), 0.0);

        QVERIFY(f.sync.previous());             // slide 1 is tall: land at bottom
        QCOMPARE(f.sync.currentPosition(), 1);
        QCOMPARE(f.sync.verticalOffset(), 1.0);

        QVERIFY(f.sync.previous());
        QVERIFY(f.sync.previous());
        QCOMPARE(f.sync.currentPosition(), 0);
        QVERIFY(!f.sync.previous());
    }

    void testJumpResetsOffset() {
        Fixture f;
        f.sync.jumpTo(1);
        f.sync.next();
        QCOMPARE(f.sync.verticalOffset(), 1.0);

        QSignalSpy repaint(&f.sync, &PresentationSync::viewsNeedRepaint);
        QVERIFY(f.sync.jumpTo(1));
        QCOMPARE(f.sync.verticalOffset(), 0.0);
        QVERIFY(repaint.count() >= 1);

        QVERIFY(!f.sync.jumpTo(4));
        QVERIFY(!f.sync.jumpTo(-1));
        QCOMPARE(f.sync.currentPosition(), 1);
    }

    // Deleting the current slide moves both views to its replacement
    void testResyncAfterRemove() {
        Fixture f;
        f.sync.jumpTo(1);
        f.sync.next();
        QSignalSpy slideSpy(&f.sync, &PresentationSync::currentSlideChanged);

        QVERIFY(f.order.remove(1));
        f.sync.resync();

        QCOMPARE(slideSpy.count(), 1);
        QCOMPARE(slideSpy.last().at(1).toInt(), 2);
        QCOMPARE(f.sync.verticalOffset(), 0.0);
    }

    // Moving the current slide keeps its scroll state
    void testResyncAfterMoveKeepsOffset() {
        Fixture f;
        f.sync.jumpTo(1);
        f.sync.next();

        QVERIFY(f.order.move(1, 3));
        f.sync.resync();

        QCOMPARE(f.sync.currentPosition(), 3);
        QCOMPARE(f.sync.currentSlideId(), 1);
        QCOMPARE(f.sync.verticalOffset(), 1.0);
    }

    void testShrinkingViewportClearsOffset() {
        Fixture f;
        f.sync.jumpTo(1);
        f.sync.next();
        f.sync.setViewportSize(QSize(800, 2000));
        QVERIFY(!f.sync.isCurrentSlideTall());
        QCOMPARE(f.sync.verticalOffset(), 0.0);
    }

    void testLayoutCentersShortImage() {
        ProjectorLayout layout = PresentationSync::computeLayout(QSize(800, 600), QSize(800, 1000), 0.7);
        QVERIFY(!layout.scrolls);
        QCOMPARE(layout.sourceRect, QRectF(0, 0, 800, 600));
        QCOMPARE(layout.targetRect, QRectF(0, 200, 800, 600));

        layout = PresentationSync::computeLayout(QSize(600, 400), QSize(800, 600), 0.0);
        QCOMPARE(layout.targetRect, QRectF(100, 100, 600, 400));
    }

    void testLayoutSlicesTallImage() {
        ProjectorLayout layout = PresentationSync::computeLayout(QSize(800, 2000), QSize(800, 600), 0.5);
        QVERIFY(layout.scrolls);
        QCOMPARE(layout.sourceRect, QRectF(0, 700, 800, 600));
        QCOMPARE(layout.targetRect, QRectF(0, 0, 800, 600));

        layout = PresentationSync::computeLayout(QSize(800, 2000), QSize(800, 600), 1.0);
        QCOMPARE(layout.sourceRect.top(), 1400.0);

        QVERIFY(!PresentationSync::computeLayout(QSize(), QSize(800, 600), 0).isValid());
    }

    void testCurrentLayoutFollowsOffset() {
        Fixture f;
        f.sync.jumpTo(1);
        QCOMPARE(f.sync.currentLayout().sourceRect.top(), 0.0);
        f.sync.next();
        QCOMPARE(f.sync.currentLayout().sourceRect.top(), 1000.0);
    }

    // A preview with another aspect ratio still shows the projector's slice
    void testScaledLayoutMatchesProjector() {
        Fixture f;
        f.sync.jumpTo(1);
        f.sync.next();

        const ProjectorLayout preview = PresentationSync::scaleLayout(
            f.sync.currentLayout(), f.sync.viewportSize(), QSize(400, 400));
        QVERIFY(preview.isValid());
        QCOMPARE(preview.sourceRect, QRectF(0, 1000, 800, 600));
        QCOMPARE(preview.targetRect, QRectF(0, 50, 400, 300));

        // Short slide letterboxed inside a centered viewport
        const ProjectorLayout shortSlide = PresentationSync::scaleLayout(
            PresentationSync::computeLayout(QSize(600, 400), QSize(800, 600), 0.0),
            QSize(800, 600), QSize(1600, 600));
        QCOMPARE(shortSlide.targetRect, QRectF(500, 100, 600, 400));

        QVERIFY(!PresentationSync::scaleLayout(f.sync.currentLayout(), QSize(), QSize(400, 400)).isValid());
    }
};

#endif // PRESENTATIONSYNCTESTS_H
