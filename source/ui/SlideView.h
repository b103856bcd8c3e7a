#ifndef SLIDEVIEW_H
#define SLIDEVIEW_H

#include <QColor>
#include <QWidget>

class PresentationSession;

/**
 * @brief Paints the current slide of a session.
 *
 * In presentation mode the projector viewport's layout is scaled into the
 * widget, so the presenter preview shows exactly what the projector shows
 * (including the slice of a tall slide). Otherwise the thumbnail is fitted
 * and centered.
 *
 * Repaints whenever PresentationSync asks for it.
 */
class SlideView : public QWidget {
    Q_OBJECT

public:
    explicit SlideView(PresentationSession* session, QWidget* parent = nullptr);

    /**
     * @brief Background filled around the slide.
     */
    void setBackgroundColor(const QColor& color);

    /**
     * @brief Text shown when there is nothing to paint.
     */
    void setPlaceholderText(const QString& text);

    QSize sizeHint() const override;

protected:
    void paintEvent(QPaintEvent* event) override;

    PresentationSession* m_session = nullptr;  ///< Not owned

private:
    QImage currentImage() const;

    QColor m_background = Qt::black;
    QString m_placeholderText;
};

#endif // SLIDEVIEW_H
