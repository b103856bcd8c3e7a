#include "SlideOrganizer.h"
#include "SlideThumbnailModel.h"
#include "SlideThumbnailDelegate.h"
#include "../core/PresentationSession.h"

#include <QKeyEvent>
#include <QListView>
#include <QMenu>
#include <QVBoxLayout>

// ============================================================================
// Constructor / Destructor
// ============================================================================

SlideOrganizer::SlideOrganizer(QWidget* parent)
    : QWidget(parent)
{
    setupUI();
    setupConnections();
}

SlideOrganizer::~SlideOrganizer()
{
    // Children are parented, will be deleted automatically
}

// ============================================================================
// Setup
// ============================================================================

void SlideOrganizer::setupUI()
{
    QVBoxLayout* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_model = new SlideThumbnailModel(this);
    m_delegate = new SlideThumbnailDelegate(this);

    m_listView = new QListView(this);
    configureListView();

    m_listView->setModel(m_model);
    m_listView->setItemDelegate(m_delegate);

    layout->addWidget(m_listView);

    applyTheme();
}

void SlideOrganizer::configureListView()
{
    // Grid: left-to-right flow that wraps at the view width.
    // ListMode keeps movement static so drops go through the model.
    m_listView->setViewMode(QListView::ListMode);
    m_listView->setFlow(QListView::LeftToRight);
    m_listView->setWrapping(true);
    m_listView->setResizeMode(QListView::Adjust);
    m_listView->setLayoutMode(QListView::SinglePass);

    // Selection
    m_listView->setSelectionMode(QAbstractItemView::SingleSelection);

    // Scrolling
    m_listView->setVerticalScrollMode(QAbstractItemView::ScrollPerPixel);
    m_listView->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);

    // Drag and drop (internal moves plus PDFs from outside)
    m_listView->setDragEnabled(true);
    m_listView->setAcceptDrops(true);
    m_listView->setDropIndicatorShown(true);
    m_listView->setDragDropMode(QAbstractItemView::DragDrop);
    m_listView->setDefaultDropAction(Qt::MoveAction);

    // Appearance
    m_listView->setFrameShape(QFrame::NoFrame);
    m_listView->setSpacing(4);
    m_listView->setUniformItemSizes(false);

    // Hover effects and remove button
    m_listView->setMouseTracking(true);
    m_listView->viewport()->setMouseTracking(true);
    m_listView->setAttribute(Qt::WA_Hover, true);
    m_listView->viewport()->setAttribute(Qt::WA_Hover, true);

    m_listView->setContextMenuPolicy(Qt::CustomContextMenu);
}

void SlideOrganizer::setupConnections()
{
    connect(m_listView, &QListView::clicked, this, &SlideOrganizer::onItemClicked);
    connect(m_listView, &QListView::customContextMenuRequested,
            this, &SlideOrganizer::onContextMenuRequested);

    connect(m_model, &SlideThumbnailModel::slideDropped,
            this, &SlideOrganizer::slideDropped);
    connect(m_model, &SlideThumbnailModel::filesDropped,
            this, &SlideOrganizer::filesDropped);
    connect(m_delegate, &SlideThumbnailDelegate::removeRequested,
            this, &SlideOrganizer::removeRequested);
}

// ============================================================================
// Session Binding
// ============================================================================

void SlideOrganizer::setSession(PresentationSession* session)
{
    if (m_session == session) {
        return;
    }

    if (m_session) {
        disconnect(m_session, nullptr, this, nullptr);
    }

    m_session = session;
    m_model->setSession(session);

    if (m_session) {
        setThumbnailWidth(m_session->settings().thumbnailWidth);
        connect(m_session, &PresentationSession::currentSlideChanged,
                this, [this](int position, int) { onCurrentSlideChanged(position); });
    }
}

void SlideOrganizer::setThumbnailWidth(int width)
{
    m_delegate->setThumbnailWidth(width);
    m_listView->doItemsLayout();
}

void SlideOrganizer::setDarkMode(bool dark)
{
    if (m_darkMode != dark) {
        m_darkMode = dark;
        applyTheme();
    }
}

int SlideOrganizer::selectedPosition() const
{
    const QModelIndex index = m_listView->currentIndex();
    return index.isValid() ? index.row() : -1;
}

// ============================================================================
// Current Slide
// ============================================================================

void SlideOrganizer::onCurrentSlideChanged(int position)
{
    if (!isVisible()) {
        return;
    }

    // Only scroll if the tile is completely outside the visible area
    const QModelIndex index = m_model->index(position, 0);
    if (index.isValid()) {
        const QRect itemRect = m_listView->visualRect(index);
        if (!m_listView->viewport()->rect().intersects(itemRect)) {
            scrollToCurrentSlide();
        }
    }
}

void SlideOrganizer::scrollToCurrentSlide()
{
    if (!m_session || m_session->slideCount() == 0) {
        return;
    }

    const QModelIndex index = m_model->index(m_session->currentPosition(), 0);
    if (index.isValid()) {
        m_listView->scrollTo(index, QAbstractItemView::PositionAtCenter);
    }
}

// ============================================================================
// Events
// ============================================================================

void SlideOrganizer::keyPressEvent(QKeyEvent* event)
{
    if (event->key() == Qt::Key_Delete || event->key() == Qt::Key_Backspace) {
        const int position = selectedPosition();
        if (position >= 0) {
            emit removeRequested(position);
            event->accept();
            return;
        }
    }
    QWidget::keyPressEvent(event);
}

void SlideOrganizer::onItemClicked(const QModelIndex& index)
{
    if (index.isValid()) {
        emit slideClicked(index.row());
    }
}

void SlideOrganizer::onContextMenuRequested(const QPoint& pos)
{
    const QModelIndex index = m_listView->indexAt(pos);
    if (!index.isValid()) {
        return;
    }

    const int position = index.row();
    QMenu menu(this);
    QAction* showAction = menu.addAction(tr("Show Slide"));
    QAction* removeAction = menu.addAction(tr("Remove Slide"));
    removeAction->setEnabled(m_session && m_session->slideCount() > 1);

    QAction* chosen = menu.exec(m_listView->viewport()->mapToGlobal(pos));
    if (chosen == showAction) {
        emit slideClicked(position);
    } else if (chosen == removeAction) {
        emit removeRequested(position);
    }
}

void SlideOrganizer::applyTheme()
{
    m_delegate->setDarkMode(m_darkMode);

    if (m_darkMode) {
        m_listView->setStyleSheet("QListView { background-color: #2d2d2d; }");
    } else {
        m_listView->setStyleSheet("QListView { background-color: #f5f5f5; }");
    }

    m_listView->viewport()->update();
}
