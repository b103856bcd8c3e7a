#include "FolderBrowserPanel.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QFileSystemModel>
#include <QLabel>
#include <QTreeView>
#include <QVBoxLayout>

FolderBrowserPanel::FolderBrowserPanel(QWidget* parent)
    : QWidget(parent)
{
    setupUI();
}

void FolderBrowserPanel::setupUI()
{
    QVBoxLayout* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(4);

    m_folderLabel = new QLabel(tr("No folder opened"), this);
    m_folderLabel->setContentsMargins(6, 4, 6, 0);
    m_folderLabel->setWordWrap(true);

    m_model = new QFileSystemModel(this);
    m_model->setFilter(QDir::AllDirs | QDir::Files | QDir::NoDotAndDotDot);
    m_model->setNameFilters({"*.pdf", "*.PDF"});
    m_model->setNameFilterDisables(false);  // Hide non-PDF files instead of greying them out

    m_treeView = new QTreeView(this);
    m_treeView->setModel(m_model);
    m_treeView->setHeaderHidden(true);
    m_treeView->setSelectionMode(QAbstractItemView::ExtendedSelection);
    m_treeView->setDragEnabled(true);
    m_treeView->setDragDropMode(QAbstractItemView::DragOnly);
    m_treeView->setFrameShape(QFrame::NoFrame);

    // Name column only
    for (int column = 1; column < m_model->columnCount(); ++column) {
        m_treeView->hideColumn(column);
    }

    layout->addWidget(m_folderLabel);
    layout->addWidget(m_treeView);

    connect(m_treeView, &QTreeView::activated, this, &FolderBrowserPanel::onItemActivated);
}

bool FolderBrowserPanel::setRootFolder(const QString& path)
{
    const QFileInfo info(path);
    if (!info.isDir()) {
        qWarning() << "FolderBrowserPanel: Not a folder:" << path;
        return false;
    }

    m_rootFolder = info.absoluteFilePath();
    const QModelIndex root = m_model->setRootPath(m_rootFolder);
    m_treeView->setRootIndex(root);
    m_folderLabel->setText(QDir::toNativeSeparators(m_rootFolder));
    return true;
}

QStringList FolderBrowserPanel::selectedFiles() const
{
    QStringList paths;
    const QModelIndexList rows = m_treeView->selectionModel()->selectedRows();
    for (const QModelIndex& index : rows) {
        if (!m_model->isDir(index)) {
            paths.append(m_model->filePath(index));
        }
    }
    return paths;
}

void FolderBrowserPanel::onItemActivated(const QModelIndex& index)
{
    if (!index.isValid() || m_model->isDir(index)) {
        return;
    }

    QStringList paths = selectedFiles();
    const QString activated = m_model->filePath(index);
    if (!paths.contains(activated)) {
        paths = QStringList{activated};
    }
    emit filesActivated(paths);
}
