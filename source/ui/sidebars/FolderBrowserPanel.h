#ifndef FOLDERBROWSERPANEL_H
#define FOLDERBROWSERPANEL_H

#include <QWidget>

class QFileSystemModel;
class QLabel;
class QTreeView;

/**
 * @brief Sidebar listing the folders and PDF files under a root folder.
 *
 * Double-clicking a PDF asks for it to be imported. Files can also be
 * dragged onto the slide organizer (the file system model provides the
 * file URLs).
 */
class FolderBrowserPanel : public QWidget {
    Q_OBJECT

public:
    explicit FolderBrowserPanel(QWidget* parent = nullptr);

    /**
     * @brief Show the contents of a folder.
     * @return false if the folder does not exist.
     */
    bool setRootFolder(const QString& path);
    QString rootFolder() const { return m_rootFolder; }

    /**
     * @brief Paths of the selected PDF files.
     */
    QStringList selectedFiles() const;

signals:
    /**
     * @brief User activated PDF files (double-click or Enter).
     */
    void filesActivated(const QStringList& paths);

private slots:
    void onItemActivated(const QModelIndex& index);

private:
    void setupUI();

    QFileSystemModel* m_model = nullptr;
    QTreeView* m_treeView = nullptr;
    QLabel* m_folderLabel = nullptr;
    QString m_rootFolder;
};

#endif // FOLDERBROWSERPANEL_H
