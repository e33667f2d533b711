#ifndef IMAGESOURCE_H
#define IMAGESOURCE_H

#include <QString>
#include <QStringList>
#include "operationerror.h"

/**
 * @brief Ordered list of card images in one folder with a navigation cursor
 *
 * Navigation is clamped at both ends. Movement methods return false when
 * the cursor could not move so callers can tell "already at the first/last
 * image" apart from a real change.
 */
class ImageSource
{
public:
    explicit ImageSource(const QStringList& extensions);

    /**
     * Enumerate the supported images in a folder
     * @param folderPath Folder to scan
     * @param error Output error (NotFound or EmptyFolder)
     * @return true if at least one image was found
     */
    bool open(const QString& folderPath, OperationError* error = nullptr);

    /**
     * Forget the current folder
     */
    void clear();

    bool next();
    bool previous();

    /**
     * Move the cursor to an index
     * @param index Target index
     * @return true if the cursor moved
     */
    bool jumpTo(int index);

    /**
     * Rename a file on disk and keep the list sorted
     * @param oldName Current file name
     * @param newName New file name (no directory part)
     * @param error Output error
     * @return true if renamed
     */
    bool renameFile(const QString& oldName, const QString& newName, OperationError* error = nullptr);

    /**
     * Check whether a file name has a supported image extension
     */
    bool isSupported(const QString& fileName) const;

    int count() const { return m_fileNames.size(); }
    bool isEmpty() const { return m_fileNames.isEmpty(); }
    int currentIndex() const { return m_currentIndex; }
    QString currentFileName() const;
    QString currentFilePath() const;
    QString filePath(const QString& fileName) const;
    QString folderPath() const { return m_folderPath; }
    const QStringList& fileNames() const { return m_fileNames; }

private:
    QStringList m_extensions;
    QString m_folderPath;
    QStringList m_fileNames;
    int m_currentIndex;
};

#endif // IMAGESOURCE_H
