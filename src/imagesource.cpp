#include "imagesource.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDebug>
#include <algorithm>

ImageSource::ImageSource(const QStringList& extensions)
    : m_currentIndex(-1)
{
    for (const QString& ext : extensions) {
        m_extensions.append(ext.toLower());
    }
}

bool ImageSource::isSupported(const QString& fileName) const
{
    QString lower = fileName.toLower();
    for (const QString& ext : m_extensions) {
        if (lower.endsWith(ext)) {
            return true;
        }
    }
    return false;
}

bool ImageSource::open(const QString& folderPath, OperationError* error)
{
    clear();

    QFileInfo folderInfo(folderPath);
    if (folderPath.isEmpty() || !folderInfo.exists() || !folderInfo.isDir()) {
        setOperationError(error, ErrorKind::NotFound,
                          QString("Folder not found: %1").arg(folderPath));
        return false;
    }

    QDir dir(folderPath);
    QStringList entries = dir.entryList(QDir::Files | QDir::NoDotAndDotDot);

    QStringList images;
    for (const QString& entry : entries) {
        if (isSupported(entry)) {
            images.append(entry);
        }
    }

    if (images.isEmpty()) {
        setOperationError(error, ErrorKind::EmptyFolder,
                          QString("No image files found in %1").arg(folderPath));
        return false;
    }

    // Plain code-unit ordering, the same ordering the record store uses
    std::sort(images.begin(), images.end());

    m_folderPath = folderInfo.absoluteFilePath();
    m_fileNames = images;
    m_currentIndex = 0;

    qDebug() << "ImageSource: Opened" << m_folderPath << "with" << m_fileNames.size() << "images";
    return true;
}

void ImageSource::clear()
{
    m_folderPath.clear();
    m_fileNames.clear();
    m_currentIndex = -1;
}

bool ImageSource::next()
{
    if (m_fileNames.isEmpty() || m_currentIndex >= m_fileNames.size() - 1) {
        return false;
    }
    m_currentIndex++;
    return true;
}

bool ImageSource::previous()
{
    if (m_fileNames.isEmpty() || m_currentIndex <= 0) {
        return false;
    }
    m_currentIndex--;
    return true;
}

bool ImageSource::jumpTo(int index)
{
    if (index < 0 || index >= m_fileNames.size() || index == m_currentIndex) {
        return false;
    }
    m_currentIndex = index;
    return true;
}

bool ImageSource::renameFile(const QString& oldName, const QString& newName, OperationError* error)
{
    int index = m_fileNames.indexOf(oldName);
    if (index < 0) {
        setOperationError(error, ErrorKind::NotFound,
                          QString("Image not tracked: %1").arg(oldName));
        return false;
    }
    if (oldName == newName) {
        return true;
    }
    if (!isSupported(newName) || newName.contains('/') || newName.contains('\\')) {
        setOperationError(error, ErrorKind::IOError,
                          QString("Invalid image file name: %1").arg(newName));
        return false;
    }

    QDir dir(m_folderPath);
    QString oldPath = dir.filePath(oldName);
    QString newPath = dir.filePath(newName);

    if (QFileInfo::exists(newPath)) {
        setOperationError(error, ErrorKind::IOError,
                          QString("A file named %1 already exists").arg(newName));
        return false;
    }

    QFile file(oldPath);
    if (!file.rename(newPath)) {
        ErrorKind kind = (file.error() == QFileDevice::PermissionsError)
                             ? ErrorKind::Permission : ErrorKind::IOError;
        setOperationError(error, kind,
                          QString("Failed to rename %1 to %2: %3")
                              .arg(oldName, newName, file.errorString()));
        return false;
    }

    QString current = currentFileName();
    m_fileNames[index] = newName;
    std::sort(m_fileNames.begin(), m_fileNames.end());
    if (current == oldName) {
        current = newName;
    }
    m_currentIndex = m_fileNames.indexOf(current);

    qDebug() << "ImageSource: Renamed" << oldName << "to" << newName;
    return true;
}

QString ImageSource::currentFileName() const
{
    if (m_currentIndex < 0 || m_currentIndex >= m_fileNames.size()) {
        return QString();
    }
    return m_fileNames.at(m_currentIndex);
}

QString ImageSource::currentFilePath() const
{
    QString name = currentFileName();
    return name.isEmpty() ? QString() : filePath(name);
}

QString ImageSource::filePath(const QString& fileName) const
{
    return QDir(m_folderPath).filePath(fileName);
}
