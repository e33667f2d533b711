#ifndef OCRTHREAD_H
#define OCRTHREAD_H

#include <QThread>
#include <QMutex>
#include <QWaitCondition>
#include <QString>
#include <memory>
#include "ocrengine.h"

/**
 * @brief Background worker that runs one OCR request at a time
 *
 * The thread reads and encodes the image itself, calls the engine and
 * reports through ocrFinished(). It never touches the record set; receivers
 * living on the GUI thread get the signal through a queued connection.
 */
class OcrThread : public QThread
{
    Q_OBJECT

public:
    /**
     * @param engine OCR provider, owned by the thread
     * @param maxImageBytes Limit on the encoded image size
     */
    OcrThread(std::unique_ptr<OcrEngine> engine, qint64 maxImageBytes, QObject *parent = nullptr);
    ~OcrThread();

    /**
     * Queue an image for recognition
     * @param fileName Record key the result belongs to
     * @param imagePath Full path of the image
     * @return false if a request is already being processed
     */
    bool submit(const QString& fileName, const QString& imagePath);

    /**
     * Check if a request is queued or running
     */
    bool isBusy() const;

    /**
     * Stop the thread after the current request completes
     */
    void stopProcessing();

    QString engineName() const;

signals:
    void ocrFinished(const QString& fileName, const OcrResult& result);

protected:
    void run() override;

private:
    OcrResult process(const QString& imagePath);

    std::unique_ptr<OcrEngine> m_engine;
    qint64 m_maxImageBytes;

    mutable QMutex m_mutex;
    QWaitCondition m_condition;
    bool m_shouldStop;
    bool m_busy;
    QString m_fileName;
    QString m_imagePath;
};

#endif // OCRTHREAD_H
