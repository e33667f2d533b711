#include "ocrthread.h"
#include "imageiohelper.h"
#include <QElapsedTimer>
#include <QDebug>

OcrThread::OcrThread(std::unique_ptr<OcrEngine> engine, qint64 maxImageBytes, QObject *parent)
    : QThread(parent),
      m_engine(std::move(engine)),
      m_maxImageBytes(maxImageBytes),
      m_shouldStop(false),
      m_busy(false)
{
    qRegisterMetaType<OcrResult>("OcrResult");
}

OcrThread::~OcrThread()
{
    stopProcessing();
    wait();
}

bool OcrThread::submit(const QString& fileName, const QString& imagePath)
{
    QMutexLocker locker(&m_mutex);
    if (m_busy) {
        return false;
    }

    m_busy = true;
    m_shouldStop = false;
    m_fileName = fileName;
    m_imagePath = imagePath;

    if (!isRunning()) {
        start();
    } else {
        m_condition.wakeOne();
    }
    return true;
}

bool OcrThread::isBusy() const
{
    QMutexLocker locker(&m_mutex);
    return m_busy;
}

void OcrThread::stopProcessing()
{
    QMutexLocker locker(&m_mutex);
    m_shouldStop = true;
    m_condition.wakeOne();
}

QString OcrThread::engineName() const
{
    return m_engine ? m_engine->name() : QString();
}

void OcrThread::run()
{
    qDebug() << "OcrThread: Worker started";

    while (true) {
        QString fileName;
        QString imagePath;
        {
            QMutexLocker locker(&m_mutex);
            while (!m_busy && !m_shouldStop) {
                m_condition.wait(&m_mutex);
            }
            if (m_shouldStop && !m_busy) {
                break;
            }
            fileName = m_fileName;
            imagePath = m_imagePath;
        }

        QElapsedTimer timer;
        timer.start();
        OcrResult result = process(imagePath);
        qDebug() << "OcrThread:" << fileName << (result.success ? "recognized" : "failed")
                 << "in" << timer.elapsed() << "ms";

        {
            QMutexLocker locker(&m_mutex);
            m_busy = false;
        }
        emit ocrFinished(fileName, result);
    }

    qDebug() << "OcrThread: Worker stopped";
}

OcrResult OcrThread::process(const QString& imagePath)
{
    if (!m_engine) {
        return OcrResult::failure(ErrorKind::Auth, "No OCR engine configured");
    }

    OperationError error;
    QByteArray bytes = ImageIOHelper::encodeForOcr(imagePath, m_maxImageBytes, &error);
    if (error.isError()) {
        return OcrResult::failure(error.kind, error.message);
    }

    return m_engine->recognize(bytes, "image/png");
}
