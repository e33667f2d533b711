#include "ocrcoordinator.h"
#include "ocrthread.h"
#include "recordstore.h"
#include "statusreporter.h"
#include <QDebug>

OcrCoordinator::OcrCoordinator(RecordStore* store, StatusReporter* status,
                               std::unique_ptr<OcrEngine> engine, QObject *parent)
    : QObject(parent),
      m_store(store),
      m_status(status)
{
    m_thread = new OcrThread(std::move(engine), store->config().maxImageBytes, this);

    connect(m_thread, &OcrThread::ocrFinished,
            this, &OcrCoordinator::onOcrFinished, Qt::QueuedConnection);
}

OcrCoordinator::~OcrCoordinator()
{
    m_thread->stopProcessing();
    m_thread->wait();
}

OcrCoordinator::RequestOutcome OcrCoordinator::request(const QString& fileName, const QString& imagePath)
{
    if (!m_store->contains(fileName)) {
        qWarning() << "OcrCoordinator: No record for" << fileName;
        return RequestOutcome::UnknownRecord;
    }
    if (m_pendingFile == fileName) {
        qDebug() << "OcrCoordinator: OCR already running for" << fileName;
        return RequestOutcome::AlreadyPending;
    }
    if (!m_pendingFile.isEmpty() || !m_thread->submit(fileName, imagePath)) {
        qDebug() << "OcrCoordinator: Busy with" << m_pendingFile << "- rejected" << fileName;
        return RequestOutcome::Busy;
    }

    m_pendingFile = fileName;
    if (m_status) {
        m_status->report(StatusReporter::State::OcrInProgress,
                         QString("Running OCR on %1 with %2...").arg(fileName, m_thread->engineName()));
    }
    emit ocrStarted(fileName);
    return RequestOutcome::Started;
}

bool OcrCoordinator::isPending(const QString& fileName) const
{
    return !m_pendingFile.isEmpty() && m_pendingFile == fileName;
}

void OcrCoordinator::onOcrFinished(const QString& fileName, const OcrResult& result)
{
    m_pendingFile.clear();

    if (!m_store->contains(fileName)) {
        qWarning() << "OcrCoordinator: Record" << fileName << "disappeared before its OCR result arrived";
        if (m_status) {
            m_status->reportError(OperationError(ErrorKind::NotFound,
                                                 QString("OCR result for %1 discarded, record no longer exists").arg(fileName)));
        }
        emit ocrFinished(fileName, false);
        return;
    }

    if (result.success) {
        m_store->applyOcrResult(fileName, result.fields, result.boxes);
        if (m_status) {
            m_status->report(StatusReporter::State::OcrCompleted,
                             QString("OCR completed for %1 (%2 fields, %3 boxes)")
                                 .arg(fileName).arg(result.fields.size()).arg(result.boxes.size()));
        }
    } else {
        m_store->markOcrFailed(fileName);
        if (m_status) {
            m_status->reportError(OperationError(result.error.kind,
                                                 QString("OCR failed for %1: %2").arg(fileName, result.error.message)));
        }
    }

    emit ocrFinished(fileName, result.success);
}
