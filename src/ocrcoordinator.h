#ifndef OCRCOORDINATOR_H
#define OCRCOORDINATOR_H

#include <QObject>
#include <QString>
#include <memory>
#include "ocrengine.h"

class RecordStore;
class StatusReporter;
class OcrThread;

/**
 * @brief Schedules OCR requests and applies their results to the store
 *
 * Lives on the GUI thread. Only one request is in flight at a time; its
 * result is applied by file name when it arrives, whichever record is
 * displayed at that moment.
 */
class OcrCoordinator : public QObject
{
    Q_OBJECT

public:
    enum class RequestOutcome {
        Started,
        AlreadyPending,   // Same record already has a request in flight
        Busy,             // Worker is processing another record
        UnknownRecord
    };

    OcrCoordinator(RecordStore* store, StatusReporter* status,
                   std::unique_ptr<OcrEngine> engine, QObject *parent = nullptr);
    ~OcrCoordinator();

    /**
     * Start OCR for a record
     * @param fileName Record key
     * @param imagePath Full path of the image
     * @return Started, or the reason the request was rejected
     */
    RequestOutcome request(const QString& fileName, const QString& imagePath);

    bool isBusy() const { return !m_pendingFile.isEmpty(); }
    bool isPending(const QString& fileName) const;
    QString pendingFile() const { return m_pendingFile; }

signals:
    void ocrStarted(const QString& fileName);
    void ocrFinished(const QString& fileName, bool success);

private slots:
    void onOcrFinished(const QString& fileName, const OcrResult& result);

private:
    RecordStore* m_store;
    StatusReporter* m_status;
    OcrThread* m_thread;
    QString m_pendingFile;
};

#endif // OCRCOORDINATOR_H
