#ifndef RECORDSTORE_H
#define RECORDSTORE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>
#include "cardrecord.h"
#include "configmanager.h"
#include "operationerror.h"

/**
 * Outcome of reconciling a folder with its persisted artifacts
 */
struct LoadReport {
    bool sheetLoaded;
    bool sidecarLoaded;
    int persistedRecords;
    int prunedCount;
    int addedCount;
    QList<OperationError> notices;

    LoadReport() :
        sheetLoaded(false),
        sidecarLoaded(false),
        persistedRecords(0),
        prunedCount(0),
        addedCount(0)
    {}

    bool hasNotices() const { return !notices.isEmpty(); }

    /**
     * One-line summary for the status bar
     */
    QString summary(int trackedCount) const;
};

/**
 * @brief In-memory record set for one folder of card images
 *
 * Owns one CardRecord per image file name, ordered by file name, and keeps
 * it consistent with the folder listing and the two persisted artifacts
 * (spreadsheet and box sidecar). Must only be used from the thread that
 * owns it.
 */
class RecordStore : public QObject
{
    Q_OBJECT

public:
    explicit RecordStore(const AppConfig& config, QObject *parent = nullptr);

    /**
     * @brief Replace the record set with the persisted state of a folder
     *
     * Reads the spreadsheet and box sidecar when present, merges them by
     * file name, drops records for files not in fileNames and adds blank
     * records for new files. Corrupt artifacts are ignored and reported as
     * CorruptData notices; this never fails.
     *
     * @param folderPath Folder holding the images and artifacts
     * @param fileNames Image file names currently in the folder
     * @return Report of what was loaded, pruned and added
     */
    LoadReport loadOrCreate(const QString& folderPath, const QStringList& fileNames);

    /**
     * Drop all records
     */
    void clear();

    /**
     * Get the record for an image
     * @param fileName Image file name
     * @return Pointer to the record, nullptr if unknown. Valid until the next mutation.
     */
    const CardRecord* getRecord(const QString& fileName) const;

    bool contains(const QString& fileName) const;

    /**
     * @brief Merge an OCR result into a record
     *
     * Overwrites the fields present in fields, leaves the others untouched,
     * replaces all boxes, marks the OCR attempt succeeded and the record dirty.
     *
     * @param fileName Image file name
     * @param fields Extracted values keyed by field key
     * @param boxes Extracted boxes
     * @return false if the file name is unknown
     */
    bool applyOcrResult(const QString& fileName, const FieldMap& fields, const QList<BoundingBox>& boxes);

    /**
     * Record a failed OCR attempt without touching fields or boxes
     * @param fileName Image file name
     * @return false if the file name is unknown
     */
    bool markOcrFailed(const QString& fileName);

    /**
     * Set a single field from operator input and mark the record dirty
     * @param fileName Image file name
     * @param fieldKey Field key
     * @param value New text
     * @return false if the file name or field key is unknown
     */
    bool applyManualEdit(const QString& fileName, const QString& fieldKey, const QString& value);

    /**
     * Move a record to a new file name key, keeping fields and boxes
     * @param oldName Current file name
     * @param newName New file name
     * @return false if oldName is unknown or newName is already taken
     */
    bool renameRecord(const QString& oldName, const QString& newName);

    /**
     * @brief Write all records to the folder's spreadsheet, then its box sidecar
     *
     * Dirty flags are cleared only when both writes succeed.
     *
     * @param folderPath Target folder
     * @param error Output error (IOError or Permission)
     * @return true if both artifacts were written
     */
    bool save(const QString& folderPath, OperationError* error = nullptr);

    /**
     * Save to the folder that was last loaded
     */
    bool save(OperationError* error = nullptr);

    QStringList fileNames() const;
    QList<CardRecord> records() const;
    int size() const { return m_records.size(); }
    bool isEmpty() const { return m_records.isEmpty(); }
    bool hasUnsavedChanges() const;
    int dirtyCount() const;
    QString folderPath() const { return m_folderPath; }
    const AppConfig& config() const { return m_config; }

    QString dataFilePath(const QString& folderPath) const;
    QString boxFilePath(const QString& folderPath) const;

signals:
    void recordsReset();
    void recordChanged(const QString& fileName);
    void recordRenamed(const QString& oldName, const QString& newName);
    void dirtyStateChanged(bool hasUnsavedChanges);

private:
    CardRecord makeBlank(const QString& fileName) const;
    void markDirty(CardRecord& record);

    const AppConfig m_config;
    QMap<QString, CardRecord> m_records;
    QString m_folderPath;
};

#endif // RECORDSTORE_H
