#include "recordstore.h"
#include "recordsheet.h"
#include "boxsidecar.h"
#include <QDir>
#include <QFileInfo>
#include <QSet>
#include <QDebug>

QString LoadReport::summary(int trackedCount) const
{
    QString msg;
    if (sheetLoaded) {
        msg = "Loaded existing data";
    } else {
        msg = "Started new data";
    }
    msg += QString("; %1 images tracked").arg(trackedCount);
    if (prunedCount > 0) {
        msg += QString(", %1 stale records dropped").arg(prunedCount);
    }
    if (addedCount > 0) {
        msg += QString(", %1 new").arg(addedCount);
    }
    if (!notices.isEmpty()) {
        msg += QString(" (%1)").arg(notices.first().toString());
    }
    return msg;
}

RecordStore::RecordStore(const AppConfig& config, QObject *parent)
    : QObject(parent),
      m_config(config)
{
}

QString RecordStore::dataFilePath(const QString& folderPath) const
{
    return QDir(folderPath).filePath(m_config.dataFileName);
}

QString RecordStore::boxFilePath(const QString& folderPath) const
{
    return QDir(folderPath).filePath(m_config.boxFileName);
}

CardRecord RecordStore::makeBlank(const QString& fileName) const
{
    CardRecord record(fileName);
    for (const FieldDefinition& def : m_config.fields) {
        record.fields.insert(def.key, QString());
    }
    return record;
}

LoadReport RecordStore::loadOrCreate(const QString& folderPath, const QStringList& fileNames)
{
    bool wasDirty = hasUnsavedChanges();
    LoadReport report;
    QMap<QString, CardRecord> persisted;

    // Spreadsheet rows are authoritative for field values
    QString dataPath = dataFilePath(folderPath);
    if (QFileInfo::exists(dataPath)) {
        QList<CardRecord> rows;
        OperationError error;
        if (RecordSheet::load(dataPath, m_config, rows, &error)) {
            for (const CardRecord& row : rows) {
                persisted.insert(row.fileName, row);
            }
            report.sheetLoaded = true;
        } else {
            report.notices.append(OperationError(ErrorKind::CorruptData, error.message));
        }
    }

    // The sidecar only contributes box geometry
    QString boxPath = boxFilePath(folderPath);
    if (QFileInfo::exists(boxPath)) {
        BoxMap boxes;
        OperationError error;
        if (BoxSidecar::load(boxPath, m_config, boxes, &error)) {
            for (auto it = boxes.constBegin(); it != boxes.constEnd(); ++it) {
                auto found = persisted.find(it.key());
                if (found == persisted.end()) {
                    found = persisted.insert(it.key(), makeBlank(it.key()));
                }
                found->boxes = it.value();
            }
            report.sidecarLoaded = true;
        } else {
            ErrorKind kind = (error.kind == ErrorKind::Permission || error.kind == ErrorKind::IOError)
                                 ? error.kind : ErrorKind::CorruptData;
            report.notices.append(OperationError(kind, error.message));
        }
    }

    report.persistedRecords = persisted.size();

    // Reconcile with the folder listing
    QSet<QString> present(fileNames.begin(), fileNames.end());
    m_records.clear();
    for (auto it = persisted.begin(); it != persisted.end(); ++it) {
        if (!present.contains(it.key())) {
            qDebug() << "RecordStore: Dropping record for missing image" << it.key();
            report.prunedCount++;
            continue;
        }
        // Fill in columns absent from older spreadsheets
        for (const FieldDefinition& def : m_config.fields) {
            if (!it->fields.contains(def.key)) {
                it->fields.insert(def.key, QString());
            }
        }
        m_records.insert(it.key(), it.value());
    }
    for (const QString& fileName : fileNames) {
        if (!m_records.contains(fileName)) {
            m_records.insert(fileName, makeBlank(fileName));
            report.addedCount++;
        }
    }

    m_folderPath = folderPath;

    qInfo() << "RecordStore: Loaded" << folderPath
            << "records:" << m_records.size()
            << "pruned:" << report.prunedCount
            << "added:" << report.addedCount
            << "notices:" << report.notices.size();

    emit recordsReset();
    if (wasDirty) {
        emit dirtyStateChanged(false);
    }
    return report;
}

void RecordStore::clear()
{
    bool wasDirty = hasUnsavedChanges();
    m_records.clear();
    m_folderPath.clear();
    emit recordsReset();
    if (wasDirty) {
        emit dirtyStateChanged(false);
    }
}

const CardRecord* RecordStore::getRecord(const QString& fileName) const
{
    auto it = m_records.constFind(fileName);
    if (it == m_records.constEnd()) {
        return nullptr;
    }
    return &it.value();
}

bool RecordStore::contains(const QString& fileName) const
{
    return m_records.contains(fileName);
}

void RecordStore::markDirty(CardRecord& record)
{
    bool wasDirty = hasUnsavedChanges();
    record.dirty = true;
    if (!wasDirty) {
        emit dirtyStateChanged(true);
    }
}

bool RecordStore::applyOcrResult(const QString& fileName, const FieldMap& fields, const QList<BoundingBox>& boxes)
{
    auto it = m_records.find(fileName);
    if (it == m_records.end()) {
        qWarning() << "RecordStore: OCR result for unknown image" << fileName;
        return false;
    }

    CardRecord& record = it.value();
    for (auto field = fields.constBegin(); field != fields.constEnd(); ++field) {
        if (!m_config.field(field.key())) {
            qWarning() << "RecordStore: Ignoring unknown OCR field" << field.key();
            continue;
        }
        record.fields.insert(field.key(), field.value());
    }
    record.boxes = boxes;
    record.ocrState = OcrState::Succeeded;
    markDirty(record);

    emit recordChanged(fileName);
    return true;
}

bool RecordStore::markOcrFailed(const QString& fileName)
{
    auto it = m_records.find(fileName);
    if (it == m_records.end()) {
        return false;
    }
    it->ocrState = OcrState::Failed;
    emit recordChanged(fileName);
    return true;
}

bool RecordStore::applyManualEdit(const QString& fileName, const QString& fieldKey, const QString& value)
{
    auto it = m_records.find(fileName);
    if (it == m_records.end()) {
        qWarning() << "RecordStore: Edit for unknown image" << fileName;
        return false;
    }
    if (!m_config.field(fieldKey)) {
        qWarning() << "RecordStore: Edit for unknown field" << fieldKey;
        return false;
    }

    it->fields.insert(fieldKey, value);
    markDirty(it.value());

    emit recordChanged(fileName);
    return true;
}

bool RecordStore::renameRecord(const QString& oldName, const QString& newName)
{
    if (oldName == newName) {
        return m_records.contains(oldName);
    }
    if (!m_records.contains(oldName) || m_records.contains(newName) || newName.isEmpty()) {
        return false;
    }

    CardRecord record = m_records.take(oldName);
    record.fileName = newName;
    m_records.insert(newName, record);
    markDirty(m_records[newName]);

    emit recordRenamed(oldName, newName);
    return true;
}

bool RecordStore::save(const QString& folderPath, OperationError* error)
{
    if (folderPath.isEmpty()) {
        setOperationError(error, ErrorKind::NotFound, "No folder is open");
        return false;
    }

    QList<CardRecord> rows = m_records.values();

    if (!RecordSheet::save(dataFilePath(folderPath), m_config, rows, error)) {
        return false;
    }

    BoxMap boxes;
    for (const CardRecord& record : rows) {
        if (!record.boxes.isEmpty()) {
            boxes.insert(record.fileName, record.boxes);
        }
    }

    // The spreadsheet is already on disk; a failure here leaves the sidecar stale
    if (!BoxSidecar::save(boxFilePath(folderPath), boxes, error)) {
        qWarning() << "RecordStore: Spreadsheet saved but box sidecar failed for" << folderPath;
        return false;
    }

    bool wasDirty = hasUnsavedChanges();
    for (auto it = m_records.begin(); it != m_records.end(); ++it) {
        it->dirty = false;
    }

    qInfo() << "RecordStore: Saved" << rows.size() << "records to" << folderPath;
    if (wasDirty) {
        emit dirtyStateChanged(false);
    }
    return true;
}

bool RecordStore::save(OperationError* error)
{
    return save(m_folderPath, error);
}

QStringList RecordStore::fileNames() const
{
    return m_records.keys();
}

QList<CardRecord> RecordStore::records() const
{
    return m_records.values();
}

bool RecordStore::hasUnsavedChanges() const
{
    for (auto it = m_records.constBegin(); it != m_records.constEnd(); ++it) {
        if (it->dirty) {
            return true;
        }
    }
    return false;
}

int RecordStore::dirtyCount() const
{
    int count = 0;
    for (auto it = m_records.constBegin(); it != m_records.constEnd(); ++it) {
        if (it->dirty) {
            count++;
        }
    }
    return count;
}
