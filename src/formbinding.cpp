#include "formbinding.h"
#include "recordstore.h"
#include <QDebug>

FormBinding::FormBinding(RecordStore* store, QObject *parent)
    : QObject(parent),
      m_store(store),
      m_editing(false)
{
    connect(m_store, &RecordStore::recordChanged, this, &FormBinding::onRecordChanged);
    connect(m_store, &RecordStore::recordRenamed, this, &FormBinding::onRecordRenamed);
    connect(m_store, &RecordStore::recordsReset, this, &FormBinding::onRecordsReset);
}

bool FormBinding::show(const QString& fileName)
{
    if (!m_store->contains(fileName)) {
        qWarning() << "FormBinding: Cannot show unknown record" << fileName;
        return false;
    }

    m_activeFile = fileName;
    emit activeRecordChanged(m_activeFile);
    publish();
    return true;
}

void FormBinding::clear()
{
    m_activeFile.clear();
    emit activeRecordChanged(m_activeFile);
    publish();
}

bool FormBinding::editField(const QString& fieldKey, const QString& value)
{
    if (m_activeFile.isEmpty()) {
        return false;
    }

    // The form already shows the typed text; skip republishing it
    m_editing = true;
    bool ok = m_store->applyManualEdit(m_activeFile, fieldKey, value);
    m_editing = false;
    return ok;
}

FieldMap FormBinding::values() const
{
    const CardRecord* record = m_store->getRecord(m_activeFile);
    return record ? record->fields : FieldMap();
}

void FormBinding::onRecordChanged(const QString& fileName)
{
    if (fileName == m_activeFile && !m_editing) {
        publish();
    }
}

void FormBinding::onRecordRenamed(const QString& oldName, const QString& newName)
{
    if (oldName == m_activeFile) {
        m_activeFile = newName;
        emit activeRecordChanged(m_activeFile);
    }
}

void FormBinding::onRecordsReset()
{
    if (!m_activeFile.isEmpty() && !m_store->contains(m_activeFile)) {
        clear();
    } else if (!m_activeFile.isEmpty()) {
        publish();
    }
}

void FormBinding::publish()
{
    const CardRecord* record = m_store->getRecord(m_activeFile);
    if (!record) {
        FieldMap blank;
        for (const QString& key : m_store->config().fieldKeys()) {
            blank.insert(key, QString());
        }
        emit valuesChanged(blank);
        emit boxesChanged(QList<BoundingBox>());
        return;
    }

    emit valuesChanged(record->fields);
    emit boxesChanged(record->boxes);
}
