#ifndef FORMBINDING_H
#define FORMBINDING_H

#include <QObject>
#include <QString>
#include "cardrecord.h"

class RecordStore;

/**
 * @brief Connects the displayed record to the data entry form
 *
 * Publishes the active record's values whenever it changes in the store
 * and routes form edits back as manual edits. Holds no field state of its
 * own; the store is authoritative.
 */
class FormBinding : public QObject
{
    Q_OBJECT

public:
    explicit FormBinding(RecordStore* store, QObject *parent = nullptr);

    /**
     * Make a record the active one and publish its values
     * @param fileName Record key
     * @return false if the store has no such record
     */
    bool show(const QString& fileName);

    /**
     * Drop the active record and publish empty values
     */
    void clear();

    /**
     * Apply an operator edit to the active record
     * @return false if there is no active record or the key is unknown
     */
    bool editField(const QString& fieldKey, const QString& value);

    QString activeFile() const { return m_activeFile; }
    bool hasActive() const { return !m_activeFile.isEmpty(); }

    /**
     * Get the active record's current values, empty without an active record
     */
    FieldMap values() const;

signals:
    void valuesChanged(const FieldMap& values);
    void boxesChanged(const QList<BoundingBox>& boxes);
    void activeRecordChanged(const QString& fileName);

private slots:
    void onRecordChanged(const QString& fileName);
    void onRecordRenamed(const QString& oldName, const QString& newName);
    void onRecordsReset();

private:
    void publish();

    RecordStore* m_store;
    QString m_activeFile;
    bool m_editing;
};

#endif // FORMBINDING_H
