#ifndef DATAFORMWIDGET_H
#define DATAFORMWIDGET_H

#include <QGroupBox>
#include <QMap>
#include <QLineEdit>
#include <QLabel>
#include "configmanager.h"
#include "cardrecord.h"

/**
 * Form with one line edit per catalog field
 */
class DataFormWidget : public QGroupBox
{
    Q_OBJECT

public:
    explicit DataFormWidget(const QList<FieldDefinition>& fields, QWidget* parent = nullptr);

    /**
     * Show values without emitting fieldEdited
     */
    void setValues(const FieldMap& values);

    QString value(const QString& fieldKey) const;

    void setFileName(const QString& fileName);
    void setOcrState(OcrState state);

    /**
     * Give keyboard focus to the first field
     */
    void focusFirstField();

signals:
    void fieldEdited(const QString& fieldKey, const QString& value);

private:
    QMap<QString, QLineEdit*> m_edits;
    QString m_firstKey;
    QLabel* m_fileLabel;
    QLabel* m_ocrStateLabel;
};

#endif // DATAFORMWIDGET_H
