#include "dataformwidget.h"
#include <QFormLayout>
#include <QSignalBlocker>

DataFormWidget::DataFormWidget(const QList<FieldDefinition>& fields, QWidget* parent)
    : QGroupBox("Card Data", parent)
{
    QFormLayout* layout = new QFormLayout(this);
    layout->setContentsMargins(8, 6, 8, 6);
    layout->setSpacing(6);
    layout->setFieldGrowthPolicy(QFormLayout::ExpandingFieldsGrow);

    m_fileLabel = new QLabel("-", this);
    m_fileLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    layout->addRow("Image:", m_fileLabel);

    m_ocrStateLabel = new QLabel("-", this);
    layout->addRow("OCR:", m_ocrStateLabel);

    for (const FieldDefinition& def : fields) {
        QLineEdit* edit = new QLineEdit(this);
        edit->setObjectName(def.key);
        edit->setClearButtonEnabled(true);
        layout->addRow(def.label, edit);
        m_edits.insert(def.key, edit);

        if (m_firstKey.isEmpty()) {
            m_firstKey = def.key;
        }

        const QString key = def.key;
        connect(edit, &QLineEdit::textEdited, this, [this, key](const QString& text) {
            emit fieldEdited(key, text);
        });
    }
}

void DataFormWidget::setValues(const FieldMap& values)
{
    for (auto it = m_edits.begin(); it != m_edits.end(); ++it) {
        QSignalBlocker blocker(it.value());
        QString text = values.value(it.key());
        if (it.value()->text() != text) {
            it.value()->setText(text);
        }
    }
}

QString DataFormWidget::value(const QString& fieldKey) const
{
    QLineEdit* edit = m_edits.value(fieldKey);
    return edit ? edit->text() : QString();
}

void DataFormWidget::setFileName(const QString& fileName)
{
    m_fileLabel->setText(fileName.isEmpty() ? QString("-") : fileName);
    for (QLineEdit* edit : m_edits) {
        edit->setEnabled(!fileName.isEmpty());
    }
}

void DataFormWidget::setOcrState(OcrState state)
{
    switch (state) {
        case OcrState::NotAttempted:
            m_ocrStateLabel->setText("Not attempted");
            m_ocrStateLabel->setStyleSheet(QString());
            break;
        case OcrState::Succeeded:
            m_ocrStateLabel->setText("Succeeded");
            m_ocrStateLabel->setStyleSheet("color: rgb(76, 175, 80);");
            break;
        case OcrState::Failed:
            m_ocrStateLabel->setText("Failed");
            m_ocrStateLabel->setStyleSheet("color: rgb(244, 67, 54);");
            break;
    }
}

void DataFormWidget::focusFirstField()
{
    QLineEdit* edit = m_edits.value(m_firstKey);
    if (edit) {
        edit->setFocus();
        edit->selectAll();
    }
}
