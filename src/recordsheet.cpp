#include "recordsheet.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QSet>
#include <QDebug>
#include <OpenXLSX.hpp>
#include <cstdint>
#include <exception>
#include <string>
#include <vector>

namespace {

QString cellText(OpenXLSX::XLWorksheet& sheet, uint32_t row, uint16_t column)
{
    OpenXLSX::XLCell cell = sheet.cell(row, column);
    auto& value = cell.value();

    switch (value.type()) {
        case OpenXLSX::XLValueType::String:
            return QString::fromStdString(value.get<std::string>());
        case OpenXLSX::XLValueType::Integer:
            return QString::number(value.get<int64_t>());
        case OpenXLSX::XLValueType::Float:
            return QString::number(value.get<double>(), 'g', 15);
        case OpenXLSX::XLValueType::Boolean:
            return value.get<bool>() ? "TRUE" : "FALSE";
        default:
            return QString();
    }
}

ErrorKind writeErrorKind(const QString& path)
{
    QFileInfo dirInfo(QFileInfo(path).absolutePath());
    if (!dirInfo.isWritable()) {
        return ErrorKind::Permission;
    }
    QFileInfo fileInfo(path);
    if (fileInfo.exists() && !fileInfo.isWritable()) {
        return ErrorKind::Permission;
    }
    return ErrorKind::IOError;
}

} // namespace

QString RecordSheet::tempPathFor(const QString& filePath)
{
    QFileInfo info(filePath);
    return info.dir().filePath(".~" + info.fileName());
}

bool RecordSheet::load(const QString& filePath, const AppConfig& config,
                       QList<CardRecord>& records, OperationError* error)
{
    records.clear();

    if (!QFileInfo::exists(filePath)) {
        setOperationError(error, ErrorKind::NotFound,
                          QString("Spreadsheet not found: %1").arg(filePath));
        return false;
    }

    try {
        OpenXLSX::XLDocument doc;
        doc.open(filePath.toStdString());

        std::vector<std::string> sheetNames = doc.workbook().worksheetNames();
        if (sheetNames.empty()) {
            doc.close();
            setOperationError(error, ErrorKind::CorruptData,
                              QString("Spreadsheet has no worksheets: %1").arg(filePath));
            return false;
        }

        OpenXLSX::XLWorksheet sheet = doc.workbook().worksheet(sheetNames.front());
        const uint32_t rowCount = sheet.rowCount();
        const uint16_t columnCount = sheet.columnCount();

        // Map header text to column number
        QHash<QString, uint16_t> columns;
        for (uint16_t col = 1; col <= columnCount; ++col) {
            QString header = cellText(sheet, 1, col).trimmed();
            if (!header.isEmpty() && !columns.contains(header)) {
                columns.insert(header, col);
            }
        }

        if (!columns.contains(config.fileNameColumn)) {
            doc.close();
            setOperationError(error, ErrorKind::CorruptData,
                              QString("Spreadsheet has no '%1' column: %2")
                                  .arg(config.fileNameColumn, filePath));
            return false;
        }

        for (const FieldDefinition& def : config.fields) {
            if (!columns.contains(def.column)) {
                qDebug() << "RecordSheet: Column missing, reading as empty:" << def.column;
            }
        }

        const uint16_t nameColumn = columns.value(config.fileNameColumn);
        QSet<QString> seen;

        for (uint32_t row = 2; row <= rowCount; ++row) {
            QString fileName = cellText(sheet, row, nameColumn);
            if (fileName.trimmed().isEmpty()) {
                continue;
            }
            if (seen.contains(fileName)) {
                qWarning() << "RecordSheet: Duplicate row ignored for" << fileName << "at row" << row;
                continue;
            }
            seen.insert(fileName);

            CardRecord record(fileName);
            for (const FieldDefinition& def : config.fields) {
                auto it = columns.constFind(def.column);
                record.fields.insert(def.key, it != columns.constEnd()
                                                  ? cellText(sheet, row, it.value())
                                                  : QString());
            }
            records.append(record);
        }

        doc.close();
    } catch (const std::exception& e) {
        records.clear();
        setOperationError(error, ErrorKind::CorruptData,
                          QString("Failed to read spreadsheet %1: %2").arg(filePath, e.what()));
        return false;
    }

    qDebug() << "RecordSheet: Loaded" << records.size() << "rows from" << filePath;
    return true;
}

bool RecordSheet::save(const QString& filePath, const AppConfig& config,
                       const QList<CardRecord>& records, OperationError* error)
{
    QString tempPath = tempPathFor(filePath);
    if (QFileInfo::exists(tempPath) && !QFile::remove(tempPath)) {
        setOperationError(error, writeErrorKind(tempPath),
                          QString("Cannot remove stale temporary file: %1").arg(tempPath));
        return false;
    }

    try {
        OpenXLSX::XLDocument doc;
        doc.create(tempPath.toStdString());

        std::vector<std::string> sheetNames = doc.workbook().worksheetNames();
        OpenXLSX::XLWorksheet sheet = doc.workbook().worksheet(sheetNames.front());

        // Header row
        sheet.cell(1, 1).value() = config.fileNameColumn.toStdString();
        for (int i = 0; i < config.fields.size(); ++i) {
            sheet.cell(1, static_cast<uint16_t>(i + 2)).value() = config.fields[i].column.toStdString();
        }

        uint32_t row = 2;
        for (const CardRecord& record : records) {
            sheet.cell(row, 1).value() = record.fileName.toStdString();
            for (int i = 0; i < config.fields.size(); ++i) {
                QString value = record.value(config.fields[i].key);
                if (!value.isEmpty()) {
                    sheet.cell(row, static_cast<uint16_t>(i + 2)).value() = value.toStdString();
                }
            }
            ++row;
        }

        doc.save();
        doc.close();
    } catch (const std::exception& e) {
        QFile::remove(tempPath);
        setOperationError(error, writeErrorKind(filePath),
                          QString("Failed to write spreadsheet %1: %2").arg(filePath, e.what()));
        return false;
    }

    if (!replaceFile(tempPath, filePath, error)) {
        QFile::remove(tempPath);
        return false;
    }

    qDebug() << "RecordSheet: Saved" << records.size() << "rows to" << filePath;
    return true;
}

bool RecordSheet::replaceFile(const QString& tempPath, const QString& targetPath, OperationError* error)
{
    QString backupPath = targetPath + ".bak";
    bool hadTarget = QFileInfo::exists(targetPath);

    if (hadTarget) {
        if (QFileInfo::exists(backupPath)) {
            QFile::remove(backupPath);
        }
        QFile target(targetPath);
        if (!target.rename(backupPath)) {
            ErrorKind kind = (target.error() == QFileDevice::PermissionsError)
                                 ? ErrorKind::Permission : writeErrorKind(targetPath);
            setOperationError(error, kind,
                              QString("Cannot replace %1: %2").arg(targetPath, target.errorString()));
            return false;
        }
    }

    QFile temp(tempPath);
    if (!temp.rename(targetPath)) {
        QString reason = temp.errorString();
        if (hadTarget && !QFile::rename(backupPath, targetPath)) {
            qCritical() << "RecordSheet: Failed to restore backup" << backupPath;
        }
        setOperationError(error, writeErrorKind(targetPath),
                          QString("Cannot move %1 into place: %2").arg(tempPath, reason));
        return false;
    }

    if (hadTarget && !QFile::remove(backupPath)) {
        qWarning() << "RecordSheet: Could not remove backup" << backupPath;
    }
    return true;
}
