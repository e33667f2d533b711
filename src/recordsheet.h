#ifndef RECORDSHEET_H
#define RECORDSHEET_H

#include <QString>
#include <QList>
#include "cardrecord.h"
#include "configmanager.h"
#include "operationerror.h"

/**
 * @brief Reader/writer for the data.xlsx spreadsheet
 *
 * The first worksheet holds a header row followed by one row per image.
 * Columns are matched by header text, so reordered or missing optional
 * columns still load. All values are treated as text.
 */
class RecordSheet
{
public:
    /**
     * @brief Load records from a spreadsheet
     * @param filePath Path to data.xlsx
     * @param config Field catalog and column names
     * @param records Output records, in row order, dirty flags cleared
     * @param error Output error (CorruptData if the file is not a readable sheet)
     * @return true if loaded successfully
     */
    static bool load(const QString& filePath, const AppConfig& config,
                     QList<CardRecord>& records, OperationError* error = nullptr);

    /**
     * @brief Write records to a spreadsheet
     *
     * The workbook is written to a temporary file next to the target and
     * swapped into place once complete.
     *
     * @param filePath Path to data.xlsx
     * @param config Field catalog and column names
     * @param records Records to write, one row each, in the given order
     * @param error Output error (IOError or Permission)
     * @return true if saved successfully
     */
    static bool save(const QString& filePath, const AppConfig& config,
                     const QList<CardRecord>& records, OperationError* error = nullptr);

    /**
     * @brief Replace a file with a fully written temporary file
     *
     * The previous target is kept as a backup until the replacement is in
     * place and restored if the final rename fails.
     *
     * @param tempPath Completed temporary file
     * @param targetPath File to replace
     * @param error Output error
     * @return true if the target now holds the temporary file's content
     */
    static bool replaceFile(const QString& tempPath, const QString& targetPath,
                            OperationError* error = nullptr);

    /**
     * Get the temporary path used while saving
     */
    static QString tempPathFor(const QString& filePath);
};

#endif // RECORDSHEET_H
