#ifndef CARDRENAMER_H
#define CARDRENAMER_H

#include <QString>
#include "operationerror.h"

class ImageSource;
class RecordStore;

/**
 * @brief Names a card image after its Ration Card ID and saves the data
 *
 * Renames the file on disk, re-keys its record (fields and boxes move with
 * it) and writes both artifacts.
 */
class CardRenamer
{
public:
    /**
     * Remove characters that are invalid in file names on any platform
     * @param id Raw Ration Card ID
     * @return Trimmed ID without \ / : * ? " < > |
     */
    static QString sanitizeFileStem(const QString& id);

    /**
     * Build the target file name for a record
     * @param id Raw Ration Card ID
     * @param currentName Current file name, its extension is kept
     * @return New file name, empty if the ID has no usable characters
     */
    static QString targetFileName(const QString& id, const QString& currentName);

    /**
     * Rename a record's image after its ID field and save
     * @param source Image listing of the open folder
     * @param store Record set of the open folder
     * @param fileName Record to rename
     * @param newName Output new file name
     * @param error Output error
     * @return true if the file was renamed (or already named correctly) and saved
     */
    static bool apply(ImageSource& source, RecordStore& store, const QString& fileName,
                      QString* newName = nullptr, OperationError* error = nullptr);

    static const QString ID_FIELD_KEY;
};

#endif // CARDRENAMER_H
