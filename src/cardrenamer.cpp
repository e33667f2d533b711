#include "cardrenamer.h"
#include "imagesource.h"
#include "recordstore.h"
#include <QFileInfo>
#include <QRegularExpression>
#include <QDebug>

const QString CardRenamer::ID_FIELD_KEY = "ration_card_id";

QString CardRenamer::sanitizeFileStem(const QString& id)
{
    static const QRegularExpression invalid(R"([\\/:*?"<>|])");
    QString clean = id;
    clean.remove(invalid);
    return clean.trimmed();
}

QString CardRenamer::targetFileName(const QString& id, const QString& currentName)
{
    QString stem = sanitizeFileStem(id);
    if (stem.isEmpty()) {
        return QString();
    }

    QString suffix = QFileInfo(currentName).suffix();
    return suffix.isEmpty() ? stem : stem + "." + suffix;
}

bool CardRenamer::apply(ImageSource& source, RecordStore& store, const QString& fileName,
                        QString* newName, OperationError* error)
{
    const CardRecord* record = store.getRecord(fileName);
    if (!record) {
        setOperationError(error, ErrorKind::NotFound, QString("No record for %1").arg(fileName));
        return false;
    }

    QString target = targetFileName(record->value(ID_FIELD_KEY), fileName);
    if (target.isEmpty()) {
        setOperationError(error, ErrorKind::UnrecognizedFormat,
                          "Ration Card ID is empty, cannot name the image after it");
        return false;
    }

    if (target != fileName) {
        if (store.contains(target)) {
            setOperationError(error, ErrorKind::IOError,
                              QString("Another record is already named %1").arg(target));
            return false;
        }
        if (!source.renameFile(fileName, target, error)) {
            return false;
        }
        if (!store.renameRecord(fileName, target)) {
            // Keep disk and records consistent
            OperationError rollbackError;
            if (!source.renameFile(target, fileName, &rollbackError)) {
                qCritical() << "CardRenamer: Rollback failed:" << rollbackError.toString();
            }
            setOperationError(error, ErrorKind::IOError,
                              QString("Could not re-key record %1 as %2").arg(fileName, target));
            return false;
        }
        qInfo() << "CardRenamer: Renamed" << fileName << "to" << target;
    }

    if (newName) {
        *newName = target;
    }

    return store.save(source.folderPath(), error);
}
