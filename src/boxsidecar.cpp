#include "boxsidecar.h"
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonArray>
#include <QJsonParseError>
#include <QtMath>
#include <QDebug>

bool BoxSidecar::parseCoordinates(const QJsonValue& value, const QString& field, BoundingBox& box)
{
    if (!value.isArray()) {
        return false;
    }
    QJsonArray coords = value.toArray();
    if (coords.size() != 4) {
        return false;
    }
    for (const QJsonValue& c : coords) {
        if (!c.isDouble()) {
            return false;
        }
    }

    box.field = field;
    box.yMin = qRound(coords.at(0).toDouble());
    box.xMin = qRound(coords.at(1).toDouble());
    box.yMax = qRound(coords.at(2).toDouble());
    box.xMax = qRound(coords.at(3).toDouble());
    return true;
}

bool BoxSidecar::load(const QString& filePath, const AppConfig& config,
                      BoxMap& boxes, OperationError* error)
{
    boxes.clear();

    QFile file(filePath);
    if (!file.exists()) {
        setOperationError(error, ErrorKind::NotFound,
                          QString("Box sidecar not found: %1").arg(filePath));
        return false;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        ErrorKind kind = (file.error() == QFileDevice::PermissionsError)
                             ? ErrorKind::Permission : ErrorKind::IOError;
        setOperationError(error, kind,
                          QString("Failed to open box sidecar %1: %2").arg(filePath, file.errorString()));
        return false;
    }

    QByteArray data = file.readAll();
    file.close();

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        setOperationError(error, ErrorKind::CorruptData,
                          QString("Box sidecar %1 is not valid JSON: %2")
                              .arg(filePath, parseError.errorString()));
        return false;
    }

    if (!doc.isObject()) {
        setOperationError(error, ErrorKind::CorruptData,
                          QString("Box sidecar %1: root is not a JSON object").arg(filePath));
        return false;
    }

    QJsonObject root = doc.object();
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        const QString fileName = it.key();
        QList<BoundingBox> list;

        if (it.value().isArray()) {
            for (const QJsonValue& entry : it.value().toArray()) {
                QJsonObject obj = entry.toObject();
                BoundingBox box;
                if (!parseCoordinates(obj.value("box"), obj.value("field").toString(), box) ||
                    box.field.isEmpty()) {
                    qWarning() << "BoxSidecar: Skipping malformed box for" << fileName;
                    continue;
                }
                list.append(box);
            }
        } else if (it.value().isObject()) {
            // Legacy layout: OCR key -> coordinates
            QJsonObject legacy = it.value().toObject();
            for (auto field = legacy.constBegin(); field != legacy.constEnd(); ++field) {
                const FieldDefinition* def = config.fieldForOcrKey(field.key());
                QString key = def ? def->key : field.key();
                BoundingBox box;
                if (!parseCoordinates(field.value(), key, box)) {
                    qWarning() << "BoxSidecar: Skipping malformed legacy box" << field.key() << "for" << fileName;
                    continue;
                }
                list.append(box);
            }
        } else {
            setOperationError(error, ErrorKind::CorruptData,
                              QString("Box sidecar %1: unexpected entry for %2").arg(filePath, fileName));
            boxes.clear();
            return false;
        }

        boxes.insert(fileName, list);
    }

    qDebug() << "BoxSidecar: Loaded boxes for" << boxes.size() << "images from" << filePath;
    return true;
}

bool BoxSidecar::save(const QString& filePath, const BoxMap& boxes, OperationError* error)
{
    QJsonObject root;
    for (auto it = boxes.constBegin(); it != boxes.constEnd(); ++it) {
        QJsonArray list;
        for (const BoundingBox& box : it.value()) {
            list.append(boxToJson(box));
        }
        root[it.key()] = list;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        ErrorKind kind = (file.error() == QFileDevice::PermissionsError)
                             ? ErrorKind::Permission : ErrorKind::IOError;
        setOperationError(error, kind,
                          QString("Failed to open box sidecar %1 for writing: %2")
                              .arg(filePath, file.errorString()));
        return false;
    }

    QByteArray data = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        setOperationError(error, ErrorKind::IOError,
                          QString("Failed to write box sidecar %1: %2").arg(filePath, file.errorString()));
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        ErrorKind kind = (file.error() == QFileDevice::PermissionsError)
                             ? ErrorKind::Permission : ErrorKind::IOError;
        setOperationError(error, kind,
                          QString("Failed to commit box sidecar %1: %2").arg(filePath, file.errorString()));
        return false;
    }

    return true;
}

QJsonObject BoxSidecar::boxToJson(const BoundingBox& box)
{
    QJsonObject json;
    json["field"] = box.field;
    json["box"] = QJsonArray({box.yMin, box.xMin, box.yMax, box.xMax});
    return json;
}
