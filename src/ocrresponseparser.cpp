#include "ocrresponseparser.h"
#include "boxsidecar.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>

QString OcrResponseParser::stripCodeFences(const QString& text)
{
    QString clean = text;
    clean.replace("```json", "");
    clean.replace("```", "");
    return clean.trimmed();
}

OcrResult OcrResponseParser::parse(const QString& text, const AppConfig& config)
{
    QString clean = stripCodeFences(text);
    if (clean.isEmpty()) {
        return OcrResult::failure(ErrorKind::UnrecognizedFormat, "Empty response from OCR provider");
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(clean.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return OcrResult::failure(ErrorKind::UnrecognizedFormat,
                                  QString("Invalid JSON response from API: %1").arg(parseError.errorString()));
    }
    if (!doc.isObject()) {
        return OcrResult::failure(ErrorKind::UnrecognizedFormat, "OCR response is not a JSON object");
    }

    OcrResult result;
    QJsonObject root = doc.object();

    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        const FieldDefinition* def = config.fieldForOcrKey(it.key());
        if (!def) {
            qDebug() << "OcrResponseParser: Ignoring unexpected key" << it.key();
            continue;
        }

        QJsonValue value = it.value();
        if (value.isObject()) {
            QJsonObject entry = value.toObject();
            QJsonValue text = entry.value("value");
            result.fields.insert(def->key, text.isString() ? text.toString().trimmed()
                                                           : text.toVariant().toString());

            QJsonValue boxValue = entry.value("bounding_box");
            if (!boxValue.isUndefined() && !boxValue.isNull()) {
                BoundingBox box;
                if (BoxSidecar::parseCoordinates(boxValue, def->key, box)) {
                    result.boxes.append(box);
                } else {
                    qWarning() << "OcrResponseParser: Malformed bounding box for" << it.key();
                }
            }
        } else if (value.isString()) {
            result.fields.insert(def->key, value.toString().trimmed());
        } else if (value.isNull()) {
            result.fields.insert(def->key, QString());
        } else {
            qWarning() << "OcrResponseParser: Unsupported value type for" << it.key();
        }
    }

    if (result.fields.isEmpty()) {
        return OcrResult::failure(ErrorKind::UnrecognizedFormat,
                                  "OCR response contained none of the expected fields");
    }

    result.success = true;
    return result;
}
