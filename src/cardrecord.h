#ifndef CARDRECORD_H
#define CARDRECORD_H

#include <QString>
#include <QList>
#include <QMap>
#include <QMetaType>

/**
 * Values keyed by field key (see FieldDefinition::key)
 */
typedef QMap<QString, QString> FieldMap;

enum class OcrState {
    NotAttempted,
    Succeeded,
    Failed
};

/**
 * @brief Region of the image an extracted field was read from
 *
 * Coordinates are on the 0-1000 normalized grid returned by the OCR
 * provider, in [y_min, x_min, y_max, x_max] order.
 */
struct BoundingBox {
    QString field;
    int yMin;
    int xMin;
    int yMax;
    int xMax;

    BoundingBox() : yMin(0), xMin(0), yMax(0), xMax(0) {}
    BoundingBox(const QString& field, int yMin, int xMin, int yMax, int xMax)
        : field(field), yMin(yMin), xMin(xMin), yMax(yMax), xMax(xMax) {}

    bool operator==(const BoundingBox& other) const {
        return field == other.field &&
               yMin == other.yMin && xMin == other.xMin &&
               yMax == other.yMax && xMax == other.xMax;
    }
    bool operator!=(const BoundingBox& other) const { return !(*this == other); }
};

/**
 * @brief Extracted and edited data for one card image
 */
struct CardRecord {
    QString fileName;
    FieldMap fields;
    QList<BoundingBox> boxes;
    bool dirty;
    OcrState ocrState;

    CardRecord() : dirty(false), ocrState(OcrState::NotAttempted) {}
    explicit CardRecord(const QString& fileName)
        : fileName(fileName), dirty(false), ocrState(OcrState::NotAttempted) {}

    /**
     * Get a field value, empty if never set
     */
    QString value(const QString& key) const {
        return fields.value(key);
    }

    /**
     * Check whether every field is empty and there are no boxes
     */
    bool isBlank() const {
        for (auto it = fields.cbegin(); it != fields.cend(); ++it) {
            if (!it.value().isEmpty()) {
                return false;
            }
        }
        return boxes.isEmpty();
    }

    bool operator==(const CardRecord& other) const {
        return fileName == other.fileName && fields == other.fields &&
               boxes == other.boxes && dirty == other.dirty &&
               ocrState == other.ocrState;
    }
    bool operator!=(const CardRecord& other) const { return !(*this == other); }
};

Q_DECLARE_METATYPE(BoundingBox)

#endif // CARDRECORD_H
