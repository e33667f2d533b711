#ifndef BOXSIDECAR_H
#define BOXSIDECAR_H

#include <QString>
#include <QList>
#include <QMap>
#include <QJsonObject>
#include <QJsonValue>
#include "cardrecord.h"
#include "configmanager.h"
#include "operationerror.h"

typedef QMap<QString, QList<BoundingBox>> BoxMap;

/**
 * @brief Manager for the bbox_data.json sidecar file
 *
 * Stores the bounding boxes of every record keyed by image file name:
 *
 *   { "card001.jpg": [ { "field": "ration_card_id", "box": [383, 251, 404, 446] } ] }
 *
 * The older layout that maps OCR keys directly to box arrays is still
 * accepted on load:
 *
 *   { "card001.jpg": { "ration_card_id": [383, 251, 404, 446] } }
 */
class BoxSidecar
{
public:
    /**
     * @brief Load boxes from the sidecar
     * @param filePath Path to bbox_data.json
     * @param config Field catalog used to translate legacy OCR keys
     * @param boxes Output map of file name to boxes
     * @param error Output error (CorruptData if the JSON is malformed)
     * @return true if loaded successfully
     */
    static bool load(const QString& filePath, const AppConfig& config,
                     BoxMap& boxes, OperationError* error = nullptr);

    /**
     * @brief Write boxes to the sidecar through a temporary file
     * @param filePath Path to bbox_data.json
     * @param boxes Map of file name to boxes
     * @param error Output error (IOError or Permission)
     * @return true if saved successfully
     */
    static bool save(const QString& filePath, const BoxMap& boxes,
                     OperationError* error = nullptr);

    /**
     * @brief Parse a [y_min, x_min, y_max, x_max] array
     * @param value JSON value
     * @param field Field key to attach
     * @param box Output box
     * @return true if the value holds four numbers
     */
    static bool parseCoordinates(const QJsonValue& value, const QString& field, BoundingBox& box);

private:
    static QJsonObject boxToJson(const BoundingBox& box);
};

#endif // BOXSIDECAR_H
