#ifndef OCRRESPONSEPARSER_H
#define OCRRESPONSEPARSER_H

#include <QString>
#include "configmanager.h"
#include "ocrengine.h"

/**
 * @brief Turns the model's JSON answer into record fields and boxes
 *
 * Expected shape, keyed by the OCR keys of the field catalog:
 *
 *   { "ration_card_id": { "value": "PHH 0046010534", "bounding_box": [383, 251, 404, 446] }, ... }
 *
 * A bare string value per key is accepted as well. Keys that do not belong
 * to the catalog are ignored.
 */
class OcrResponseParser
{
public:
    /**
     * Remove ```json fences and surrounding whitespace
     * @param text Raw model text
     * @return Bare JSON text
     */
    static QString stripCodeFences(const QString& text);

    /**
     * Parse the model text
     * @param text Raw model text
     * @param config Field catalog
     * @return Successful result with fields and boxes, or an UnrecognizedFormat failure
     */
    static OcrResult parse(const QString& text, const AppConfig& config);
};

#endif // OCRRESPONSEPARSER_H
