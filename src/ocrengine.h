#ifndef OCRENGINE_H
#define OCRENGINE_H

#include <QString>
#include <QByteArray>
#include <QList>
#include <QMetaType>
#include "cardrecord.h"
#include "operationerror.h"

/**
 * Structure containing the outcome of one OCR request
 */
struct OcrResult {
    bool success;
    OperationError error;
    FieldMap fields;              // Keyed by field key, only the fields the provider returned
    QList<BoundingBox> boxes;

    OcrResult() : success(false) {}

    static OcrResult failure(ErrorKind kind, const QString& message) {
        OcrResult result;
        result.error = OperationError(kind, message);
        return result;
    }
};

/**
 * @brief Base class for OCR providers
 *
 * recognize() blocks until the provider answers and is called from the
 * background OCR thread, never from the GUI thread.
 */
class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    /**
     * Extract card fields from an encoded image
     * @param imageBytes Encoded image data
     * @param mimeType MIME type of imageBytes, e.g. "image/png"
     * @return Fields and boxes, or a failure classified as Network, Auth,
     *         Quota or UnrecognizedFormat
     */
    virtual OcrResult recognize(const QByteArray& imageBytes, const QString& mimeType) = 0;

    /**
     * Get a short provider name for logging
     */
    virtual QString name() const = 0;
};

Q_DECLARE_METATYPE(OcrResult)

#endif // OCRENGINE_H
