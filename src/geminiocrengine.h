#ifndef GEMINIOCRENGINE_H
#define GEMINIOCRENGINE_H

#include <QString>
#include <QByteArray>
#include <QUrl>
#include "ocrengine.h"
#include "configmanager.h"

/**
 * @brief OCR through the Gemini generateContent REST endpoint
 *
 * Each call creates its own QNetworkAccessManager and waits on a local
 * event loop, so it can run on any thread that does not already own a
 * running loop for the same manager.
 */
class GeminiOcrEngine : public OcrEngine
{
public:
    explicit GeminiOcrEngine(const AppConfig& config);

    OcrResult recognize(const QByteArray& imageBytes, const QString& mimeType) override;
    QString name() const override;

    /**
     * Get the generateContent URL for the configured model
     */
    QUrl requestUrl() const;

    /**
     * Build the JSON request body
     * @param prompt Extraction prompt
     * @param imageBytes Encoded image
     * @param mimeType MIME type of the image
     * @return Serialized JSON
     */
    static QByteArray buildRequestBody(const QString& prompt, const QByteArray& imageBytes,
                                       const QString& mimeType);

    /**
     * Pull the model text out of a generateContent response
     * @param body Response body
     * @param error Output error (UnrecognizedFormat)
     * @return Concatenated candidate text, empty on failure
     */
    static QString extractResponseText(const QByteArray& body, OperationError* error = nullptr);

    /**
     * Classify a failed HTTP exchange
     * @param httpStatus HTTP status code, 0 if no response was received
     * @param body Response body, may hold a Google API error object
     * @return Auth, Quota, Network or UnrecognizedFormat
     */
    static ErrorKind classifyFailure(int httpStatus, const QByteArray& body);

private:
    static QString apiErrorMessage(const QByteArray& body);

    AppConfig m_config;
};

#endif // GEMINIOCRENGINE_H
