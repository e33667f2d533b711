#include "geminiocrengine.h"
#include "ocrresponseparser.h"
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QEventLoop>
#include <QTimer>
#include <QElapsedTimer>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QDebug>

GeminiOcrEngine::GeminiOcrEngine(const AppConfig& config)
    : m_config(config)
{
}

QString GeminiOcrEngine::name() const
{
    return QString("Gemini (%1)").arg(m_config.modelName());
}

QUrl GeminiOcrEngine::requestUrl() const
{
    QString base = m_config.endpoint;
    while (base.endsWith('/')) {
        base.chop(1);
    }
    return QUrl(QString("%1/%2:generateContent").arg(base, m_config.modelName()));
}

QByteArray GeminiOcrEngine::buildRequestBody(const QString& prompt, const QByteArray& imageBytes,
                                             const QString& mimeType)
{
    QJsonObject textPart;
    textPart["text"] = prompt;

    QJsonObject inlineData;
    inlineData["mime_type"] = mimeType;
    inlineData["data"] = QString::fromLatin1(imageBytes.toBase64());

    QJsonObject imagePart;
    imagePart["inline_data"] = inlineData;

    QJsonObject content;
    content["parts"] = QJsonArray({textPart, imagePart});

    QJsonObject generationConfig;
    generationConfig["response_mime_type"] = "application/json";

    QJsonObject payload;
    payload["contents"] = QJsonArray({content});
    payload["generationConfig"] = generationConfig;

    return QJsonDocument(payload).toJson(QJsonDocument::Compact);
}

QString GeminiOcrEngine::extractResponseText(const QByteArray& body, OperationError* error)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setOperationError(error, ErrorKind::UnrecognizedFormat, "Invalid response envelope from Gemini");
        return QString();
    }

    QJsonObject root = doc.object();
    QJsonArray candidates = root.value("candidates").toArray();
    if (candidates.isEmpty()) {
        QString reason = root.value("promptFeedback").toObject().value("blockReason").toString();
        setOperationError(error, ErrorKind::UnrecognizedFormat,
                          reason.isEmpty() ? QString("Gemini returned no candidates")
                                           : QString("Request blocked: %1").arg(reason));
        return QString();
    }

    QString text;
    QJsonArray parts = candidates.at(0).toObject().value("content").toObject().value("parts").toArray();
    for (const QJsonValue& part : parts) {
        text += part.toObject().value("text").toString();
    }

    if (text.trimmed().isEmpty()) {
        QString finish = candidates.at(0).toObject().value("finishReason").toString();
        setOperationError(error, ErrorKind::UnrecognizedFormat,
                          QString("Gemini returned an empty answer (finish reason: %1)")
                              .arg(finish.isEmpty() ? "unknown" : finish));
        return QString();
    }
    return text;
}

QString GeminiOcrEngine::apiErrorMessage(const QByteArray& body)
{
    QJsonObject err = QJsonDocument::fromJson(body).object().value("error").toObject();
    return err.value("message").toString();
}

ErrorKind GeminiOcrEngine::classifyFailure(int httpStatus, const QByteArray& body)
{
    QJsonObject err = QJsonDocument::fromJson(body).object().value("error").toObject();
    QString status = err.value("status").toString();
    QString message = err.value("message").toString();

    QString reason;
    for (const QJsonValue& detail : err.value("details").toArray()) {
        QString r = detail.toObject().value("reason").toString();
        if (!r.isEmpty()) {
            reason = r;
            break;
        }
    }

    if (httpStatus == 0) {
        return ErrorKind::Network;
    }
    if (httpStatus == 401 || httpStatus == 403 ||
        status == "UNAUTHENTICATED" || status == "PERMISSION_DENIED" ||
        reason == "API_KEY_INVALID" ||
        (httpStatus == 400 && message.contains("API key", Qt::CaseInsensitive))) {
        return ErrorKind::Auth;
    }
    if (httpStatus == 429 || status == "RESOURCE_EXHAUSTED") {
        return ErrorKind::Quota;
    }
    if (httpStatus >= 500) {
        return ErrorKind::Network;
    }
    if (httpStatus >= 400) {
        return ErrorKind::UnrecognizedFormat;
    }
    return ErrorKind::Network;
}

OcrResult GeminiOcrEngine::recognize(const QByteArray& imageBytes, const QString& mimeType)
{
    if (m_config.apiKey.isEmpty()) {
        return OcrResult::failure(ErrorKind::Auth, "GEMINI_API_KEY environment variable not set");
    }
    if (m_config.modelName().isEmpty()) {
        return OcrResult::failure(ErrorKind::Auth, "No OCR model configured");
    }

    QNetworkAccessManager netman;
    QNetworkRequest req(requestUrl());
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    req.setRawHeader("x-goog-api-key", m_config.apiKey.toUtf8());

    QElapsedTimer timer;
    timer.start();

    QNetworkReply *reply = netman.post(req, buildRequestBody(m_config.prompt, imageBytes, mimeType));

    bool timedOut = false;
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    QObject::connect(&timeout, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        reply->abort();
    });
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timeout.start(m_config.requestTimeoutMs);
    loop.exec();
    timeout.stop();

    int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    QByteArray body = reply->readAll();
    QNetworkReply::NetworkError netError = reply->error();
    QString netErrorString = reply->errorString();
    reply->deleteLater();

    qDebug() << "GeminiOcrEngine: HTTP" << httpStatus << "in" << timer.elapsed() << "ms";

    if (timedOut) {
        return OcrResult::failure(ErrorKind::Network,
                                  QString("OCR request timed out after %1 s").arg(m_config.requestTimeoutMs / 1000));
    }

    if (netError != QNetworkReply::NoError || httpStatus >= 400) {
        ErrorKind kind = classifyFailure(httpStatus, body);
        QString message = apiErrorMessage(body);
        if (message.isEmpty()) {
            message = netErrorString;
        }
        return OcrResult::failure(kind, httpStatus > 0
                                            ? QString("HTTP %1: %2").arg(httpStatus).arg(message)
                                            : message);
    }

    OperationError envelopeError;
    QString text = extractResponseText(body, &envelopeError);
    if (envelopeError.isError()) {
        return OcrResult::failure(envelopeError.kind, envelopeError.message);
    }

    return OcrResponseParser::parse(text, m_config);
}
