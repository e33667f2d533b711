#ifndef OPERATIONERROR_H
#define OPERATIONERROR_H

#include <QString>
#include <QMetaType>

/**
 * Classification of every recoverable failure the application reports
 */
enum class ErrorKind {
    None,
    NotFound,
    EmptyFolder,
    CorruptData,
    IOError,
    Permission,
    Network,
    Auth,
    Quota,
    UnrecognizedFormat
};

/**
 * A classified failure with a message suitable for the status log
 */
struct OperationError {
    ErrorKind kind;
    QString message;

    OperationError() : kind(ErrorKind::None) {}
    OperationError(ErrorKind kind, const QString& message)
        : kind(kind), message(message) {}

    bool isError() const { return kind != ErrorKind::None; }

    /**
     * Render as "<kind>: <message>"
     */
    QString toString() const;
};

/**
 * Get a stable display name for an error kind
 * @param kind Error kind
 * @return Name such as "CorruptData"
 */
QString errorKindName(ErrorKind kind);

/**
 * Fill an optional out-parameter and log the failure
 * @param error Out-parameter, may be nullptr
 * @param kind Error kind
 * @param message Error message
 */
void setOperationError(OperationError* error, ErrorKind kind, const QString& message);

Q_DECLARE_METATYPE(OperationError)

#endif // OPERATIONERROR_H
