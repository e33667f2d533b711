#include "operationerror.h"
#include <QDebug>

QString OperationError::toString() const
{
    if (message.isEmpty()) {
        return errorKindName(kind);
    }
    return QString("%1: %2").arg(errorKindName(kind), message);
}

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::EmptyFolder:
            return "EmptyFolder";
        case ErrorKind::CorruptData:
            return "CorruptData";
        case ErrorKind::IOError:
            return "IOError";
        case ErrorKind::Permission:
            return "PermissionError";
        case ErrorKind::Network:
            return "NetworkError";
        case ErrorKind::Auth:
            return "AuthError";
        case ErrorKind::Quota:
            return "QuotaError";
        case ErrorKind::UnrecognizedFormat:
            return "UnrecognizedFormat";
        default:
            return "Unknown";
    }
}

void setOperationError(OperationError* error, ErrorKind kind, const QString& message)
{
    qWarning().noquote() << errorKindName(kind) + ":" << message;
    if (error) {
        error->kind = kind;
        error->message = message;
    }
}
