#include "statusreporter.h"
#include <QDebug>

StatusReporter::StatusReporter(QObject *parent)
    : QObject(parent),
      m_state(State::Ready)
{
}

void StatusReporter::report(State state, const QString& message)
{
    m_state = state;
    m_message = message;

    if (state == State::Error) {
        qWarning() << "StatusReporter:" << stateName(state) << "-" << message;
    } else {
        qInfo() << "StatusReporter:" << stateName(state) << "-" << message;
    }

    emit statusChanged(state, message);
}

void StatusReporter::reportError(const OperationError& error)
{
    report(State::Error, error.toString());
}

QString StatusReporter::stateName(State state)
{
    switch (state) {
        case State::Ready:         return "Ready";
        case State::Loading:       return "Loading";
        case State::OcrInProgress: return "OCR in progress";
        case State::OcrCompleted:  return "OCR completed";
        case State::Saved:         return "Saved";
        case State::Error:         return "Error";
    }
    return QString();
}
