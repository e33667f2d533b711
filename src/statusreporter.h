#ifndef STATUSREPORTER_H
#define STATUSREPORTER_H

#include <QObject>
#include <QString>
#include "operationerror.h"

/**
 * @brief Passive sink for application state transitions
 *
 * Keeps the last reported state, logs every transition and re-emits it
 * for the window's status bar and log.
 */
class StatusReporter : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Ready,
        Loading,
        OcrInProgress,
        OcrCompleted,
        Saved,
        Error
    };
    Q_ENUM(State)

    explicit StatusReporter(QObject *parent = nullptr);

    void report(State state, const QString& message);

    /**
     * Report an error as State::Error with "<kind>: <message>"
     */
    void reportError(const OperationError& error);

    State state() const { return m_state; }
    QString message() const { return m_message; }

    static QString stateName(State state);

signals:
    void statusChanged(StatusReporter::State state, const QString& message);

private:
    State m_state;
    QString m_message;
};

#endif // STATUSREPORTER_H
