#ifndef TOOLRUNNER_H
#define TOOLRUNNER_H

#include <QByteArray>
#include <QProcess>
#include <QString>
#include <QStringList>

#include "mediatypes.h"

struct ToolResult
{
    bool started = false;
    bool timedOut = false;
    bool crashed = false;
    int exitCode = -1;
    QProcess::ProcessError processError = QProcess::UnknownError;
    QByteArray standardOutput;
    QByteArray standardError;
    QString errorString;

    bool succeeded() const { return started && !timedOut && !crashed && exitCode == 0; }
};

struct ToolFailure
{
    Disposition category = Disposition::None;
    QString message;
};

class ToolRunner
{
public:
    explicit ToolRunner(const QString &program = QString());

    QString program() const;
    void setProgram(const QString &program);

    // Resolved absolute executable, empty when the program cannot be found.
    QString resolvedPath() const;
    bool isAvailable() const;

    ToolResult run(const QStringList &arguments, int timeoutMs) const;

private:
    QString m_program;
};

// Maps a failed invocation onto a disposition. Structured signals (start
// failure, enforced timeout) win; stderr/stdout text is only consulted when
// the process ran and exited unsuccessfully.
ToolFailure classifyToolFailure(const QString &toolName, const ToolResult &result);
Disposition classifyErrorText(const QString &toolName, const QString &text);

#endif // TOOLRUNNER_H
