#include "toolrunner.h"

#include <QDebug>
#include <QFileInfo>
#include <QStandardPaths>

#include <initializer_list>

namespace {
constexpr int kKillGraceMs = 2000;

bool containsAny(const QString &haystack, std::initializer_list<const char *> needles)
{
    for (const char *needle : needles) {
        if (haystack.contains(QLatin1String(needle))) {
            return true;
        }
    }
    return false;
}

QString firstLine(const QByteArray &text)
{
    const QString decoded = QString::fromLocal8Bit(text).trimmed();
    const int newline = decoded.indexOf(QLatin1Char('\n'));
    return newline < 0 ? decoded : decoded.left(newline).trimmed();
}
}

ToolRunner::ToolRunner(const QString &program)
    : m_program(program)
{
}

QString ToolRunner::program() const
{
    return m_program;
}

void ToolRunner::setProgram(const QString &program)
{
    m_program = program;
}

QString ToolRunner::resolvedPath() const
{
    if (m_program.isEmpty()) {
        return QString();
    }
    const QFileInfo info(m_program);
    if (info.isAbsolute()) {
        return (info.exists() && info.isExecutable()) ? info.absoluteFilePath() : QString();
    }
    return QStandardPaths::findExecutable(m_program);
}

bool ToolRunner::isAvailable() const
{
    return !resolvedPath().isEmpty();
}

ToolResult ToolRunner::run(const QStringList &arguments, int timeoutMs) const
{
    ToolResult result;

    const QString executable = resolvedPath();
    if (executable.isEmpty()) {
        result.processError = QProcess::FailedToStart;
        result.errorString = QStringLiteral("%1 not found in PATH").arg(m_program);
        return result;
    }

    QProcess process;
    process.setProgram(executable);
    process.setArguments(arguments);
    process.start(QIODevice::ReadOnly);
    if (!process.waitForStarted()) {
        result.processError = process.error();
        result.errorString = process.errorString();
        return result;
    }
    result.started = true;

    if (!process.waitForFinished(timeoutMs)) {
        if (process.state() != QProcess::NotRunning) {
            qWarning() << m_program << "exceeded" << timeoutMs << "ms, terminating";
            result.timedOut = true;
            process.kill();
            process.waitForFinished(kKillGraceMs);
        }
    }

    result.standardOutput = process.readAllStandardOutput();
    result.standardError = process.readAllStandardError();
    result.processError = process.error();
    if (!result.timedOut) {
        result.crashed = process.exitStatus() == QProcess::CrashExit;
        result.exitCode = process.exitCode();
    }
    if (!result.succeeded()) {
        result.errorString = process.errorString();
    }
    return result;
}

ToolFailure classifyToolFailure(const QString &toolName, const ToolResult &result)
{
    ToolFailure failure;
    if (result.succeeded()) {
        return failure;
    }

    if (!result.started) {
        failure.category = Disposition::MissingTool;
        failure.message = QStringLiteral("%1 could not be started: %2").arg(toolName, result.errorString);
        return failure;
    }

    if (result.timedOut) {
        failure.category = Disposition::Timeout;
        failure.message = QStringLiteral("%1 timed out").arg(toolName);
        return failure;
    }

    QString detail = firstLine(result.standardError);
    if (detail.isEmpty()) {
        detail = firstLine(result.standardOutput);
    }
    if (result.crashed) {
        failure.category = Disposition::Corrupted;
        failure.message = QStringLiteral("%1 crashed: %2").arg(toolName, detail.isEmpty() ? result.errorString : detail);
        return failure;
    }

    const QString combined = QString::fromLocal8Bit(result.standardError + '\n' + result.standardOutput);
    failure.category = classifyErrorText(toolName, combined);
    failure.message = detail.isEmpty()
        ? QStringLiteral("%1 exited with code %2").arg(toolName).arg(result.exitCode)
        : QStringLiteral("%1 exited with code %2: %3").arg(toolName).arg(result.exitCode).arg(detail);
    return failure;
}

Disposition classifyErrorText(const QString &toolName, const QString &text)
{
    const QString lowered = text.toLower();

    if (containsAny(lowered, {"timeout", "timed out"})) {
        return Disposition::Timeout;
    }
    if (containsAny(lowered, {"permission", "denied", "read-only file system"})) {
        return Disposition::PermissionDenied;
    }
    if (lowered.contains(QLatin1String("file not found"))) {
        return Disposition::Corrupted;
    }
    if (lowered.contains(QLatin1String("not found"))
        && (lowered.contains(toolName.toLower()) || containsAny(lowered, {"exiftool", "ffmpeg", "ffprobe", "command"}))) {
        return Disposition::MissingTool;
    }
    if (containsAny(lowered, {"not a valid", "corrupt", "invalid data", "moov atom", "truncated",
                              "end of file", "file format error"})) {
        return Disposition::Corrupted;
    }
    // "can't currently write", "unknown file type" and anything unrecognized
    return Disposition::UnsupportedFormat;
}
