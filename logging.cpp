#include "logging.h"

#include "fileoperations.h"

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>

namespace {

QMutex s_mutex;
QFile *s_logFile = nullptr;
QtMessageHandler s_previousHandler = nullptr;

const char *levelName(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return "debug";
    case QtInfoMsg:
        return "info";
    case QtWarningMsg:
        return "warning";
    case QtCriticalMsg:
        return "critical";
    case QtFatalMsg:
        return "fatal";
    }
    return "debug";
}

void fileMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    {
        QMutexLocker locker(&s_mutex);
        if (s_logFile && s_logFile->isOpen()) {
            QTextStream stream(s_logFile);
            stream << QDateTime::currentDateTime().toString(Qt::ISODateWithMs)
                   << ' ' << levelName(type) << ' ' << message << '\n';
            stream.flush();
        }
    }

    if (s_previousHandler) {
        s_previousHandler(type, context, message);
    }
}

}

namespace Logging {

bool installFileLog(const QString &filePath, QString *errorMessage)
{
    if (!FileOperations::ensureDirectory(QFileInfo(filePath).absolutePath(), errorMessage)) {
        return false;
    }

    auto file = new QFile(filePath);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unable to open log file %1: %2").arg(filePath, file->errorString());
        }
        delete file;
        return false;
    }

    QMutexLocker locker(&s_mutex);
    const bool alreadyInstalled = s_logFile != nullptr;
    delete s_logFile;
    s_logFile = file;
    if (!alreadyInstalled) {
        s_previousHandler = qInstallMessageHandler(fileMessageHandler);
    }
    return true;
}

void uninstallFileLog()
{
    QMutexLocker locker(&s_mutex);
    if (!s_logFile) {
        return;
    }
    qInstallMessageHandler(s_previousHandler);
    s_previousHandler = nullptr;
    delete s_logFile;
    s_logFile = nullptr;
}

QString currentLogFile()
{
    QMutexLocker locker(&s_mutex);
    return s_logFile ? s_logFile->fileName() : QString();
}

} // namespace Logging
