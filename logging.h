#ifndef LOGGING_H
#define LOGGING_H

#include <QString>

namespace Logging {

// Mirrors every Qt message into filePath (appending), prefixed with an ISO
// timestamp and level. Messages still reach the previously installed
// handler. Returns false when the file cannot be opened.
bool installFileLog(const QString &filePath, QString *errorMessage = nullptr);
void uninstallFileLog();

QString currentLogFile();

} // namespace Logging

#endif // LOGGING_H
