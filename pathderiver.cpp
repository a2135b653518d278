#include "pathderiver.h"

#include "contenthasher.h"

#include <QFileInfo>
#include <QRegularExpression>

namespace PathDeriver {

QString dateFolder(const QDateTime &captureDate)
{
    const QDate date = captureDate.date();
    return QStringLiteral("%1/%2").arg(date.toString(QStringLiteral("yyyy")),
                                       date.toString(QStringLiteral("yyyy-MM-dd")));
}

QString baseName(const QDateTime &captureDate, const QString &contentHash)
{
    return QStringLiteral("img_%1_%2").arg(captureDate.date().toString(QStringLiteral("yyyyMMdd")),
                                           ContentHasher::shortHash(contentHash));
}

DerivedPath derive(const QDateTime &captureDate,
                   const QString &contentHash,
                   const QString &extension,
                   const OccupancyCheck &isOccupied)
{
    QString suffix = extension.toLower();
    if (suffix.startsWith(QLatin1Char('.'))) {
        suffix.remove(0, 1);
    }
    const QString dotSuffix = suffix.isEmpty() ? QString() : QLatin1Char('.') + suffix;

    DerivedPath path;
    path.folder = dateFolder(captureDate);
    const QString base = baseName(captureDate, contentHash);
    path.fileName = base + dotSuffix;

    if (!isOccupied) {
        return path;
    }

    int counter = 1;
    while (isOccupied(path.relativePath())) {
        path.fileName = QStringLiteral("%1_%2%3").arg(base).arg(counter).arg(dotSuffix);
        ++counter;
    }
    return path;
}

bool matchesDerivation(const QString &relativePath, const QDateTime &captureDate, const QString &contentHash)
{
    const QFileInfo info(relativePath);
    if (info.path() != dateFolder(captureDate)) {
        return false;
    }
    const QRegularExpression pattern(
        QStringLiteral("^%1(_\\d+)?$").arg(QRegularExpression::escape(baseName(captureDate, contentHash))));
    return pattern.match(info.completeBaseName()).hasMatch();
}

} // namespace PathDeriver
