#ifndef PATHDERIVER_H
#define PATHDERIVER_H

#include <QDateTime>
#include <QString>

#include <functional>

namespace PathDeriver {

struct DerivedPath
{
    QString folder;     // YYYY/YYYY-MM-DD
    QString fileName;   // img_YYYYMMDD_<shortHash>[_N].<ext>

    QString relativePath() const { return folder + QLatin1Char('/') + fileName; }
};

// Returns true when a library-relative path is already taken by something
// other than the file being placed.
using OccupancyCheck = std::function<bool(const QString &relativePath)>;

QString dateFolder(const QDateTime &captureDate);
QString baseName(const QDateTime &captureDate, const QString &contentHash);

DerivedPath derive(const QDateTime &captureDate,
                   const QString &contentHash,
                   const QString &extension,
                   const OccupancyCheck &isOccupied = OccupancyCheck());

// True when relativePath is the plain or suffixed canonical location for
// (captureDate, contentHash).
bool matchesDerivation(const QString &relativePath, const QDateTime &captureDate, const QString &contentHash);

} // namespace PathDeriver

#endif // PATHDERIVER_H
