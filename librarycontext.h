#ifndef LIBRARYCONTEXT_H
#define LIBRARYCONTEXT_H

#include <QString>
#include <QStringList>

#include <memory>

#include "appconfig.h"
#include "assetstore.h"
#include "capturedateextractor.h"
#include "metadatanormalizer.h"
#include "trashbin.h"

class MetadataTool;

// Everything an ingestion operation needs to know about one library: where
// it lives, its store connection, its trash and the external tools. Owned by
// the thread that runs the operation.
class LibraryContext
{
public:
    explicit LibraryContext(const QString &rootPath, const AppConfig &config = AppConfig());
    ~LibraryContext();

    // Constructing a context has no side effects; open() creates the
    // reserved directories and the database when they are missing.
    bool open(QString *errorMessage = nullptr);
    void close();
    bool isOpen() const;

    static bool isLibrary(const QString &rootPath);
    // Splits command operands into the library and the rest. The first
    // operand names the library unless configuredLibrary is set and that
    // operand is not a library itself.
    static QString splitLibraryArgument(const QStringList &arguments,
                                        const QString &configuredLibrary,
                                        QStringList *operands);
    static QStringList reservedDirectoryNames();
    static QString databaseFileName();

    const AppConfig &config() const;
    QString rootPath() const;
    QString databasePath() const;
    QString trashDirectory() const;
    QString stagingDirectory() const;
    QString logDirectory() const;
    QString backupDirectory() const;
    QString lockFilePath() const;

    QString absolutePath(const QString &relativePath) const;
    QString relativePath(const QString &absolutePath) const;
    bool isInsideLibrary(const QString &absolutePath) const;

    AssetStore *store();
    const AssetStore *store() const;
    TrashBin *trash();

    void setTools(const std::shared_ptr<MetadataTool> &imageTool, const std::shared_ptr<MetadataTool> &videoTool);
    const MetadataTool *imageTool() const;
    const MetadataTool *videoTool() const;
    const MetadataTool *toolFor(const QString &filePath) const;
    const MetadataNormalizer &normalizer() const;
    const CaptureDateExtractor &extractor() const;

    // Copies the database into .db_backups/, keeping the newest backups.
    bool backupDatabase(const QString &reason, QString *errorMessage = nullptr);

private:
    Q_DISABLE_COPY(LibraryContext)

    void rebuildToolUsers();

    AppConfig m_config;
    QString m_rootPath;
    AssetStore m_store;
    std::unique_ptr<TrashBin> m_trash;
    std::shared_ptr<MetadataTool> m_imageTool;
    std::shared_ptr<MetadataTool> m_videoTool;
    std::unique_ptr<MetadataNormalizer> m_normalizer;
    std::unique_ptr<CaptureDateExtractor> m_extractor;
};

#endif // LIBRARYCONTEXT_H
