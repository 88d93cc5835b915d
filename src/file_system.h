#pragma once
#include <QString>

// Filesystem primitives consumed by the clipboard reconciler.
// Every mutating call returns false on failure and, when errorOut is given,
// stores a human-readable reason there. None of them overwrite an existing
// destination.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual bool exists(const QString& path) const = 0;
    virtual bool isDir(const QString& path) const = 0;

    // Single file: content plus modification time
    virtual bool copyFile(const QString& src, const QString& dst, QString* errorOut) = 0;
    // Directory tree: dst is created and must not exist beforehand
    virtual bool copyTree(const QString& src, const QString& dst, QString* errorOut) = 0;
    // Atomic rename; fails across devices
    virtual bool move(const QString& src, const QString& dst, QString* errorOut) = 0;

    virtual bool removeFile(const QString& path, QString* errorOut) = 0;
    virtual bool removeTree(const QString& path, QString* errorOut) = 0;
};

class LocalFileSystem : public FileSystem {
public:
    bool exists(const QString& path) const override;
    bool isDir(const QString& path) const override;

    bool copyFile(const QString& src, const QString& dst, QString* errorOut) override;
    bool copyTree(const QString& src, const QString& dst, QString* errorOut) override;
    bool move(const QString& src, const QString& dst, QString* errorOut) override;

    bool removeFile(const QString& path, QString* errorOut) override;
    bool removeTree(const QString& path, QString* errorOut) override;
};
