#pragma once
#include <map>
#include <set>
#include <string>

namespace ntm {

// Read/write capability the core goes through for every file it touches.
// Failures throw IOError.
class IFileStore {
public:
    virtual ~IFileStore() = default;

    virtual std::string ReadTextFile(const std::string& path) const = 0;
    virtual void WriteTextFile(const std::string& path, const std::string& contents) = 0;
    virtual bool Exists(const std::string& path) const = 0;
    virtual void CreateDirectories(const std::string& path) = 0;
};

class DiskFileStore : public IFileStore {
public:
    static DiskFileStore& Instance() {
        static DiskFileStore fs; return fs;
    }

    std::string ReadTextFile(const std::string& path) const override;
    // Contents are written byte for byte (no newline translation).
    void WriteTextFile(const std::string& path, const std::string& contents) override;
    bool Exists(const std::string& path) const override;
    void CreateDirectories(const std::string& path) override;
};

// In-memory store for tests and for callers that assemble exports before
// handing them elsewhere. Writing requires the parent directory to exist,
// same as on disk.
class MemoryFileStore : public IFileStore {
public:
    std::string ReadTextFile(const std::string& path) const override;
    void WriteTextFile(const std::string& path, const std::string& contents) override;
    bool Exists(const std::string& path) const override;
    void CreateDirectories(const std::string& path) override;

    const std::map<std::string, std::string>& Files() const { return m_Files; }

private:
    std::map<std::string, std::string> m_Files;
    std::set<std::string> m_Directories;
};

// Convert a path into a normalized key: forward slashes, no "./" segments,
// no duplicate or trailing separators.
std::string NormalizePath(const std::string& path);

// Parent directory of a normalized path, empty when the path has none.
std::string ParentPath(const std::string& path);

} // namespace ntm
