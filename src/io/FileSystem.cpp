#include "io/FileSystem.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include "core/Errors.h"

namespace ntm {

static std::string ToForwardSlashes(const std::string& in) {
    std::string s = in;
    std::replace(s.begin(), s.end(), '\\', '/');
    return s;
}

std::string NormalizePath(const std::string& path) {
    std::string s = ToForwardSlashes(path);
    // Collapse duplicate '/' and drop "./" segments
    std::string out; out.reserve(s.size());
    bool lastWasSlash = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '/') {
            if (!lastWasSlash) out.push_back('/');
            lastWasSlash = true;
            continue;
        }
        bool segmentStart = out.empty() || lastWasSlash;
        if (c == '.' && segmentStart && (i + 1 == s.size() || s[i + 1] == '/')) {
            // skip "." segment and the slash that follows it
            if (i + 1 < s.size()) ++i;
            continue;
        }
        out.push_back(c);
        lastWasSlash = false;
    }
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

std::string ParentPath(const std::string& path) {
    std::string key = NormalizePath(path);
    auto pos = key.rfind('/');
    if (pos == std::string::npos) return {};
    if (pos == 0) return "/";
    return key.substr(0, pos);
}

// ---------------- Disk ----------------
std::string DiskFileStore::ReadTextFile(const std::string& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw IOError("Failed to open file", path);
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) throw IOError("Failed to read file", path);
    return text;
}

void DiskFileStore::WriteTextFile(const std::string& path, const std::string& contents) {
    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path() && !std::filesystem::is_directory(p.parent_path(), ec))
        throw IOError("Output directory does not exist", p.parent_path().string());

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw IOError("Failed to open file for writing", path);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out) throw IOError("Failed to write file", path);
}

bool DiskFileStore::Exists(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

void DiskFileStore::CreateDirectories(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) throw IOError("Failed to create directory (" + ec.message() + ")", path);
}

// ---------------- Memory ----------------
std::string MemoryFileStore::ReadTextFile(const std::string& path) const {
    auto it = m_Files.find(NormalizePath(path));
    if (it == m_Files.end()) throw IOError("Failed to open file", path);
    return it->second;
}

void MemoryFileStore::WriteTextFile(const std::string& path, const std::string& contents) {
    std::string key = NormalizePath(path);
    std::string parent = ParentPath(key);
    if (!parent.empty() && parent != "/" && !m_Directories.count(parent))
        throw IOError("Output directory does not exist", parent);
    if (m_Directories.count(key)) throw IOError("Path is a directory", path);
    m_Files[key] = contents;
}

bool MemoryFileStore::Exists(const std::string& path) const {
    std::string key = NormalizePath(path);
    return m_Files.count(key) > 0 || m_Directories.count(key) > 0;
}

void MemoryFileStore::CreateDirectories(const std::string& path) {
    std::string key = NormalizePath(path);
    while (!key.empty() && key != "/") {
        if (m_Files.count(key)) throw IOError("Path is a file", key);
        m_Directories.insert(key);
        key = ParentPath(key);
    }
}

} // namespace ntm
