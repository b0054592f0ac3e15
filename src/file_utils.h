#pragma once

#include <string>
#include <filesystem>
#include <map>
#include <vector>

namespace runcage {

// Bounded file content (artifact captured from a sandbox working directory)
struct FileContent {
    std::string data;
    size_t size_bytes = 0;      // Size on disk, may exceed data.size()
    bool truncated = false;     // True when only a prefix was read
};

class FileUtils {
public:
    // Hash utilities
    static std::string sha256_string(const std::string& data);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Cryptographically random identifier of `bytes` random bytes, hex encoded
    static std::string random_hex(size_t bytes);

    // Read at most max_bytes of a regular file. Throws std::runtime_error when
    // the file cannot be opened or is not a regular file. Follows symlinks, so
    // only use it on caller supplied paths.
    static FileContent read_file_bounded(const std::string& filepath, size_t max_bytes);

    // Read `name` relative to an open directory descriptor without following
    // a symlink at `name`. Throws std::runtime_error on symlinks, non-regular
    // files and open failures.
    static FileContent read_file_at(int dirfd, const std::string& name, size_t max_bytes);

    // read_file_at on a freshly opened dirpath (which itself must not be a symlink)
    static FileContent read_file_in_directory(const std::string& dirpath,
                                              const std::string& name,
                                              size_t max_bytes);

    // Write a file with the given permission bits (creates or truncates)
    static void write_file(const std::string& filepath, const std::string& content,
                           std::filesystem::perms perms);

    // Create a directory only the current user can access
    static void create_private_directory(const std::string& dirpath);

    // Remove a directory tree. Returns false (and leaves what it could not
    // remove) instead of throwing.
    static bool remove_directory(const std::string& dirpath);

    // Read every regular file directly under dirpath, skipping `exclude`.
    // Symlinks are never followed. Total bytes read stay under max_total_bytes.
    static std::map<std::string, FileContent> read_directory_files(
        const std::string& dirpath,
        size_t max_total_bytes,
        const std::vector<std::string>& exclude = {}
    );
};

} // namespace runcage
