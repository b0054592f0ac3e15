#include "file_utils.h"
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <cerrno>
#include <fcntl.h>
#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace runcage {

namespace fs = std::filesystem;

std::string FileUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string FileUtils::sha256_string(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string FileUtils::random_hex(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed to produce random identifier");
    }
    return bytes_to_hex(buffer.data(), buffer.size());
}

namespace {

// Owns a raw descriptor for the length of one read
struct ScopedFd {
    int fd;
    explicit ScopedFd(int f) : fd(f) {}
    ~ScopedFd() { if (fd >= 0) ::close(fd); }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;
};

// Bounded read of an already opened descriptor. Only regular files qualify;
// FIFOs, devices and directories are refused before any read happens.
FileContent read_fd_bounded(int fd, size_t max_bytes, const std::string& name) {
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        throw std::runtime_error("Failed to stat file: " + name);
    }
    if (!S_ISREG(st.st_mode)) {
        throw std::runtime_error("Not a regular file: " + name);
    }

    FileContent content;
    content.size_bytes = static_cast<size_t>(st.st_size);

    char buffer[8192];
    while (content.data.size() < max_bytes) {
        size_t want = std::min(sizeof(buffer), max_bytes - content.data.size());
        ssize_t got = ::read(fd, buffer, want);
        if (got < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("Failed to read file: " + name);
        }
        if (got == 0) break;
        content.data.append(buffer, static_cast<size_t>(got));
    }

    // Anything left past the bound means we only hold a prefix
    char extra;
    ssize_t more;
    do {
        more = ::read(fd, &extra, 1);
    } while (more < 0 && errno == EINTR);
    content.truncated = more > 0;
    if (content.size_bytes < content.data.size()) {
        content.size_bytes = content.data.size();
    }
    return content;
}

} // namespace

FileContent FileUtils::read_file_bounded(const std::string& filepath, size_t max_bytes) {
    ScopedFd file(::open(filepath.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC));
    if (file.fd < 0) {
        throw std::runtime_error("Failed to open file: " + filepath);
    }
    return read_fd_bounded(file.fd, max_bytes, filepath);
}

FileContent FileUtils::read_file_at(int dirfd, const std::string& name, size_t max_bytes) {
    // O_NOFOLLOW: a symlink swapped in for `name` fails with ELOOP instead of
    // being resolved against the host filesystem
    ScopedFd file(::openat(dirfd, name.c_str(),
                           O_RDONLY | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC));
    if (file.fd < 0) {
        throw std::runtime_error("Failed to open file: " + name);
    }
    return read_fd_bounded(file.fd, max_bytes, name);
}

FileContent FileUtils::read_file_in_directory(const std::string& dirpath,
                                              const std::string& name,
                                              size_t max_bytes) {
    ScopedFd dir(::open(dirpath.c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC));
    if (dir.fd < 0) {
        throw std::runtime_error("Failed to open directory: " + dirpath);
    }
    return read_file_at(dir.fd, name, max_bytes);
}

void FileUtils::write_file(const std::string& filepath, const std::string& content,
                           fs::perms perms) {
    std::ofstream out(filepath, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to create file: " + filepath);
    }
    out << content;
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write file: " + filepath);
    }
    fs::permissions(filepath, perms, fs::perm_options::replace);
}

void FileUtils::create_private_directory(const std::string& dirpath) {
    fs::create_directories(dirpath);
    fs::permissions(dirpath, fs::perms::owner_all, fs::perm_options::replace);
}

bool FileUtils::remove_directory(const std::string& dirpath) {
    std::error_code ec;
    if (!fs::exists(dirpath, ec)) {
        return true;
    }
    fs::remove_all(dirpath, ec);
    return !ec;
}

std::map<std::string, FileContent> FileUtils::read_directory_files(
    const std::string& dirpath,
    size_t max_total_bytes,
    const std::vector<std::string>& exclude
) {
    std::map<std::string, FileContent> result;

    ScopedFd dir(::open(dirpath.c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC));
    if (dir.fd < 0) {
        return result;
    }

    // fdopendir takes ownership of its descriptor, so hand it a duplicate
    int listing_fd = ::fcntl(dir.fd, F_DUPFD_CLOEXEC, 0);
    if (listing_fd < 0) {
        return result;
    }
    DIR* listing = ::fdopendir(listing_fd);
    if (!listing) {
        ::close(listing_fd);
        return result;
    }

    std::vector<std::string> names;
    while (dirent* entry = ::readdir(listing)) {
        std::string filename = entry->d_name;
        if (filename == "." || filename == "..") {
            continue;
        }
        if (std::find(exclude.begin(), exclude.end(), filename) != exclude.end()) {
            continue;
        }
        names.push_back(std::move(filename));
    }
    ::closedir(listing);
    std::sort(names.begin(), names.end());

    size_t remaining = max_total_bytes;
    for (const auto& filename : names) {
        try {
            // Symlinks and non-regular entries planted by the script are refused here
            FileContent content = read_file_at(dir.fd, filename, remaining);
            remaining -= content.data.size();
            result[filename] = std::move(content);
        } catch (const std::runtime_error&) {
            // Unreadable artifact: the collector falls back to stdout
            continue;
        }
    }

    return result;
}

} // namespace runcage
