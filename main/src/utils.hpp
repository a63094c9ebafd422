#pragma once

#include "exception.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 50);

// Cross-process exclusive lock on a lock file (RAII).
// Blocks until the lock is granted. The lock file is created or truncated on
// acquisition and deleted on release, so a leftover file from a crashed
// process never blocks a later acquisition.
class FileLock {
public:
    explicit FileLock(fs::path path);
    ~FileLock();
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    int lock_fd = -1;
};

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
std::string read_file(const fs::path& path);

// Writes `data` to a file that must not exist yet (O_EXCL).
// Returns false if the file already exists, throws on any other failure.
bool write_new_file(const fs::path& path, std::string_view data, unsigned int mode = 0644);

std::string trim(std::string_view s);
