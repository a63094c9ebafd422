#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    void check_tty() {
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }
    }

    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);
        check_tty();

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }

    RvmException io_error(const std::string& key, const fs::path& path, int err) {
        return RvmException(ErrorKind::Io, string_format(key, path.string()) + ": " + std::strerror(err));
    }
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void log_progress(const std::string& msg, double percentage, int bar_width) {
    std::lock_guard<std::mutex> lock(log_mutex);
    check_tty();
    if (!is_stdout_tty) {
        return;
    }

    int pos = static_cast<int>(bar_width * percentage / 100.0);

    std::cout << "\r" << COLOR_GREEN << "==> " << COLOR_WHITE << msg << " [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cout << "#";
        else if (i == pos) std::cout << ">";
        else std::cout << "-";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << percentage << "%" << COLOR_RESET << std::flush;
}

FileLock::FileLock(fs::path path) : path_(std::move(path)) {
    ensure_dir_exists(path_.parent_path());

    // Another holder may delete the file between our open() and flock().
    // Retry until the locked descriptor still refers to the file at path_.
    while (true) {
        lock_fd = open(path_.c_str(), O_CREAT | O_RDWR | O_TRUNC | O_CLOEXEC, 0644);
        if (lock_fd < 0) {
            throw io_error("error.create_file_failed", path_, errno);
        }

        int rc;
        do {
            rc = flock(lock_fd, LOCK_EX);
        } while (rc < 0 && errno == EINTR);
        if (rc < 0) {
            int err = errno;
            close(lock_fd);
            lock_fd = -1;
            throw io_error("error.lock_failed", path_, err);
        }

        struct stat fd_st;
        struct stat path_st;
        if (fstat(lock_fd, &fd_st) == 0 && stat(path_.c_str(), &path_st) == 0 &&
            fd_st.st_dev == path_st.st_dev && fd_st.st_ino == path_st.st_ino) {
            return;
        }
        close(lock_fd);
        lock_fd = -1;
    }
}

FileLock::~FileLock() {
    if (lock_fd != -1) {
        // Unlink while still holding the lock so no waiter can lock a file we are about to delete.
        unlink(path_.c_str());
        flock(lock_fd, LOCK_UN);
        close(lock_fd);
        lock_fd = -1;
    }
}

void ensure_dir_exists(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (!fs::create_directories(path, ec) && ec) {
            throw RvmException(ErrorKind::Io, string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    if (!fs::is_directory(path, ec)) {
        throw RvmException(ErrorKind::Io, string_format("error.path_not_dir", path.string()));
    }
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw io_error("error.open_file_failed", path, errno);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

bool write_new_file(const fs::path& path, std::string_view data, unsigned int mode) {
    int fd = open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, static_cast<mode_t>(mode));
    if (fd < 0) {
        if (errno == EEXIST) {
            return false;
        }
        throw io_error("error.create_file_failed", path, errno);
    }

    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = write(fd, p, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close(fd);
            throw io_error("error.write_file_failed", path, err);
        }
        p += written;
        remaining -= static_cast<size_t>(written);
    }

    // open() honours the umask; apply the requested mode explicitly.
    if (fchmod(fd, static_cast<mode_t>(mode)) != 0 || fsync(fd) != 0) {
        int err = errno;
        close(fd);
        throw io_error("error.write_file_failed", path, err);
    }
    if (close(fd) != 0) {
        throw io_error("error.write_file_failed", path, errno);
    }
    return true;
}

std::string trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}
