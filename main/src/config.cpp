#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/utsname.h>

#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

namespace {
    fs::path root_override;

    fs::path env_path(const char* name) {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') return {};
        return fs::path(value);
    }

    fs::path home_dir() {
        fs::path home = env_path("HOME");
        if (home.empty()) {
            throw RvmException(ErrorKind::Io, get_string("error.home_not_found"));
        }
        return home;
    }

    fs::path data_dir(const fs::path& home) {
#if defined(__APPLE__)
        return home / "Library" / "Application Support";
#else
        fs::path xdg = env_path("XDG_DATA_HOME");
        if (!xdg.empty() && xdg.is_absolute()) return xdg;
        return home / ".local" / "share";
#endif
    }
}

void set_root_path(const std::string& root_path) {
    root_override = fs::path(root_path).lexically_normal();
}

fs::path resolve_default_root() {
    fs::path from_env = env_path("RVM_ROOT");
    if (!from_env.empty()) return from_env;

    const fs::path home = home_dir();
    const fs::path legacy = home / ".rvm";
    std::error_code ec;
    if (fs::exists(legacy, ec)) return legacy;
    return data_dir(home) / "rvm";
}

fs::path get_root_dir() {
    fs::path root = root_override.empty() ? resolve_default_root() : root_override;
    ensure_dir_exists(root);
    return root;
}

Platform get_platform() {
#if defined(_WIN32)
    return Platform::Windows;
#else
    struct utsname buf;
    if (uname(&buf) != 0) {
        throw RvmException(ErrorKind::Io, get_string("error.get_arch_failed"));
    }
    const std::string os(buf.sysname);
    const std::string arch(buf.machine);

    if (os == "Linux" && arch == "x86_64") return Platform::Linux;
    if (os == "Darwin" && (arch == "x86_64" || arch == "arm64" || arch == "aarch64")) return Platform::Macos;
    throw PlatformNotSupportedError(os, arch);
#endif
}

std::string platform_name(Platform platform) {
    switch (platform) {
        case Platform::Linux: return "linux";
        case Platform::Macos: return "macos";
        case Platform::Windows: return "windows";
    }
    return "linux";
}

std::string get_repo_url(const fs::path& root) {
    std::ifstream mirror_file(root / MIRROR_CONF_FILE);
    std::string repo_url;
    if (!mirror_file.is_open() || !std::getline(mirror_file, repo_url)) {
        return DEFAULT_REPO_URL;
    }
    repo_url = trim(repo_url);
    if (repo_url.empty()) {
        return DEFAULT_REPO_URL;
    }
    while (!repo_url.empty() && repo_url.back() == '/') {
        repo_url.pop_back();
    }
    return repo_url;
}

std::string manifest_url(const std::string& repo_url, Platform platform, Channel channel) {
    const std::string prefix = (channel == Channel::Nightly) ? repo_url + "/nightly" : repo_url;
    return prefix + "/" + platform_name(platform) + "/list.json";
}
