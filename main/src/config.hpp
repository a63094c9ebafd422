#pragma once

#include "version.hpp"

#include <chrono>
#include <filesystem>
#include <string>

// Default location of the published resolc manifests
inline constexpr const char* DEFAULT_REPO_URL = "https://raw.githubusercontent.com/paritytech/resolc-bin/refs/heads/main";

// Oldest solc release any resolc build is trusted with, whatever a build declares.
inline const Version MIN_SOLC_VERSION(0, 8, 0);

inline constexpr std::chrono::seconds DOWNLOAD_TIMEOUT{300};
inline constexpr std::chrono::seconds MANIFEST_TIMEOUT{60};

// On-disk layout under the root directory
inline constexpr const char* BUILD_METADATA_FILE = "build.json";
inline constexpr const char* DEFAULT_VERSION_FILE = ".default_version";
inline constexpr const char* LOCK_FILE_PREFIX = ".lock-";
inline constexpr const char* MIRROR_CONF_FILE = "mirror.conf";
// Key of the version-independent lock guarding the default pointer
inline const Version GLOBAL_LOCK_VERSION(0, 0, 0);

enum class Platform {
    Linux,
    Macos,
    Windows
};

enum class Channel {
    Stable,
    Nightly
};

// Root directory handling
void set_root_path(const std::string& root_path);
std::filesystem::path get_root_dir();
std::filesystem::path resolve_default_root();

// Throws PlatformNotSupportedError for anything but linux/x86_64, macos/{x86_64,aarch64}, windows/x86_64.
Platform get_platform();
std::string platform_name(Platform platform);

std::string get_repo_url(const std::filesystem::path& root);
std::string manifest_url(const std::string& repo_url, Platform platform, Channel channel);
