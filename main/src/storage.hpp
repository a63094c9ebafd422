#pragma once

#include "releases.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

// On-disk catalog of installed resolc versions:
//
//   <root>/<version>/<binary name>   executable blob
//   <root>/<version>/build.json      metadata sidecar
//   <root>/.default_version          default pointer
//   <root>/.lock-<version>           transient per-version lock (.lock-0.0.0 guards the default pointer)
//
// Every mutation runs under a cross-process FileLock, so several processes may
// share one root.
class Storage {
public:
    explicit Storage(std::filesystem::path root);

    const std::filesystem::path& path() const { return root_; }
    std::filesystem::path version_dir(const Version& version) const;
    std::filesystem::path binary_path(const Build& build) const;

    // Installs `blob` as `build`. Installing a version that another caller has
    // already completed is a successful no-op.
    void install_version(const Build& build, std::string_view blob) const;

    // No-op when the version is absent. Clears the default pointer if it names `version`.
    void remove_version(const Version& version) const;

    // Builds of every version directory with a readable sidecar.
    std::vector<Build> installed_versions() const;

    // Throws RvmException(ErrorKind::Io) if the pointer is not set.
    Version get_default_version() const;
    void set_default_version(const Version& version) const;
    void remove_default() const;

private:
    FileLock lock(const Version& version) const;
    bool is_complete_install(const Build& build) const;
    void remove_default_unlocked() const;

    std::filesystem::path root_;
};
