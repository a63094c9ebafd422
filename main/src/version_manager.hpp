#pragma once

#include "config.hpp"
#include "releases.hpp"
#include "storage.hpp"
#include "version.hpp"

#include <optional>
#include <vector>

struct ManagerOptions {
    bool offline = false;
    // Merge the nightly manifest into the stable one.
    bool nightly = false;
    bool show_progress = false;
};

// Resolves, installs and removes resolc versions on top of a catalog and a Storage root.
class VersionManager {
public:
    // Uses the configured root directory. In offline mode the catalog is made
    // from installed versions, otherwise it is fetched from the manifest.
    explicit VersionManager(const ManagerOptions& options);
    VersionManager(Storage storage, const ManagerOptions& options);
    // Uses a ready catalog, e.g. one fetched from a mirror.
    VersionManager(Storage storage, Releases releases, const ManagerOptions& options);

    /// Returns an already present resolc binary.
    /// Passing `solc_version` also checks the compatibility between the two compilers.
    Binary get(const Version& resolc_version, const std::optional<Version>& solc_version = std::nullopt) const;

    /// Returns an already present binary or downloads and installs it.
    Binary get_or_install(const Version& resolc_version, const std::optional<Version>& solc_version = std::nullopt) const;

    bool is_installed(const Version& version) const;

    /// Uninstalls `version`; throws NotInstalledError if it is absent.
    void remove(const Version& version) const;

    Binary get_default() const;
    void set_default(const Version& version) const;

    /// Every installed and installable version, sorted by version.
    /// With `solc_version`, installed builds that don't support it are listed as remote.
    std::vector<Binary> list_available(const std::optional<Version>& solc_version = std::nullopt) const;

    bool offline() const { return options_.offline; }
    const Releases& releases() const { return releases_; }
    const Storage& storage() const { return storage_; }

private:
    static Releases load_releases(const Storage& storage, const ManagerOptions& options);

    Storage storage_;
    Releases releases_;
    ManagerOptions options_;
};
