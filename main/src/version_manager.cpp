#include "version_manager.hpp"
#include "compat.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <set>

namespace fs = std::filesystem;

VersionManager::VersionManager(const ManagerOptions& options)
    : VersionManager(Storage(get_root_dir()), options) {}

VersionManager::VersionManager(Storage storage, const ManagerOptions& options)
    : storage_(std::move(storage)), releases_(load_releases(storage_, options)), options_(options) {}

VersionManager::VersionManager(Storage storage, Releases releases, const ManagerOptions& options)
    : storage_(std::move(storage)), releases_(std::move(releases)), options_(options) {}

Releases VersionManager::load_releases(const Storage& storage, const ManagerOptions& options) {
    if (options.offline) {
        return Releases::from_installed(storage.installed_versions());
    }

    const Platform platform = get_platform();
    const std::string repo_url = get_repo_url(storage.path());
    Releases releases = Releases::fetch(manifest_url(repo_url, platform, Channel::Stable));
    if (options.nightly) {
        releases.merge(Releases::fetch(manifest_url(repo_url, platform, Channel::Nightly)));
    }
    return releases;
}

Binary VersionManager::get(const Version& resolc_version, const std::optional<Version>& solc_version) const {
    const Build& build = releases_.get_build(resolc_version);

    if (solc_version) {
        check_solc_compat(build, *solc_version);
    }

    std::error_code ec;
    if (!fs::exists(storage_.binary_path(build), ec)) {
        throw NotInstalledError(resolc_version);
    }
    return Binary::local(build, storage_.path());
}

Binary VersionManager::get_or_install(const Version& resolc_version, const std::optional<Version>& solc_version) const {
    try {
        return get(resolc_version, solc_version);
    } catch (const NotInstalledError&) {
        // fall through to installation
    }

    if (options_.offline) {
        throw cant_install_offline();
    }

    const Build& build = releases_.get_build(resolc_version);
    const std::string blob = build.download_binary(options_.show_progress);
    storage_.install_version(build, blob);

    return Binary::local(build, storage_.path());
}

bool VersionManager::is_installed(const Version& version) const {
    std::error_code ec;
    return fs::exists(storage_.version_dir(version), ec);
}

void VersionManager::remove(const Version& version) const {
    if (!is_installed(version)) {
        throw NotInstalledError(version);
    }
    storage_.remove_version(version);
}

Binary VersionManager::get_default() const {
    Version version;
    try {
        version = storage_.get_default_version();
    } catch (const RvmException& e) {
        if (e.kind() == ErrorKind::Io) {
            throw default_version_not_set();
        }
        throw;
    }
    return get(version);
}

void VersionManager::set_default(const Version& version) const {
    get(version); // throws unless installed
    storage_.set_default_version(version);
}

std::vector<Binary> VersionManager::list_available(const std::optional<Version>& solc_version) const {
    auto supported = [&](const VersionRange& range) {
        return !solc_version || is_solc_compatible(range, *solc_version);
    };

    std::set<Version> installed_versions;
    std::vector<Binary> result;

    for (const auto& build : storage_.installed_versions()) {
        if (supported(build.solc_range())) {
            installed_versions.insert(build.version);
            result.push_back(Binary::local(build, storage_.path()));
        }
    }

    for (const auto& build : releases_.builds()) {
        if (!installed_versions.contains(build.version)) {
            result.push_back(Binary::remote(build));
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}
