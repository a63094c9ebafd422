#include "storage.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <nlohmann/json.hpp>

#include <optional>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<Build> read_sidecar(const fs::path& dir) {
    std::error_code ec;
    const fs::path file = dir / BUILD_METADATA_FILE;
    if (!fs::is_regular_file(file, ec)) {
        return std::nullopt;
    }
    try {
        return json::parse(read_file(file)).get<Build>();
    } catch (const json::exception&) {
        return std::nullopt;
    } catch (const RvmException&) {
        return std::nullopt;
    }
}

} // anonymous namespace

Storage::Storage(fs::path root) : root_(std::move(root)) {
    ensure_dir_exists(root_);
}

fs::path Storage::version_dir(const Version& version) const {
    return root_ / version.to_string();
}

fs::path Storage::binary_path(const Build& build) const {
    return version_dir(build.version) / build.name;
}

FileLock Storage::lock(const Version& version) const {
    return FileLock(root_ / (LOCK_FILE_PREFIX + version.to_string()));
}

bool Storage::is_complete_install(const Build& build) const {
    std::error_code ec;
    auto sidecar = read_sidecar(version_dir(build.version));
    return sidecar && sidecar->version == build.version && fs::is_regular_file(binary_path(build), ec);
}

void Storage::install_version(const Build& build, std::string_view blob) const {
    const fs::path folder = version_dir(build.version);
    const FileLock guard = lock(build.version);

    // Another process may have finished this install while we waited for the lock.
    if (is_complete_install(build)) {
        log_info(string_format("info.already_installed", build.version.to_string()));
        return;
    }

    ensure_dir_exists(folder);

    // The sidecar is written last: its presence marks a finished install.
    if (!write_new_file(folder / build.name, blob, 0755)) {
        log_warning(string_format("warning.install_exists", folder.string()));
        return;
    }

    json metadata = build;
    if (!write_new_file(folder / BUILD_METADATA_FILE, metadata.dump())) {
        log_warning(string_format("warning.install_exists", folder.string()));
    }
}

void Storage::remove_version(const Version& version) const {
    const fs::path folder = version_dir(version);
    std::error_code ec;
    if (!fs::exists(folder, ec)) {
        return;
    }

    const FileLock guard = lock(version);
    {
        // The per-version lock of 0.0.0 already is the default pointer lock.
        std::optional<FileLock> default_guard;
        if (version != GLOBAL_LOCK_VERSION) {
            default_guard.emplace(root_ / (LOCK_FILE_PREFIX + GLOBAL_LOCK_VERSION.to_string()));
        }
        try {
            if (get_default_version() == version) {
                remove_default_unlocked();
            }
        } catch (const RvmException& e) {
            if (e.kind() != ErrorKind::Io && e.kind() != ErrorKind::Semver) throw;
        }
    }

    fs::remove_all(folder, ec);
    if (ec) {
        throw RvmException(ErrorKind::Io, string_format("error.remove_failed", folder.string()) + ": " + ec.message());
    }
}

std::vector<Build> Storage::installed_versions() const {
    std::vector<Build> builds;
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        throw RvmException(ErrorKind::Io, string_format("error.open_file_failed", root_.string()) + ": " + ec.message());
    }

    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec)) {
            continue;
        }
        if (auto build = read_sidecar(entry.path())) {
            builds.push_back(std::move(*build));
        }
    }
    return builds;
}

Version Storage::get_default_version() const {
    std::string content = read_file(root_ / DEFAULT_VERSION_FILE);
    content = trim(content);
    while (!content.empty() && content.front() == '/') content.erase(content.begin());
    while (!content.empty() && content.back() == '/') content.pop_back();
    return Version::parse(content);
}

void Storage::set_default_version(const Version& version) const {
    const FileLock guard = lock(GLOBAL_LOCK_VERSION);

    // Write-then-rename so readers never see a half written pointer.
    const fs::path target = root_ / DEFAULT_VERSION_FILE;
    const fs::path tmp_path = target.string() + ".tmp";
    std::error_code ec;
    fs::remove(tmp_path, ec);
    if (!write_new_file(tmp_path, version.to_string())) {
        throw RvmException(ErrorKind::Io, string_format("error.create_file_failed", tmp_path.string()));
    }
    fs::rename(tmp_path, target, ec);
    if (ec) {
        throw RvmException(ErrorKind::Io, string_format("error.write_file_failed", target.string()) + ": " + ec.message());
    }
}

void Storage::remove_default() const {
    const FileLock guard = lock(GLOBAL_LOCK_VERSION);
    remove_default_unlocked();
}

void Storage::remove_default_unlocked() const {
    const fs::path target = root_ / DEFAULT_VERSION_FILE;
    std::error_code ec;
    if (!fs::remove(target, ec) || ec) {
        throw RvmException(ErrorKind::Io, string_format("error.remove_failed", target.string()) +
                                          (ec ? ": " + ec.message() : std::string{}));
    }
}
