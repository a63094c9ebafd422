#pragma once

#include "version.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

// One published resolc build, as listed in a `list.json` manifest.
// Also persisted as the `build.json` sidecar of an installed version.
struct Build {
    std::string name;
    Version version;
    std::string long_version;
    std::string url;
    Version first_supported_solc_version;
    Version last_supported_solc_version;
    // Hex encoded SHA256; empty when the manifest publishes none.
    std::string sha256;

    VersionRange solc_range() const { return {first_supported_solc_version, last_supported_solc_version}; }

    // Downloads the blob and checks it against `sha256`.
    std::string download_binary(bool show_progress = false) const;
};

void to_json(nlohmann::json& j, const Build& build);
void from_json(const nlohmann::json& j, Build& build);

struct BinaryInfo {
    Version version;
    Version first_supported_solc_version;
    Version last_supported_solc_version;

    VersionRange solc_range() const { return {first_supported_solc_version, last_supported_solc_version}; }
};

// A resolc binary known to the manager: local when `path` is set, remote otherwise.
class Binary {
public:
    static Binary local(const Build& build, const std::filesystem::path& root);
    static Binary remote(const Build& build);

    const Version& version() const { return info_.version; }
    const BinaryInfo& info() const { return info_; }
    bool is_local() const { return path_.has_value(); }
    const std::optional<std::filesystem::path>& path() const { return path_; }
    void set_path(std::filesystem::path path) { path_ = std::move(path); }

    // `Installed { path: "...", version: "...", solc_req: "..." }` or `Remote { ... }`
    std::string describe() const;

    bool operator<(const Binary& other) const;

private:
    Binary(BinaryInfo info, std::optional<std::filesystem::path> path)
        : info_(std::move(info)), path_(std::move(path)) {}

    BinaryInfo info_;
    std::optional<std::filesystem::path> path_;
};

std::ostream& operator<<(std::ostream& os, const Binary& binary);

// Resolc equivalent of the `list.json` of solc releases.
class Releases {
public:
    Releases() = default;
    Releases(std::vector<Build> builds, std::map<Version, std::string> releases, Version latest_release);

    // Downloads and parses the manifest at `url`.
    static Releases fetch(const std::string& url);
    // Throws RvmException(ErrorKind::Serde) on malformed JSON.
    static Releases parse(const std::string& json_text);
    // Catalog made of installed builds only. Throws when `installed` is empty.
    static Releases from_installed(std::vector<Build> installed);

    // Concatenates both build lists keeping the first build of each long version,
    // and adds `other`'s releases. The latest release is left untouched.
    void merge(const Releases& other);

    // Throws UnknownVersionError unless `version` is both in releases and builds.
    const Build& get_build(const Version& version) const;

    const std::vector<Build>& builds() const { return builds_; }
    const std::map<Version, std::string>& releases() const { return releases_; }
    const Version& latest_release() const { return latest_release_; }

private:
    std::vector<Build> builds_;
    std::map<Version, std::string> releases_;
    Version latest_release_;
};
