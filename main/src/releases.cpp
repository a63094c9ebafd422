#include "releases.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"

#include <algorithm>
#include <ranges>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Version version_field(const json& j, const char* key) {
    return Version::parse(j.at(key).get<std::string>());
}

std::string describe_path(const fs::path& path) {
    return json(path.string()).dump();
}

} // anonymous namespace

void to_json(json& j, const Build& build) {
    j = json{
        {"name", build.name},
        {"version", build.version.to_string()},
        {"longVersion", build.long_version},
        {"url", build.url},
        {"firstSolcVersion", build.first_supported_solc_version.to_string()},
        {"lastSolcVersion", build.last_supported_solc_version.to_string()},
    };
    if (!build.sha256.empty()) {
        j["sha256"] = build.sha256;
    }
}

void from_json(const json& j, Build& build) {
    build.name = j.at("name").get<std::string>();
    build.version = version_field(j, "version");
    build.long_version = j.at("longVersion").get<std::string>();
    build.url = j.value("url", std::string{});
    build.first_supported_solc_version = version_field(j, "firstSolcVersion");
    build.last_supported_solc_version = version_field(j, "lastSolcVersion");
    build.sha256 = j.value("sha256", std::string{});

    if (build.first_supported_solc_version > build.last_supported_solc_version) {
        throw RvmException(ErrorKind::Serde, string_format("error.invalid_solc_range", build.version.to_string(),
                                                           build.solc_range().to_string()));
    }
}

std::string Build::download_binary(bool show_progress) const {
    if (url.empty()) {
        throw RvmException(ErrorKind::Url, string_format("error.missing_url", version.to_string()));
    }
    std::string blob = fetch_to_string(url, DOWNLOAD_TIMEOUT, show_progress);
    if (!sha256.empty()) {
        verify_sha256(blob, sha256);
    }
    return blob;
}

Binary Binary::local(const Build& build, const fs::path& root) {
    return Binary({build.version, build.first_supported_solc_version, build.last_supported_solc_version},
                  root / build.version.to_string() / build.name);
}

Binary Binary::remote(const Build& build) {
    return Binary({build.version, build.first_supported_solc_version, build.last_supported_solc_version},
                  std::nullopt);
}

std::string Binary::describe() const {
    std::ostringstream ss;
    if (path_) {
        ss << "Installed { path: " << describe_path(*path_) << ", ";
    } else {
        ss << "Remote { ";
    }
    ss << "version: \"" << info_.version << "\", solc_req: \"" << info_.solc_range().to_string() << "\" }";
    return ss.str();
}

bool Binary::operator<(const Binary& other) const {
    if (info_.version != other.info_.version) {
        return info_.version < other.info_.version;
    }
    return is_local() && !other.is_local();
}

std::ostream& operator<<(std::ostream& os, const Binary& binary) {
    return os << binary.describe();
}

Releases::Releases(std::vector<Build> builds, std::map<Version, std::string> releases, Version latest_release)
    : builds_(std::move(builds)), releases_(std::move(releases)), latest_release_(std::move(latest_release)) {}

Releases Releases::fetch(const std::string& url) {
    return parse(fetch_to_string(url, MANIFEST_TIMEOUT));
}

Releases Releases::parse(const std::string& json_text) {
    try {
        const json j = json::parse(json_text);

        std::vector<Build> builds = j.at("builds").get<std::vector<Build>>();
        std::map<Version, std::string> releases;
        for (const auto& [key, value] : j.at("releases").items()) {
            releases.emplace(Version::parse(key), value.get<std::string>());
        }
        Version latest = version_field(j, "latestRelease");
        return Releases(std::move(builds), std::move(releases), std::move(latest));
    } catch (const json::exception& e) {
        throw RvmException(ErrorKind::Serde, string_format("error.invalid_manifest", e.what()));
    }
}

Releases Releases::from_installed(std::vector<Build> installed) {
    if (installed.empty()) {
        throw no_versions_installed();
    }

    std::map<Version, std::string> releases;
    for (const auto& build : installed) {
        releases.emplace(build.version, build.name + "+" + build.long_version);
    }
    Version latest = std::ranges::max(installed, {}, &Build::version).version;
    return Releases(std::move(installed), std::move(releases), std::move(latest));
}

void Releases::merge(const Releases& other) {
    std::vector<Build> merged;
    std::unordered_set<std::string> seen;
    for (const std::vector<Build>* list : {&std::as_const(builds_), &other.builds_}) {
        for (const auto& build : *list) {
            if (seen.insert(build.long_version).second) {
                merged.push_back(build);
            }
        }
    }
    builds_ = std::move(merged);

    for (const auto& [version, id] : other.releases_) {
        releases_.insert_or_assign(version, id);
    }
}

const Build& Releases::get_build(const Version& version) const {
    if (releases_.contains(version)) {
        auto it = std::ranges::find(builds_, version, &Build::version);
        if (it != builds_.end()) {
            return *it;
        }
    }
    throw UnknownVersionError(version);
}
