#include "version.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

namespace {

bool is_numeric(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), ::isdigit);
}

// Pre-release precedence from SemVer 2.0, section 11.
std::strong_ordering compare_pre_release(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    if (a.empty() && !b.empty()) return std::strong_ordering::greater;
    if (!a.empty() && b.empty()) return std::strong_ordering::less;

    size_t len = std::min(a.size(), b.size());
    for (size_t i = 0; i < len; ++i) {
        const std::string& part1 = a[i];
        const std::string& part2 = b[i];
        bool is_num1 = is_numeric(part1);
        bool is_num2 = is_numeric(part2);

        if (is_num1 && is_num2) {
            // No leading zeros, so a longer identifier is a larger number.
            if (part1.size() != part2.size()) return part1.size() <=> part2.size();
            if (auto cmp = part1.compare(part2); cmp != 0) return cmp <=> 0;
        } else {
            if (is_num1 && !is_num2) return std::strong_ordering::less;
            if (!is_num1 && is_num2) return std::strong_ordering::greater;
            if (auto cmp = part1.compare(part2); cmp != 0) return cmp <=> 0;
        }
    }
    return a.size() <=> b.size();
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> res;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, delim)) {
        res.push_back(item);
    }
    return res;
}

} // anonymous namespace

Version::Version(uint64_t major, uint64_t minor, uint64_t patch)
    : major{major}, minor{minor}, patch{patch} {}

Version Version::parse(const std::string& str) {
    static const std::regex semver_regex(
        R"(^(0|[1-9]\d*)\.(0|[1-9]\d*)\.(0|[1-9]\d*))"
        R"((?:-((?:0|[1-9]\d*|\d*[a-zA-Z-][0-9a-zA-Z-]*)(?:\.(?:0|[1-9]\d*|\d*[a-zA-Z-][0-9a-zA-Z-]*))*))?)"
        R"((?:\+([0-9a-zA-Z-]+(?:\.[0-9a-zA-Z-]+)*))?$)");

    std::smatch match;
    if (!std::regex_match(str, match, semver_regex)) {
        throw RvmException(ErrorKind::Semver, string_format("error.invalid_version", str));
    }

    Version v;
    try {
        v.major = std::stoull(match[1].str());
        v.minor = std::stoull(match[2].str());
        v.patch = std::stoull(match[3].str());
    } catch (const std::out_of_range&) {
        throw RvmException(ErrorKind::Semver, string_format("error.invalid_version", str));
    }
    if (match[4].matched) v.pre = split(match[4].str(), '.');
    if (match[5].matched) v.build = match[5].str();
    return v;
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    for (size_t i = 0; i < pre.size(); ++i) {
        s += (i == 0 ? "-" : ".") + pre[i];
    }
    if (!build.empty()) s += "+" + build;
    return s;
}

std::strong_ordering Version::operator<=>(const Version& other) const {
    if (auto cmp = major <=> other.major; cmp != 0) return cmp;
    if (auto cmp = minor <=> other.minor; cmp != 0) return cmp;
    if (auto cmp = patch <=> other.patch; cmp != 0) return cmp;
    if (auto cmp = compare_pre_release(pre, other.pre); cmp != 0) return cmp;
    return build.compare(other.build) <=> 0;
}

bool Version::operator==(const Version& other) const {
    return (*this <=> other) == 0;
}

std::ostream& operator<<(std::ostream& os, const Version& version) {
    return os << version.to_string();
}

bool VersionRange::matches(const Version& version) const {
    // Bounds carry no pre-release, so a pre-release version never matches.
    if (version.is_prerelease()) return false;
    return version.core() >= first.core() && version.core() <= last.core();
}

std::string VersionRange::to_string() const {
    return ">=" + first.core().to_string() + ", <=" + last.core().to_string();
}
