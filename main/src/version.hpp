#pragma once

#include <compare>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

// Semantic version: MAJOR.MINOR.PATCH[-PRE][+BUILD]
class Version {
public:
    Version() = default;
    Version(uint64_t major, uint64_t minor, uint64_t patch);

    // Throws RvmException(ErrorKind::Semver) on malformed input.
    static Version parse(const std::string& str);

    uint64_t major = 0;
    uint64_t minor = 0;
    uint64_t patch = 0;
    std::vector<std::string> pre;
    std::string build;

    bool is_prerelease() const { return !pre.empty(); }
    Version core() const { return Version(major, minor, patch); }
    std::string to_string() const;

    std::strong_ordering operator<=>(const Version& other) const;
    bool operator==(const Version& other) const;
};

std::ostream& operator<<(std::ostream& os, const Version& version);

// Closed interval [first, last] over the MAJOR.MINOR.PATCH of each bound.
struct VersionRange {
    Version first;
    Version last;

    bool matches(const Version& version) const;
    std::string to_string() const;
};
