#pragma once

#include "version.hpp"

#include <stdexcept>
#include <string>

enum class ErrorKind {
    UnknownVersion,
    NotInstalled,
    NoVersionsInstalled,
    DefaultVersionNotSet,
    CantInstallOffline,
    ChecksumValidation,
    SolcVersionNotSupported,
    PlatformNotSupported,
    Semver,
    Serde,
    Network,
    Url,
    Io,
    HexDecoding
};

class RvmException : public std::runtime_error {
public:
    RvmException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class UnknownVersionError : public RvmException {
public:
    explicit UnknownVersionError(Version version);
    const Version& version() const noexcept { return version_; }

private:
    Version version_;
};

class NotInstalledError : public RvmException {
public:
    explicit NotInstalledError(Version version);
    const Version& version() const noexcept { return version_; }

private:
    Version version_;
};

class ChecksumValidationError : public RvmException {
public:
    ChecksumValidationError(std::string expected, std::string actual);
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

class SolcVersionNotSupportedError : public RvmException {
public:
    SolcVersionNotSupportedError(Version solc_version, Version resolc_version, VersionRange supported_range);
    const Version& solc_version() const noexcept { return solc_version_; }
    const Version& resolc_version() const noexcept { return resolc_version_; }
    const VersionRange& supported_range() const noexcept { return supported_range_; }

private:
    Version solc_version_;
    Version resolc_version_;
    VersionRange supported_range_;
};

class PlatformNotSupportedError : public RvmException {
public:
    PlatformNotSupportedError(std::string os, std::string arch);
    const std::string& os() const noexcept { return os_; }
    const std::string& arch() const noexcept { return arch_; }

private:
    std::string os_;
    std::string arch_;
};

// Plain exceptions for the kinds that carry no extra context.
RvmException default_version_not_set();
RvmException cant_install_offline();
RvmException no_versions_installed();
