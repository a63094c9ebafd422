#include "exception.hpp"
#include "localization.hpp"

#include <utility>

UnknownVersionError::UnknownVersionError(Version version)
    : RvmException(ErrorKind::UnknownVersion, string_format("error.unknown_version", version.to_string())),
      version_(std::move(version)) {}

NotInstalledError::NotInstalledError(Version version)
    : RvmException(ErrorKind::NotInstalled, string_format("error.not_installed", version.to_string())),
      version_(std::move(version)) {}

ChecksumValidationError::ChecksumValidationError(std::string expected, std::string actual)
    : RvmException(ErrorKind::ChecksumValidation, string_format("error.checksum_mismatch", expected, actual)),
      expected_(std::move(expected)), actual_(std::move(actual)) {}

SolcVersionNotSupportedError::SolcVersionNotSupportedError(Version solc_version, Version resolc_version, VersionRange supported_range)
    : RvmException(ErrorKind::SolcVersionNotSupported,
                   string_format("error.solc_not_supported", solc_version.to_string(), resolc_version.to_string(), supported_range.to_string())),
      solc_version_(std::move(solc_version)), resolc_version_(std::move(resolc_version)),
      supported_range_(std::move(supported_range)) {}

PlatformNotSupportedError::PlatformNotSupportedError(std::string os, std::string arch)
    : RvmException(ErrorKind::PlatformNotSupported, string_format("error.unsupported_platform", os, arch)),
      os_(std::move(os)), arch_(std::move(arch)) {}

RvmException default_version_not_set() {
    return RvmException(ErrorKind::DefaultVersionNotSet, get_string("error.default_not_set"));
}

RvmException cant_install_offline() {
    return RvmException(ErrorKind::CantInstallOffline, get_string("error.cant_install_offline"));
}

RvmException no_versions_installed() {
    return RvmException(ErrorKind::NoVersionsInstalled, get_string("error.no_versions_installed"));
}
