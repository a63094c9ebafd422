#include "compat.hpp"
#include "config.hpp"
#include "exception.hpp"

bool is_solc_compatible(const VersionRange& supported, const Version& solc_version) {
    return supported.matches(solc_version) && solc_version >= MIN_SOLC_VERSION;
}

void check_solc_compat(const Build& build, const Version& solc_version) {
    const VersionRange supported = build.solc_range();
    if (!is_solc_compatible(supported, solc_version)) {
        throw SolcVersionNotSupportedError(solc_version, build.version, supported);
    }
}
