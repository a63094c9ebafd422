#pragma once

#include "releases.hpp"
#include "version.hpp"

// True iff `solc_version` is inside the build's supported range and not older than MIN_SOLC_VERSION.
bool is_solc_compatible(const VersionRange& supported, const Version& solc_version);

// Throws SolcVersionNotSupportedError when `solc_version` cannot be used with `build`.
void check_solc_compat(const Build& build, const Version& solc_version);
