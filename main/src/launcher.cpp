// Runs the resolc binary selected by `+<version>` or by the default pointer,
// forwarding every other argument.

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version_manager.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

namespace {

int run(int argc, char* argv[]) {
    int first_arg = 1;
    ManagerOptions options;
    options.offline = true;
    VersionManager manager(options);

    std::optional<Binary> bin;
    if (argc > 1 && argv[1][0] == '+') {
        Version version;
        try {
            version = Version::parse(argv[1] + 1);
        } catch (const RvmException& e) {
            throw RvmException(ErrorKind::Semver, string_format("error.bad_version_specifier", e.what()));
        }
        bin = manager.get(version);
        ++first_arg;
    } else {
        bin = manager.get_default();
    }

    const fs::path bin_path = *bin->path();
    std::error_code ec;
    if (!fs::exists(bin_path, ec)) {
        throw NotInstalledError(bin->version());
    }

    std::vector<std::string> args = {bin_path.string()};
    for (int i = first_arg; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    std::vector<char*> c_args;
    for (auto& arg : args) c_args.push_back(arg.data());
    c_args.push_back(nullptr);

    execv(c_args[0], c_args.data());
    throw RvmException(ErrorKind::Io, string_format("error.exec_failed", bin_path.string()) + ": " + std::strerror(errno));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        init_localization();
        return run(argc, argv);
    } catch (const RvmException& e) {
        log_error(string_format("error.rvm_error", e.what()));
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
    }
    return 1;
}
