#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version_manager.hpp"
#include "cxxopts.hpp"

#include <curl/curl.h>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
};

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.install_desc") << std::endl;
    std::cerr << get_string("info.remove_desc") << std::endl;
    std::cerr << get_string("info.which_desc") << std::endl;
    std::cerr << get_string("info.use_desc") << std::endl;
    std::cerr << get_string("info.list_desc") << std::endl;
}

Version single_version_arg(const cxxopts::ParseResult& result, std::function<void()> print_usage_func) {
    size_t count = result.count("args") ? result["args"].as<std::vector<std::string>>().size() : 0;
    if (count != 1) {
        print_usage_func();
        throw RvmException(ErrorKind::Semver, get_string("error.invalid_arg_count"));
    }
    return Version::parse(result["args"].as<std::vector<std::string>>()[0]);
}

std::string join_versions(const std::vector<Binary>& binaries, bool local) {
    std::string out = "[";
    bool first = true;
    for (const auto& bin : binaries) {
        if (bin.is_local() != local) continue;
        if (!first) out += ", ";
        out += "\"" + bin.version().to_string() + "\"";
        first = false;
    }
    return out + "]";
}

void install_version(const VersionManager& manager, const Version& version) {
    log_info(string_format("info.installing", version.to_string()));
    manager.get_or_install(version);
    log_info(string_format("info.installed", version.to_string()));
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("o,offline", get_string("help.offline"), cxxopts::value<bool>()->default_value("false"))
            ("nightly", get_string("help.nightly"), cxxopts::value<bool>()->default_value("false"))
            ("root", get_string("help.root_dir"), cxxopts::value<std::string>())
            ("set-default", get_string("help.set_default"), cxxopts::value<bool>()->default_value("false"))
            ("install", get_string("help.install"), cxxopts::value<bool>()->default_value("false"))
            ("solc", get_string("help.solc"), cxxopts::value<std::string>())
            ("command", "", cxxopts::value<std::string>())
            ("args", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "args"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        if (result.count("root")) {
            set_root_path(result["root"].as<std::string>());
        }

        ManagerOptions manager_options;
        manager_options.offline = result["offline"].as<bool>();
        manager_options.nightly = result["nightly"].as<bool>();
        manager_options.show_progress = true;

        const std::string& command = result["command"].as<std::string>();
        auto usage_printer = [&]() { print_usage(options); };

        if (command == "install") {
            const Version version = single_version_arg(result, usage_printer);
            if (manager_options.offline) {
                throw cant_install_offline();
            }
            VersionManager manager(manager_options);
            if (manager.is_installed(version)) {
                log_info(string_format("info.already_installed", version.to_string()));
                return 0;
            }
            install_version(manager, version);
            if (result["set-default"].as<bool>()) {
                manager.set_default(version);
                log_info(string_format("info.default_set", version.to_string()));
            }
        } else if (command == "remove") {
            const Version version = single_version_arg(result, usage_printer);
            VersionManager manager(manager_options);
            manager.remove(version);
            log_info(string_format("info.removed", version.to_string()));
        } else if (command == "which") {
            const Version version = single_version_arg(result, usage_printer);
            VersionManager manager(manager_options);
            const Binary bin = manager.get(version);
            std::cout << string_format("info.binary_path", bin.path()->string()) << std::endl;
        } else if (command == "use") {
            const Version version = single_version_arg(result, usage_printer);
            VersionManager manager(manager_options);
            if (!manager_options.offline && result["install"].as<bool>() && !manager.is_installed(version)) {
                install_version(manager, version);
            }
            manager.set_default(version);
            log_info(string_format("info.default_set", version.to_string()));
        } else if (command == "list") {
            std::optional<Version> solc_version;
            if (result.count("solc")) {
                solc_version = Version::parse(result["solc"].as<std::string>());
            }
            VersionManager manager(manager_options);
            const auto versions = manager.list_available(solc_version);
            try {
                const Binary default_bin = manager.get_default();
                std::cout << string_format("info.default_version", default_bin.version().to_string()) << std::endl;
            } catch (const RvmException& e) {
                if (e.kind() != ErrorKind::DefaultVersionNotSet && e.kind() != ErrorKind::NotInstalled &&
                    e.kind() != ErrorKind::UnknownVersion) {
                    throw;
                }
            }
            std::cout << string_format("info.available_versions", join_versions(versions, false)) << std::endl;
            std::cout << string_format("info.installed_versions", join_versions(versions, true)) << std::endl;
        } else {
            usage_printer();
            return 1;
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const RvmException& e) {
        log_error(string_format("error.rvm_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
