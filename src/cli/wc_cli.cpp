#include "wc_cli.hpp"
#include "theme.hpp"
#include <core/wc_error.hpp>
#include <iostream>
#include <fmt/format.h>

WCCLI::WCCLI() {
    auto config_result = Config::load_global();
    if (config_result.is_ok()) {
        config = config_result.value;
        store_ = MetadataStore(config->layout());
    } else {
        config_error = config_result.error;
    }
    register_store_commands(*this);
}

void WCCLI::add_command(const std::string& name,
                        CommandHandler handler,
                        const std::string& help) {
    commands_[name] = {handler, help};
}

std::string wc_error_hint(const WCError& e) {
    switch (e.kind()) {
        case WCErrorKind::NotAWorkingCopy:
            return "Not a working copy. Run 'wcstore init <path>' first.";
        case WCErrorKind::NotFound:
            return "The entry was never written. Use 'wcstore set <entry> <value>'.";
        case WCErrorKind::AlreadyAWorkingCopy:
            return "The directory is already a working copy; nothing was changed.";
        case WCErrorKind::Inconsistent:
            return "The store is incomplete. Write the missing entries or re-run init in a fresh directory.";
        case WCErrorKind::InvalidExternalStore:
            return "Pass an existing, writable directory to --external.";
        case WCErrorKind::InvalidPath:
            return "Choose a path that is a directory or does not exist yet.";
        case WCErrorKind::PermissionDenied:
            return "Check the permissions of the directory.";
        case WCErrorKind::DoubleLock:
        case WCErrorKind::UnacquiredLockRelease:
            return "Internal locking error; please report it.";
    }
    return "";
}

int WCCLI::execute_command(const std::string& command, const Args& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'wcstore --help' for available commands.");
        return 1;
    }

    if (!config_error.empty()) {
        std::cout << theme::fail(config_error);
        std::cout << theme::step("Fix " + get_global_config_path().string() + " or remove it.");
        return 1;
    }

    try {
        it->second.first(*this, args);
        return 0;
    } catch (const UsageError& e) {
        std::cout << theme::fail(e.what());
    } catch (const WCError& e) {
        std::cout << theme::fail(e.what());
        std::cout << theme::step(wc_error_hint(e));
    } catch (const std::filesystem::filesystem_error& e) {
        std::cout << theme::fail(fmt::format("{} ({})", e.code().message(), e.path1().string()));
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
    return 1;
}

void WCCLI::print_help() const {
    std::cout << theme::section("Commands");
    for (const auto& [name, entry] : commands_) {
        std::cout << theme::blue(fmt::format("    wcstore {:<8}", name))
                  << theme::dim(" " + entry.second) << "\n";
    }
    std::cout << "\n";
}
