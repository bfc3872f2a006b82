#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>
#include <functional>
#include <core/config.hpp>
#include <wc/metadata_store.hpp>

class WCError;

// Thrown by command handlers on bad arguments. The message is the usage line.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class WCCLI {
public:
    WCCLI();

    using Args = std::vector<std::string>;
    using CommandHandler = std::function<void(WCCLI&, const Args&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& help);

    // Returns the process exit status
    int execute_command(const std::string& command, const Args& args);
    void print_help() const;
    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }

    // Store bound to the configured layout (defaults if there is no config)
    const MetadataStore& store() const { return store_; }

    std::optional<Config> config;
    std::string config_error;

private:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    MetadataStore store_;
};

// Actionable one-line remedy for a working-copy error
std::string wc_error_hint(const WCError& e);

// Command registration
void register_store_commands(WCCLI& cli);
