#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <managers/parallel_ssh.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Create the runner on first use (validates the ssh executable) and
    // push the current settings into it. Prints the reason on failure.
    bool require_runner();
    bool require_hosts();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    std::optional<Config> config;
    std::string config_error;          // why config failed to load, if it did
    BatchDefaults settings;            // effective settings for the next batch
    std::unique_ptr<ParallelSSH> runner;
    bool has_results = false;          // a batch has completed in this session

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
