#pragma once

#include <map>
#include <ostream>
#include <string>
#include <vector>

// reef [OPTIONS] <command> [operands...]
class CommandLine {
public:
    struct CommandOption {
        std::string long_opt;
        char short_opt;
        std::string description;
        bool requires_value;
    };

    static const std::vector<CommandOption> valid_options;

    // Throws std::runtime_error on unknown options or missing values
    static CommandLine parse(int argc, char* argv[]);

    static void show_help(std::ostream& out);

    bool has(const std::string& long_opt) const { return options_.count(long_opt) > 0; }
    std::string value(const std::string& long_opt) const;

    const std::string& command() const { return command_; }
    const std::vector<std::string>& operands() const { return operands_; }

    // key=value operands from `first` on; throws std::runtime_error without '='
    std::map<std::string, std::string> assignments(size_t first) const;

private:
    std::map<std::string, std::string> options_;
    std::string command_;
    std::vector<std::string> operands_;
};
