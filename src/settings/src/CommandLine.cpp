#include "CommandLine.hpp"
#include <algorithm>
#include <stdexcept>

const std::vector<CommandLine::CommandOption> CommandLine::valid_options = {
    {"--config-file", 'c', "Engine settings file (YAML)", true},
    {"--verbose", 'v', "Debug logging", false},
    {"--help", '?', "Display this help message", false}
};

void CommandLine::show_help(std::ostream& out) {
    out << "Usage: reef [OPTIONS] <command> [ARGS]...\n\n"
        << "Commands:\n"
        << "  deploy <target> [key=value]...   Apply variables, then run the playbook on target\n"
        << "  provision [key=value]...         Apply variables, then run terraform apply\n"
        << "  show                             Print effective variables, secrets masked\n"
        << "  history                          Print finished jobs\n\n"
        << "Options:\n";

    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        max_opt_len = std::max(max_opt_len, 4 + opt.long_opt.length());
    }
    const size_t desc_offset = max_opt_len + 8;

    for (const auto& opt : valid_options) {
        out << "  -" << opt.short_opt << ", " << opt.long_opt;
        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            out << "=VALUE";
            current_len += 6;
        }
        out << std::string(desc_offset - current_len, ' ') << opt.description << "\n";
    }

    out << "\nEnvironment:\n"
        << "  REEF_BASE_DIR, REEF_LOG_LEVEL, REEF_CANCEL_GRACE_MS override the settings file\n";
}

CommandLine CommandLine::parse(int argc, char* argv[]) {
    CommandLine cli;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
            if (cli.command_.empty()) {
                cli.command_ = arg;
            } else {
                cli.operands_.push_back(arg);
            }
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        std::string key;
        std::string value;
        bool has_inline_value = false;

        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            key = arg.substr(0, pos);
            if (pos != std::string::npos) {
                value = arg.substr(pos + 1);
                has_inline_value = true;
            }
        } else {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }
            const char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });
            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }
            key = it->long_opt;
        }

        auto it = std::find_if(valid_options.begin(), valid_options.end(),
            [&key](const CommandOption& opt) { return opt.long_opt == key; });
        if (it == valid_options.end()) {
            throw std::runtime_error("Unknown option: " + key);
        }

        if (it->requires_value && !has_inline_value) {
            if (i + 1 >= argc) {
                throw std::runtime_error("Option requires a value: " + key);
            }
            value = argv[++i];
        } else if (!it->requires_value && has_inline_value) {
            throw std::runtime_error("Option takes no value: " + key);
        }
        cli.options_[key] = value;
    }
    return cli;
}

std::string CommandLine::value(const std::string& long_opt) const {
    auto it = options_.find(long_opt);
    return it == options_.end() ? std::string() : it->second;
}

std::map<std::string, std::string> CommandLine::assignments(size_t first) const {
    std::map<std::string, std::string> out;
    for (size_t i = first; i < operands_.size(); ++i) {
        const std::string& operand = operands_[i];
        const size_t pos = operand.find('=');
        if (pos == std::string::npos || pos == 0) {
            throw std::runtime_error("Expected key=value, got '" + operand + "'");
        }
        out[operand.substr(0, pos)] = operand.substr(pos + 1);
    }
    return out;
}
