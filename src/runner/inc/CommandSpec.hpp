#pragma once

#include <map>
#include <string>
#include <vector>

// External command: executable, argument list, optional working directory
struct CommandSpec {
    std::string program;                        // looked up in PATH if it has no '/'
    std::vector<std::string> args;
    std::string working_dir;                    // empty: inherit
    std::map<std::string, std::string> env;     // added to the parent environment
    bool merge_stderr = true;                   // one ordered stream instead of two

    // Shell-like rendering for logs
    std::string display() const;
};
