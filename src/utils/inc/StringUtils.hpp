#pragma once

#include <string>
#include <vector>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static void trim(std::string& str);
    static std::string trimmed(const std::string& str);

    // Split on runs of spaces/tabs, no quoting
    static std::vector<std::string> split_whitespace(const std::string& str);
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    static bool starts_with(const std::string& str, const std::string& prefix);

    // Length of the leading run of spaces and tabs
    static size_t indent_width(const std::string& str);

    // "******" for any non-empty value
    static std::string mask(const std::string& str);
};
