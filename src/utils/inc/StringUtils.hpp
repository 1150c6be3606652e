#pragma once

#include <string>
#include <vector>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static void trim(std::string& str);

    // "yes", "y", "true" and "1" (any case, surrounding blanks ignored)
    static bool is_truthy(const std::string& str);

    // Splits on `delim` and trims each piece; empty pieces are dropped
    static std::vector<std::string> split(const std::string& str, char delim);
};
