#pragma once

#include <istream>
#include <string>
#include <vector>

class VMListReader {
public:
    // One VM name per line; blank and whitespace-only lines are ignored and
    // duplicates are kept.
    static std::vector<std::string> parse(std::istream& input);
    static bool read(const std::string& path, std::vector<std::string>& vmIdentifiers, std::string& error);
};
