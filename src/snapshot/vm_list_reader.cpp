#include "snapshot/vm_list_reader.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <fstream>

std::vector<std::string> VMListReader::parse(std::istream& input) {
    std::vector<std::string> vmIdentifiers;
    std::string line;
    while (std::getline(input, line)) {
        std::string vm = utils::trim(line);
        if (!vm.empty()) {
            vmIdentifiers.push_back(vm);
        }
    }
    return vmIdentifiers;
}

bool VMListReader::read(const std::string& path, std::vector<std::string>& vmIdentifiers, std::string& error) {
    if (path.empty()) {
        error = "No VM list given (--vm-list)";
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        error = "VM list not found: " + path;
        return false;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Cannot open VM list: " + path;
        return false;
    }

    vmIdentifiers = parse(file);
    Logger::info("Read " + std::to_string(vmIdentifiers.size()) + " VM name(s) from " + path);
    return true;
}
