#include "main/snapshot_main.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc > 1 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "azsnap version 1.0.0\n";
        return 0;
    }

    try {
        int code = snapshotMain(argc, argv);
        Logger::shutdown();
        return code;
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        if (Logger::isInitialized()) {
            Logger::error("Error in main: " + std::string(e.what()));
        }
        return 1;
    }
}
