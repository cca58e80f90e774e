#include "cli/snapkeep_cli.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    try {
        snapkeep::SnapkeepCLI cli;
        int rc = cli.run(argc, argv);
        snapkeep::Logger::shutdown();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        if (snapkeep::Logger::isInitialized()) {
            snapkeep::Logger::error("Error in main: " + std::string(e.what()));
        }
        return 1;
    }
}
