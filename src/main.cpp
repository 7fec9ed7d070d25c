#include "core/Common.hpp"
#include "core/App.hpp"

int main(int argc, char** argv) {
    try {
        if (argc <= 1) {
            runApp();
            return 0;
        }

        AppConfig cfg;
        std::string error;
        if (!parseArgs(argc, argv, cfg, error)) {
            std::cerr << error << std::endl;
            return 2;
        }
        return runMaze(cfg);
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << std::endl;
        return 1;
    }
}
