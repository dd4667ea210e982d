#include "AutoConfig.h"
#include "CogniaExceptions.h"
#include "EdaPipeline.h"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            std::cout << AutoConfig::usage();
            return 0;
        }
    }

    std::cout << "Cognia: Automated Exploratory Data Analysis\n";
    AutoConfig config;
    try {
        config = AutoConfig::fromArgs(argc, argv);
    } catch (const Cognia::CogniaException& e) {
        std::cerr << "[Cognia][Error] " << e.what() << "\n";
        return 1;
    }

    try {
        EdaPipeline pipeline;
        return pipeline.run(config);
    } catch (const Cognia::CogniaException& e) {
        std::cerr << "[Cognia][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Cognia][Exception] " << e.what() << "\n";
        return 1;
    }
}
