#include <iostream>
#include <filesystem>
#include "runner.hpp"
#include "services/factory.hpp"
#include "math_utils/errors.hpp"

void print_usage(const char *program) {
    std::cerr << "Usage: " << program
              << " <left_matrix_file> <right_matrix_file> <output_matrix_file> [config_file]" << std::endl;
}

bool is_valid_command_line_args(int argc, char *argv[]) {
    if (argc < 4 || argc > 5) {
        print_usage(argv[0]);
        return false;
    }

    if (argc == 5 && !std::filesystem::exists(argv[4])) {
        std::cerr << "Config file " << argv[4] << " does not exist" << std::endl;
        return false;
    }

    return true;
}

parmul::AppConfigs load_configs(int argc, char *const *argv) {
    auto configs = argc == 5
                   ? services::configurations::load_configs(argv[4])
                   : services::configurations::create_configs(0, parmul::FLOAT64, false);

    return services::configurations::create_app_configs(argv[1], argv[2], argv[3], configs);
}

int main(int argc, char *argv[]) {
    if (!is_valid_command_line_args(argc, argv)) {
        return 1;
    }

    parmul::AppConfigs app_configs;
    try {
        app_configs = load_configs(argc, argv);
    } catch (const services::configurations::ConfigError &e) {
        std::cerr << "Problem passing arguments:\n" << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try {
        runner::run(app_configs);
    } catch (const math_utils::InternalSynchronizationError &e) {
        std::cerr << "Internal error:\n" << e.what() << std::endl;
        return 2;
    } catch (const std::exception &e) {
        std::cerr << "Application error:\n" << e.what() << std::endl;
        return 1;
    }

    std::cout << "Success!" << std::endl;
    return 0;
}
