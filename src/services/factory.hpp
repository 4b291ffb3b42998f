#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include "parmul.pb.h"


namespace services::configurations {

    class ConfigError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    parmul::Configs create_configs(std::uint64_t number_of_workers, parmul::ElementType element_type, bool verbose);

    parmul::AppConfigs
    create_app_configs(const std::string &left_matrix_path, const std::string &right_matrix_path,
                       const std::string &output_matrix_path, const parmul::Configs &configs);

    /**
     * Reads a parmul.Configs message from a JSON file, e.g.
     *   {"number_of_workers": 4, "element_type": "INT64", "verbose": true}
     * @throws ConfigError if the file cannot be read or does not hold a valid Configs message.
     */
    parmul::Configs load_configs(const std::filesystem::path &config_file);

    /**
     * The number of workers to multiply with: the configured count, or concurrency::num_cpus capped to
     * [1, rows] when the configuration leaves it at 0.
     */
    std::uint64_t resolve_worker_count(const parmul::Configs &configs, std::uint64_t rows);
}
