#include <algorithm>
#include <google/protobuf/util/json_util.h>
#include "factory.hpp"
#include "concurrency/globals.h"
#include "marshal/local_storage.hpp"

parmul::Configs services::configurations::create_configs(std::uint64_t number_of_workers,
                                                         parmul::ElementType element_type, bool verbose) {
    parmul::Configs c;
    c.set_number_of_workers(number_of_workers);
    c.set_element_type(element_type);
    c.set_verbose(verbose);
    return c;
}

parmul::AppConfigs
services::configurations::create_app_configs(const std::string &left_matrix_path,
                                             const std::string &right_matrix_path,
                                             const std::string &output_matrix_path,
                                             const parmul::Configs &configs) {
    parmul::AppConfigs c;
    c.mutable_configs()->CopyFrom(configs);
    c.mutable_left_matrix_path()->assign(left_matrix_path);
    c.mutable_right_matrix_path()->assign(right_matrix_path);
    c.mutable_output_matrix_path()->assign(output_matrix_path);
    return c;
}

parmul::Configs services::configurations::load_configs(const std::filesystem::path &config_file) {
    std::string json_str;
    try {
        json_str = marshal::load_from_file(config_file);
    } catch (const marshal::StorageError &e) {
        throw ConfigError(std::string("configurations: ") + e.what());
    }

    parmul::Configs c;
    auto status = google::protobuf::util::JsonStringToMessage(json_str, &c);
    if (!status.ok()) {
        throw ConfigError("configurations: invalid config file " + config_file.string() + ": " +
                          status.ToString());
    }
    return c;
}

std::uint64_t services::configurations::resolve_worker_count(const parmul::Configs &configs, std::uint64_t rows) {
    if (configs.number_of_workers() > 0) {
        return configs.number_of_workers();
    }
    return std::clamp<std::uint64_t>(concurrency::num_cpus, 1, std::max<std::uint64_t>(rows, 1));
}
