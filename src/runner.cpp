#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include "runner.hpp"
#include "math_utils/matrix_operations.hpp"
#include "marshal/text_format.hpp"
#include "services/factory.hpp"

namespace runner {
    namespace {
        template<typename T>
        void run_typed(const parmul::AppConfigs &app_configs) {
            const auto &configs = app_configs.configs();

            auto left = std::make_shared<const math_utils::matrix<T>>(
                    marshal::load_matrix<T>(app_configs.left_matrix_path()));
            auto right = std::make_shared<const math_utils::matrix<T>>(
                    marshal::load_matrix<T>(app_configs.right_matrix_path()));

            auto num_workers = services::configurations::resolve_worker_count(configs, left->rows());

            if (configs.verbose()) {
                std::cout << "======" << std::endl;
                std::cout << "left:        " << left->rows() << "x" << left->cols() << std::endl;
                std::cout << "right:       " << right->rows() << "x" << right->cols() << std::endl;
                std::cout << "element:     " << parmul::ElementType_Name(configs.element_type()) << std::endl;
                std::cout << "num workers: " << num_workers << std::endl;
                std::cout << "======" << std::endl;
            }

            auto start = std::chrono::high_resolution_clock::now();
            auto result = math_utils::multiply<T>(left, right, num_workers);
            auto end = std::chrono::high_resolution_clock::now();

            if (configs.verbose()) {
                std::cout << "multiply took: "
                          << std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count()
                          << "ms" << std::endl;
            }

            marshal::store_matrix(app_configs.output_matrix_path(), result);
        }
    }

    void run(const parmul::AppConfigs &app_configs) {
        switch (app_configs.configs().element_type()) {
            case parmul::FLOAT64:
                run_typed<double>(app_configs);
                break;
            case parmul::FLOAT32:
                run_typed<float>(app_configs);
                break;
            case parmul::INT32:
                run_typed<std::int32_t>(app_configs);
                break;
            case parmul::INT64:
                run_typed<std::int64_t>(app_configs);
                break;
            default:
                throw services::configurations::ConfigError(
                        "runner: unsupported element type " + std::to_string(app_configs.configs().element_type()));
        }
    }
}
