#pragma once

#include "parmul.pb.h"

namespace runner {
    /**
     * Loads both operands named in the configs, multiplies them with the configured element type and worker
     * count, and stores the product at the output path.
     * Errors from loading, multiplying or storing propagate unchanged.
     */
    void run(const parmul::AppConfigs &app_configs);
}
