/*
 * Copyright (c) 2023 Trail of Bits, Inc.
 */

#include <graphsat/algo/saturation.hpp>

namespace graphsat {

    std::string to_string(stop_reason reason) {
        switch (reason) {
            case stop_reason::saturated: return "saturated";
            case stop_reason::goal_reached: return "goal reached";
            case stop_reason::iteration_limit: return "iteration limit";
            case stop_reason::node_limit: return "node limit";
            case stop_reason::time_limit: return "time limit";
            case stop_reason::none: return "none";
        }
        return "unknown";
    }

} // namespace graphsat
