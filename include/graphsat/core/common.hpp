/*
 * Copyright (c) 2021 Trail of Bits, Inc.
 */

#pragma once

#include <cstdint>

namespace graphsat
{
    using node_id_t = std::uint32_t;

    using cost_t = double;

} // namespace graphsat
