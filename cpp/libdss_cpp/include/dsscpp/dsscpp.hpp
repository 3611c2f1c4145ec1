/**
 * @file dsscpp.hpp
 * @brief Umbrella header including the context and all engine interfaces.
 *
 * This convenience header pulls in `dsscpp/context.hpp` and
 * `dsscpp/dss.hpp` (which brings the circuit interfaces) for typical
 * application usage.
 */
#pragma once

#include "dsscpp/context.hpp"
#include "dsscpp/dss.hpp"
