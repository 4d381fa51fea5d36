/// @file src/core/errors.cpp
/// @brief Message formatting for the cosmotag exception hierarchy.

#include "cosmotag/errors.hpp"

#include <fmt/format.h>

namespace cosmotag {

DispatchUnsupported::DispatchUnsupported(Ufunc op, const std::string& reason)
    : CosmoError(fmt::format("DispatchUnsupported: {}: {}", ufunc_name(op), reason))
    , op_(op) {}

} // namespace cosmotag
