#pragma once

#include <string>
#include <string_view>
#include "eff-scope/config.hpp"
#include "fmt/core.h"

// Build with EFF_SCOPE_TRACE defined (-DEFF_SCOPE_TRACE=ON) to log every
// scope transition to stderr.

namespace effscope {

struct scope_tag;

std::string demangle(const char* name);

// Prints the current call stack, one frame per line, to stderr.
void print_frames(const char* prefix);

// Contract violations are programming bugs: report and abort.
[[noreturn]] EFF_SCOPE_NOINLINE void fatal_scope_violation(
    const scope_tag& tag,
    std::string_view operation,
    std::string_view reason);

[[noreturn]] EFF_SCOPE_NOINLINE void fatal_protocol_violation(
    std::string_view operation,
    std::string_view reason);

}  // namespace effscope
