#pragma once

#include <string_view>

namespace qf {

// Line output shared by the aggregator and all workers. Each call writes one
// complete line under a process-wide lock so lines never interleave.
void console_println(std::string_view line);
void console_eprintln(std::string_view line);

} // namespace qf
