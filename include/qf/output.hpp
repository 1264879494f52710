#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace qf
{
// Forward declarations to avoid heavy includes in header
struct Options;
struct Counters;

// Progress line rendered per event at debug >= 1 (no trailing newline)
std::string format_progress_text(std::size_t worker,
                                 const Counters &c,
                                 std::uint32_t percent,
                                 double elapsed_s);

// Final "ALLDONE ..." line (no trailing newline)
std::string format_summary_text(const Counters &c,
                                std::uint32_t percent,
                                double elapsed_s);

// Startup banner printed at debug >= 1
std::string format_header_text(const Options &opt, std::size_t domain_count);

// Final summary as a single JSON object (no trailing newline)
std::string build_summary_json(const Options &opt,
                               const Counters &c,
                               std::uint32_t percent,
                               double elapsed_s);
} // namespace qf
