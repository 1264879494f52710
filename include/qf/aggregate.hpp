#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "qf/concurrency.hpp"
#include "qf/model.hpp"

namespace qf {

using LineSink = std::function<void(const std::string& /*line*/)>;

// Renders the final summary line from the closing counters.
using SummaryFormatter = std::function<std::string(const Counters& /*counters*/,
                                                   std::uint32_t /*percent*/,
                                                   double /*elapsed_s*/)>;

// Sole consumer of the event channel. Folds events into counters, renders a
// progress line per event when debug >= 1 and a final summary once every
// worker has reported WorkerDone.
class Aggregator {
public:
    // A null `summary` falls back to format_summary_text.
    Aggregator(std::size_t workers,
               std::uint64_t total_queries,
               int debug,
               LineSink sink,
               SummaryFormatter summary = nullptr);

    // Returns true once the run is complete.
    bool on_event(const StatusEvent& ev);

    // Drains `events` until done, emits the summary and returns the counters.
    Counters run(EventChannel& events);

    bool done() const { return counters_.workers_done >= workers_; }
    const Counters& counters() const { return counters_; }
    std::uint32_t percent() const;
    double elapsed_seconds() const;

    // Final summary line (without trailing newline)
    std::string summary() const;

private:
    std::size_t workers_;
    std::uint64_t total_;
    int debug_;
    LineSink sink_;
    SummaryFormatter summary_;
    Counters counters_{};
    std::chrono::steady_clock::time_point start_;
};

// Completion percentage of `sent` over `total`, truncated; 100 when total is 0.
std::uint32_t completion_percent(std::uint64_t sent, std::uint64_t total);

} // namespace qf
