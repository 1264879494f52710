#pragma once

#include <cstddef>
#include <cstdint>

namespace qf {

enum class Status {
    Sent,
    Success,
    Timeout,
    Failed,
    WorkerDone,
};

const char* status_str(Status s);

// One worker outcome, consumed exactly once by the aggregator.
struct StatusEvent {
    Status      status{};
    std::size_t worker{};   // originating worker index
};

struct Counters {
    std::uint64_t sent{};
    std::uint64_t success{};
    std::uint64_t timeout{};
    std::uint64_t failed{};
    std::uint64_t workers_done{};
};

} // namespace qf
