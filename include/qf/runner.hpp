#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <thread>

#include "qf/aggregate.hpp"
#include "qf/domains.hpp"
#include "qf/endpoint.hpp"
#include "qf/model.hpp"
#include "qf/options.hpp"

namespace qf {

// Creates the dedicated endpoint for worker `index`.
using TransportFactory = std::function<std::unique_ptr<Transport>(std::size_t /*index*/)>;

// Starts the thread running one worker body. A null launcher uses std::thread.
using ThreadLauncher = std::function<std::thread(std::function<void()> /*body*/)>;

struct RunResult {
    Counters      counters{};
    std::uint32_t percent{};
    double        elapsed_s{};
};

// Spawns opt.threads workers, aggregates their events on the calling thread
// and returns once every worker has finished.
// Throws std::invalid_argument for an empty pool or opt.threads < 1, and
// propagates any exception from `make_transport` before a worker starts.
// If launching a worker thread throws, the workers already started are joined
// and the exception is rethrown.
RunResult run_load(const Options& opt,
                   const DomainPool& pool,
                   const TransportFactory& make_transport,
                   const LineSink& sink,
                   const ThreadLauncher& launch = nullptr);

// Same as above with UDP endpoints connected to opt.server.
// Throws std::invalid_argument when opt.server does not parse.
RunResult run_load(const Options& opt, const DomainPool& pool, const LineSink& sink);

} // namespace qf
