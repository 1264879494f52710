#include "qf/runner.hpp"

#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "qf/concurrency.hpp"
#include "qf/output.hpp"
#include "qf/worker.hpp"

namespace qf {

RunResult run_load(const Options& opt,
                   const DomainPool& pool,
                   const TransportFactory& make_transport,
                   const LineSink& sink,
                   const ThreadLauncher& launch)
{
    if (opt.threads < 1) throw std::invalid_argument("thread count must be at least 1");
    if (pool.empty()) throw std::invalid_argument("no valid domains to query");

    const auto workers = static_cast<std::size_t>(opt.threads);
    const auto number = opt.number > 0 ? opt.number : 0;

    TxIdAllocator ids;
    EventChannel events;

    // All endpoints exist before the first thread starts, so a bind failure
    // aborts the run without any worker having been spawned.
    std::vector<QueryWorker> pool_workers;
    pool_workers.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i)
    {
        WorkerConfig cfg{};
        cfg.index = i;
        cfg.record = opt.record;
        cfg.number = number;
        cfg.timeout = std::chrono::milliseconds(opt.timeout_ms);
        cfg.debug = opt.debug;
        pool_workers.emplace_back(cfg, pool, ids, events, make_transport(i));
    }

    SummaryFormatter summary;
    if (opt.json)
    {
        summary = [&opt](const Counters& c, std::uint32_t percent, double elapsed_s)
        {
            return build_summary_json(opt, c, percent, elapsed_s);
        };
    }
    Aggregator agg(workers,
                   static_cast<std::uint64_t>(workers) * static_cast<std::uint64_t>(number),
                   opt.debug,
                   sink,
                   std::move(summary));

    std::mutex ex_mtx;
    std::exception_ptr first_ex = nullptr;

    auto join_all = [](std::vector<std::thread>& ths)
    {
        for (auto& th : ths)
        {
            if (th.joinable()) th.join();
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    try
    {
        for (auto& w : pool_workers)
        {
            std::function<void()> body = [&, wp = &w]
            {
                try
                {
                    wp->run();
                }
                catch (...)
                {
                    {
                        std::lock_guard<std::mutex> lk(ex_mtx);
                        if (!first_ex) first_ex = std::current_exception();
                    }
                    // keep the aggregator's completion count reachable
                    events.push(StatusEvent{Status::WorkerDone, static_cast<std::size_t>(wp - pool_workers.data())});
                }
            };
            threads.push_back(launch ? launch(std::move(body)) : std::thread(std::move(body)));
        }
    }
    catch (...)
    {
        // Started workers finish on their own: the channel never blocks a producer.
        join_all(threads);
        throw;
    }

    RunResult out{};
    out.counters = agg.run(events);
    out.percent = agg.percent();
    out.elapsed_s = agg.elapsed_seconds();

    join_all(threads);
    if (first_ex) std::rethrow_exception(first_ex);
    return out;
}

RunResult run_load(const Options& opt, const DomainPool& pool, const LineSink& sink)
{
    const auto server = parse_server_address(opt.server);
    if (!server) throw std::invalid_argument("invalid server address: " + opt.server);

    return run_load(
        opt,
        pool,
        [&server](std::size_t) -> std::unique_ptr<Transport>
        {
            return std::make_unique<UdpEndpoint>(*server);
        },
        sink);
}

} // namespace qf
