#include "qf/aggregate.hpp"

#include <utility>

#include "qf/output.hpp"

namespace qf {

std::uint32_t completion_percent(std::uint64_t sent, std::uint64_t total)
{
    if (total == 0) return 100;
    return static_cast<std::uint32_t>(100.0 * static_cast<double>(sent) / static_cast<double>(total));
}

Aggregator::Aggregator(std::size_t workers,
                       std::uint64_t total_queries,
                       int debug,
                       LineSink sink,
                       SummaryFormatter summary)
    : workers_(workers),
      total_(total_queries),
      debug_(debug),
      sink_(std::move(sink)),
      summary_(summary ? std::move(summary) : SummaryFormatter(format_summary_text)),
      start_(std::chrono::steady_clock::now())
{
}

bool Aggregator::on_event(const StatusEvent& ev)
{
    switch (ev.status)
    {
        case Status::Sent: ++counters_.sent; break;
        case Status::Success: ++counters_.success; break;
        case Status::Timeout: ++counters_.timeout; break;
        case Status::Failed: ++counters_.failed; break;
        case Status::WorkerDone: ++counters_.workers_done; break;
    }
    if (debug_ >= 1 && sink_)
    {
        sink_(format_progress_text(ev.worker, counters_, percent(), elapsed_seconds()));
    }
    return done();
}

Counters Aggregator::run(EventChannel& events)
{
    while (!done())
    {
        on_event(events.pop());
    }
    if (sink_) sink_(summary());
    return counters_;
}

std::uint32_t Aggregator::percent() const
{
    return completion_percent(counters_.sent, total_);
}

double Aggregator::elapsed_seconds() const
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
}

std::string Aggregator::summary() const
{
    return summary_(counters_, percent(), elapsed_seconds());
}

} // namespace qf
