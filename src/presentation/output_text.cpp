#include "qf/output.hpp"

#include <sstream>
#include <iomanip>

#include "qf/options.hpp"
#include "qf/model.hpp"

namespace qf {

const char *record_type_str(const RecordType r)
{
    switch (r)
    {
        case RecordType::A: return "A";
        case RecordType::AAAA: return "AAAA";
    }
    return "A";
}

const char *status_str(const Status s)
{
    switch (s)
    {
        case Status::Sent: return "sent";
        case Status::Success: return "success";
        case Status::Timeout: return "timeout";
        case Status::Failed: return "failed";
        case Status::WorkerDone: return "worker-done";
    }
    return "unknown";
}

static void write_counters(std::ostringstream& os, const Counters& c, std::uint32_t percent, double elapsed_s)
{
    os << "sent: " << c.sent
       << ", success: " << c.success
       << ", timeout: " << c.timeout
       << ", failed: " << c.failed
       << ", thread finished: " << c.workers_done
       << ", percent: " << percent << '%'
       << ", time: " << std::fixed << std::setprecision(3) << elapsed_s << 's';
}

std::string format_progress_text(std::size_t worker, const Counters& c, std::uint32_t percent, double elapsed_s)
{
    std::ostringstream os;
    os << "worker#" << worker << ' ';
    write_counters(os, c, percent, elapsed_s);
    return os.str();
}

std::string format_summary_text(const Counters& c, std::uint32_t percent, double elapsed_s)
{
    std::ostringstream os;
    os << "ALLDONE ";
    write_counters(os, c, percent, elapsed_s);
    return os.str();
}

std::string format_header_text(const Options& opt, std::size_t domain_count)
{
    std::ostringstream os;
    os << "Target: " << opt.server
       << "  Record: " << record_type_str(opt.record)
       << "  Timeout: " << opt.timeout_ms << " ms\n";
    os << "Threads: " << opt.threads
       << "  Queries/thread: " << opt.number
       << "  Total: " << static_cast<long long>(opt.threads) * opt.number << '\n';
    os << "Domains: " << domain_count << " from " << opt.domains;
    return os.str();
}

} // namespace qf
