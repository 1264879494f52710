#include "qf/output.hpp"

#include <sstream>
#include <iomanip>

#include "qf/options.hpp"
#include "qf/model.hpp"
#include "qf/json.hpp"

namespace qf
{
std::string build_summary_json(const Options &opt,
                               const Counters &c,
                               std::uint32_t percent,
                               double elapsed_s)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "{";
    os << R"("server":")" << json_escape(opt.server) << R"(")";
    os << R"(,"record":")" << record_type_str(opt.record) << R"(")";
    os << R"(,"threads":)" << opt.threads
       << R"(,"number":)" << opt.number
       << R"(,"timeout_ms":)" << opt.timeout_ms;
    os << R"(,"sent":)" << c.sent
       << R"(,"success":)" << c.success
       << R"(,"timeout":)" << c.timeout
       << R"(,"failed":)" << c.failed
       << R"(,"workers_done":)" << c.workers_done;
    os << R"(,"percent":)" << percent
       << R"(,"elapsed_s":)" << elapsed_s;
    os << "}";
    return os.str();
}
} // namespace qf
