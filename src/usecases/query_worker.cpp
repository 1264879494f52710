#include "qf/worker.hpp"

#include <format>
#include <stdexcept>
#include <utility>

#include "qf/console.hpp"
#include "qf/dns_codec.hpp"

namespace qf
{
QueryWorker::QueryWorker(WorkerConfig cfg,
                         const DomainPool &pool,
                         TxIdAllocator &ids,
                         EventChannel &events,
                         std::unique_ptr<Transport> endpoint)
    : cfg_(cfg),
      pool_(pool),
      ids_(ids),
      events_(events),
      endpoint_(std::move(endpoint)),
      rng_(std::random_device{}())
{
    if (pool_.empty()) throw std::invalid_argument("domain pool is empty");
    if (!endpoint_) throw std::invalid_argument("worker endpoint is null");
}

void QueryWorker::run()
{
    for (int i = 0; i < cfg_.number; ++i) run_once();
    emit(Status::WorkerDone);
}

void QueryWorker::run_once()
{
    const std::uint16_t id = ids_.next();
    const std::string &domain = pool_.pick(rng_);
    if (cfg_.debug >= 2) console_println(std::format("select domain: {}", domain));

    const Status sent = send_query(id, domain);
    emit(sent);
    if (sent != Status::Sent)
    {
        if (cfg_.debug >= 2) console_println(std::format("worker#{} id {} {}: send {}", cfg_.index, id, domain, status_str(sent)));
        return;
    }

    const Status result = await_reply(id);
    if (cfg_.debug >= 2 && result != Status::Success)
        console_println(std::format("worker#{} id {} {}: {}", cfg_.index, id, domain, status_str(result)));
    emit(result);
}

Status QueryWorker::send_query(std::uint16_t id, const std::string &domain)
{
    DnsQuery q = build_query(domain, cfg_.record, id);
    if (q.rc != 0)
    {
        if (cfg_.debug >= 2) console_eprintln(std::format("worker#{} {}: {}", cfg_.index, domain, q.error));
        return Status::Failed;
    }
    return endpoint_->send(q.wire) ? Status::Sent : Status::Failed;
}

Status QueryWorker::await_reply(std::uint16_t id)
{
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + cfg_.timeout;

    for (;;)
    {
        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0) return Status::Timeout;

        switch (endpoint_->recv(buf_, remaining))
        {
            case RecvStatus::Timeout: return Status::Timeout;
            case RecvStatus::Error: return Status::Failed;
            case RecvStatus::Ok: break;
        }

        DnsReply reply = decode_reply(buf_);
        if (reply.rc != 0) return Status::Failed;
        if (reply.id != id) continue; // stale or foreign reply, keep waiting

        if (cfg_.debug >= 2)
        {
            std::string answers;
            for (const auto &a: reply.answers)
            {
                if (!answers.empty()) answers += "; ";
                answers += a;
            }
            console_println(std::format("OK, {} -> [{}]", reply.qname, answers));
        }
        return Status::Success;
    }
}

void QueryWorker::emit(Status s)
{
    events_.push(StatusEvent{s, cfg_.index});
}
} // namespace qf
