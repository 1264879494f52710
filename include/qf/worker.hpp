#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "qf/concurrency.hpp"
#include "qf/domains.hpp"
#include "qf/endpoint.hpp"
#include "qf/model.hpp"
#include "qf/options.hpp"

namespace qf {

struct WorkerConfig {
    std::size_t               index{};
    RecordType                record{RecordType::A};
    int                       number{};
    std::chrono::milliseconds timeout{500};
    int                       debug{};
};

// Drives one endpoint through `number` request/response cycles and reports
// every outcome to the event channel.
//
// Reply waiting uses a single deadline per iteration: replies carrying a
// different transaction ID are discarded and the wait resumes with whatever
// time is left, so a flood of stray replies cannot stretch one iteration
// beyond `timeout`.
class QueryWorker {
public:
    // Throws std::invalid_argument when the pool is empty or the endpoint is null.
    QueryWorker(WorkerConfig cfg,
                const DomainPool& pool,
                TxIdAllocator& ids,
                EventChannel& events,
                std::unique_ptr<Transport> endpoint);

    // Runs all iterations, then emits WorkerDone.
    void run();

    // One iteration: emits Sent (when the send succeeded) followed by the
    // terminal status, or a lone Failed when the send failed.
    void run_once();

private:
    Status send_query(std::uint16_t id, const std::string& domain);
    Status await_reply(std::uint16_t id);
    void emit(Status s);

    WorkerConfig cfg_;
    const DomainPool& pool_;
    TxIdAllocator& ids_;
    EventChannel& events_;
    std::unique_ptr<Transport> endpoint_;
    std::mt19937 rng_;
    std::vector<std::uint8_t> buf_;
};

} // namespace qf
