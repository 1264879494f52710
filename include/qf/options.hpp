#pragma once

#include <string>

namespace qf
{
enum class RecordType { A, AAAA };

struct Options
{
    int threads = 10;                  // number of parallel workers
    int number = 100;                  // queries per worker
    std::string domains = "domains.txt";
    RecordType record = RecordType::A;
    std::string server;                // ip:port or [ipv6]:port (required)
    int timeout_ms = 500;              // per-request timeout
    int debug = 0;                     // 0: summary, 1: progress, 2: per-query detail
    bool json = false;                 // final summary as JSON
};

const char *record_type_str(RecordType r);
} // namespace qf
