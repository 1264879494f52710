#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "qf/options.hpp"

namespace qf {

struct DnsQuery {
    int rc{};                     // 0 on success, -1 on error
    std::string error;            // error message when rc != 0
    std::vector<std::uint8_t> wire;
};

struct DnsReply {
    int rc{};                     // 0 on success, -1 when the payload is unparsable
    std::string error;

    std::uint16_t id{};
    std::string qname;            // first question, empty when absent
    std::vector<std::string> answers; // textual RR lines
};

// Encode a recursive IN-class query for `domain` carrying transaction `id`.
DnsQuery build_query(const std::string& domain, RecordType type, std::uint16_t id);

// Decode a reply datagram. Only the header ID, first question and answer
// section are extracted.
DnsReply decode_reply(std::span<const std::uint8_t> payload);

} // namespace qf
