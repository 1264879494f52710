#include "qf/dns_codec.hpp"

#include <utility>

#include <ldns/ldns.h>

namespace qf
{
static ldns_rr_type to_ldns_type(RecordType type)
{
    switch (type)
    {
        case RecordType::A: return LDNS_RR_TYPE_A;
        case RecordType::AAAA: return LDNS_RR_TYPE_AAAA;
    }
    return LDNS_RR_TYPE_A;
}

static std::string status_text(ldns_status st)
{
    const char *s = ldns_get_errorstr_by_id(st);
    return s ? s : "unknown ldns status";
}

DnsQuery build_query(const std::string &domain, RecordType type, std::uint16_t id)
{
    DnsQuery out{};

    ldns_pkt *pkt = nullptr;
    ldns_status st = ldns_pkt_query_new_frm_str(
        &pkt,
        domain.c_str(),
        to_ldns_type(type),
        LDNS_RR_CLASS_IN,
        LDNS_RD);
    if (st != LDNS_STATUS_OK || !pkt)
    {
        out.rc = -1;
        out.error = std::string("ldns query build failed: ") + status_text(st);
        if (pkt) ldns_pkt_free(pkt);
        return out;
    }
    ldns_pkt_set_id(pkt, id);

    uint8_t *wire = nullptr;
    size_t size = 0;
    st = ldns_pkt2wire(&wire, pkt, &size);
    ldns_pkt_free(pkt);
    if (st != LDNS_STATUS_OK || !wire)
    {
        out.rc = -1;
        out.error = std::string("ldns wire conversion failed: ") + status_text(st);
        if (wire) LDNS_FREE(wire);
        return out;
    }

    out.wire.assign(wire, wire + size);
    LDNS_FREE(wire);
    out.rc = 0;
    return out;
}

DnsReply decode_reply(std::span<const std::uint8_t> payload)
{
    DnsReply out{};

    ldns_pkt *pkt = nullptr;
    ldns_status st = ldns_wire2pkt(&pkt, payload.data(), payload.size());
    if (st != LDNS_STATUS_OK || !pkt)
    {
        out.rc = -1;
        out.error = std::string("malformed reply: ") + status_text(st);
        if (pkt) ldns_pkt_free(pkt);
        return out;
    }

    out.id = ldns_pkt_id(pkt);

    ldns_rr_list *question = ldns_pkt_question(pkt);
    if (question && ldns_rr_list_rr_count(question) > 0)
    {
        ldns_rr *q = ldns_rr_list_rr(question, 0);
        if (char *s = ldns_rdf2str(ldns_rr_owner(q)))
        {
            out.qname = s;
            LDNS_FREE(s);
        }
    }

    ldns_rr_list *ans = ldns_pkt_answer(pkt);
    const size_t answer_count = ans ? ldns_rr_list_rr_count(ans) : 0;
    out.answers.reserve(answer_count);
    for (size_t i = 0; i < answer_count; ++i)
    {
        ldns_rr *rr = ldns_rr_list_rr(ans, i);
        if (char *s = ldns_rr2str(rr))
        {
            std::string line = s;
            LDNS_FREE(s);
            while (!line.empty() && (line.back() == '\n' || line.back() == ' ')) line.pop_back();
            out.answers.push_back(std::move(line));
        }
        else
        {
            out.answers.emplace_back("");
        }
    }

    out.rc = 0;
    ldns_pkt_free(pkt);
    return out;
}
} // namespace qf
