#include "sb/rawdns.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <vector>
#include <sys/time.h>

#include "sb/netutil.hpp"

#ifdef HAVE_LDNS
#include <ldns/ldns.h>
#endif

namespace sb
{
bool is_negative(RawDnsErrorKind kind)
{
    return kind == RawDnsErrorKind::NxDomain
           || kind == RawDnsErrorKind::NoAnswer
           || kind == RawDnsErrorKind::NoNameservers;
}

const char *raw_dns_kind_str(RawDnsErrorKind kind)
{
    switch (kind)
    {
        case RawDnsErrorKind::None: return "none";
        case RawDnsErrorKind::NotAvailable: return "not-available";
        case RawDnsErrorKind::InitFailed: return "init-failed";
        case RawDnsErrorKind::InvalidQname: return "invalid-qname";
        case RawDnsErrorKind::Timeout: return "timeout";
        case RawDnsErrorKind::NxDomain: return "nxdomain";
        case RawDnsErrorKind::NoAnswer: return "no-answer";
        case RawDnsErrorKind::NoNameservers: return "no-nameservers";
        case RawDnsErrorKind::QueryFailed: return "query-failed";
    }
    return "unknown";
}

static DnsLookupResult fail(RawDnsErrorKind kind, std::string error)
{
    DnsLookupResult out{};
    out.rc = -1;
    out.kind = kind;
    out.error = std::move(error);
    return out;
}

#ifndef HAVE_LDNS
static DnsLookupResult not_available()
{
    return fail(
        RawDnsErrorKind::NotAvailable,
        "ldns not available: rebuild with ldns (pkg-config ldns) to enable DNS lookups");
}

DnsLookupResult query_a(const std::string &, int)
{
    return not_available();
}

DnsLookupResult query_a_at(const std::string &,
                           const std::vector<std::string> &,
                           int)
{
    return not_available();
}

DnsLookupResult query_ns(const std::string &, int)
{
    return not_available();
}
#else
// Builds a resolver from resolv.conf when `nameservers` is empty, otherwise
// one pinned to the given addresses. Returns nullptr on failure.
static ldns_resolver *make_resolver(const std::vector<std::string> &nameservers,
                                    int timeout_ms,
                                    std::string &error)
{
    ldns_resolver *res = nullptr;
    if (nameservers.empty())
    {
        if (ldns_resolver_new_frm_file(&res, nullptr) != LDNS_STATUS_OK)
        {
            error = "ldns_resolver init from resolv.conf failed";
            return nullptr;
        }
    }
    else
    {
        res = ldns_resolver_new();
        if (!res)
        {
            error = "ldns_resolver_new failed";
            return nullptr;
        }
        for (const auto &ns: nameservers)
        {
            ldns_rdf *ns_rdf = nullptr;
            if (ns.find(':') != std::string::npos)
            {
                ns_rdf = ldns_rdf_new_frm_str(LDNS_RDF_TYPE_AAAA, ns.c_str());
            }
            else
            {
                ns_rdf = ldns_rdf_new_frm_str(LDNS_RDF_TYPE_A, ns.c_str());
            }
            if (!ns_rdf)
            {
                error = "invalid nameserver address: " + ns;
                ldns_resolver_deep_free(res);
                return nullptr;
            }
            (void) ldns_resolver_push_nameserver(res, ns_rdf);
            ldns_rdf_deep_free(ns_rdf);
        }
        ldns_resolver_set_random(res, true);
    }

    ldns_resolver_set_recursive(res, true);
    ldns_resolver_set_fallback(res, true);
    // one try per server: timeouts are surfaced to the caller, who owns the retry policy
    ldns_resolver_set_retry(res, 1);
    if (timeout_ms >= 0)
    {
        struct timeval tv{
            .tv_sec = timeout_ms / 1000,
            .tv_usec = (timeout_ms % 1000) * 1000
        };
        ldns_resolver_set_timeout(res, tv);
    }
    ldns_resolver_set_edns_udp_size(res, 1232);
    return res;
}

static RawDnsErrorKind kind_from_status(ldns_status st)
{
    switch (st)
    {
        case LDNS_STATUS_NETWORK_ERR: return RawDnsErrorKind::Timeout;
        case LDNS_STATUS_RES_NO_NS: return RawDnsErrorKind::NoNameservers;
        default: return RawDnsErrorKind::QueryFailed;
    }
}

static DnsLookupResult lookup(const std::string &qname,
                              ldns_rr_type qtype,
                              const std::vector<std::string> &nameservers,
                              int timeout_ms)
{
    std::string error;
    ldns_resolver *res = make_resolver(nameservers, timeout_ms, error);
    if (!res) return fail(RawDnsErrorKind::InitFailed, error);

    ldns_rdf *name = ldns_dname_new_frm_str(qname.c_str());
    if (!name)
    {
        ldns_resolver_deep_free(res);
        return fail(RawDnsErrorKind::InvalidQname, "invalid qname: " + qname);
    }

    ldns_pkt *pkt = nullptr;
    ldns_status st = ldns_resolver_query_status(
        &pkt,
        res,
        name,
        qtype,
        LDNS_RR_CLASS_IN,
        LDNS_RD);

    if (st != LDNS_STATUS_OK || !pkt)
    {
        DnsLookupResult out = fail(
            kind_from_status(st),
            std::string("ldns query failed: ") + ldns_get_errorstr_by_id(st));
        if (pkt) ldns_pkt_free(pkt);
        ldns_rdf_deep_free(name);
        ldns_resolver_deep_free(res);
        return out;
    }

    DnsLookupResult out{};
    out.rcode = static_cast<int>(ldns_pkt_get_rcode(pkt));
    switch (ldns_pkt_get_rcode(pkt))
    {
        case LDNS_RCODE_NOERROR:
            break;
        case LDNS_RCODE_NXDOMAIN:
        case LDNS_RCODE_YXDOMAIN:
            out.rc = -1;
            out.kind = RawDnsErrorKind::NxDomain;
            out.error = qname + " does not exist";
            break;
        case LDNS_RCODE_SERVFAIL:
        case LDNS_RCODE_REFUSED:
            out.rc = -1;
            out.kind = RawDnsErrorKind::NoNameservers;
            out.error = "no nameserver could answer " + qname;
            break;
        default:
            out.rc = -1;
            out.kind = RawDnsErrorKind::QueryFailed;
            out.error = "unexpected rcode " + std::to_string(out.rcode);
            break;
    }

    if (out.rc == 0)
    {
        ldns_rr_list *rrs = ldns_pkt_rr_list_by_type(
            pkt,
            qtype,
            LDNS_SECTION_ANSWER);
        const size_t count = rrs ? ldns_rr_list_rr_count(rrs) : 0;
        uint32_t min_ttl = std::numeric_limits<uint32_t>::max();
        for (size_t i = 0; i < count; ++i)
        {
            ldns_rr *rr = ldns_rr_list_rr(rrs, i);
            if (char *s = ldns_rdf2str(ldns_rr_rdf(rr, 0)))
            {
                std::string rdata = s;
                LDNS_FREE(s);
                if (qtype == LDNS_RR_TYPE_NS) rdata = strip_root_dot(rdata);
                out.records.push_back(std::move(rdata));
            }
            min_ttl = std::min(min_ttl, ldns_rr_ttl(rr));
            if (out.name.empty())
            {
                if (char *owner = ldns_rdf2str(ldns_rr_owner(rr)))
                {
                    out.name = strip_root_dot(owner);
                    LDNS_FREE(owner);
                }
            }
        }
        if (rrs) ldns_rr_list_deep_free(rrs);

        if (out.records.empty())
        {
            out.rc = -1;
            out.kind = RawDnsErrorKind::NoAnswer;
            out.error = "no answer for " + qname;
        }
        else
        {
            out.ttl = min_ttl;
        }
    }

    ldns_pkt_free(pkt);
    ldns_rdf_deep_free(name);
    ldns_resolver_deep_free(res);
    return out;
}

DnsLookupResult query_a(const std::string &qname, int timeout_ms)
{
    return lookup(qname, LDNS_RR_TYPE_A, {}, timeout_ms);
}

DnsLookupResult query_a_at(const std::string &qname,
                           const std::vector<std::string> &nameservers,
                           int timeout_ms)
{
    if (nameservers.empty())
    {
        return fail(RawDnsErrorKind::InitFailed, "no nameserver to pin");
    }
    return lookup(qname, LDNS_RR_TYPE_A, nameservers, timeout_ms);
}

DnsLookupResult query_ns(const std::string &domain, int timeout_ms)
{
    return lookup(domain, LDNS_RR_TYPE_NS, {}, timeout_ms);
}
#endif
} // namespace sb
