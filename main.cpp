// Concurrent DNS query dispatcher (C++23)

#include <cstdio>
#include <memory>
#include <print>
#include <string>
#include <vector>

#include "fq/cli.hpp"
#include "fq/exchange.hpp"
#include "fq/http.hpp"
#include "fq/logger.hpp"
#include "fq/options.hpp"
#include "fq/output.hpp"
#include "fq/packet.hpp"
#include "fq/resolv_conf.hpp"
#include "fq/resolver.hpp"

int main(int argc, char **argv)
{
    fq::Options opt;
    if (!fq::parse_args(argc, argv, opt)) return 2;

    auto log = std::make_shared<fq::StderrLogger>(
        opt.verbose ? fq::LogLevel::Debug : fq::LogLevel::Warn);

    if (!opt.resolv.resolv_file.empty())
    {
        const int cli_timeout = opt.resolv.timeout_s;
        auto rc = fq::load_resolv_conf(opt.resolv.resolv_file, opt.resolv);
        if (rc.rc != 0)
        {
            std::println(stderr, "cannot read resolv.conf: {}", rc.error);
            return 2;
        }
        if (opt.timeout_given) opt.resolv.timeout_s = cli_timeout;
        log->debug("{} nameserver(s) from {}", rc.nameservers_added, opt.resolv.resolv_file);
    }

    if (!fq::seed_query_ids()) log->warn("cannot seed query ids from /dev/urandom");
    auto built = fq::make_query(opt.query, ldns_get_random());
    if (built.kind != fq::QueryErrorKind::None)
    {
        std::println(stderr, "{}", built.error);
        return 2;
    }

    fq::Resolver resolver(opt.resolv,
                          opt.http,
                          std::make_shared<fq::LdnsExchanger>(),
                          std::make_shared<fq::CurlHttpClient>(),
                          log);

    const std::vector<std::string> upstreams = resolver.nameservers();
    const fq::LookupResult result = resolver.resolve(opt.net, *built.query);

    if (opt.json)
    {
        std::println("{}", fq::build_result_json(opt, upstreams, result));
    }
    else
    {
        std::print("{}", fq::format_header_text(opt, upstreams));
        std::print("{}", fq::format_result_text(result));
    }
    return result.ok() ? 0 : 1;
}
