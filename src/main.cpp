#include "config.hpp"
#include "dnscontext.hpp"
#include "hosts.hpp"
#include "localaddrs.hpp"
#include "logging.hpp"

#include <getopt.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

static Config config;

void usage(const std::string& prog)
{
    printf("Usage: %s [options] <command> [arguments]\n", prog.c_str());
    printf("\n");
    printf("Commands:\n");
    printf("  lookup <question> [type [class]]  Print the records, combined lists are used transparently\n");
    printf("  ns <domain>                       Print the nameservers of domain\n");
    printf("  hosts-equal <host1> <host2>       Print true when both are the same machine\n");
    printf("\n");
    printf("Options:\n");
    printf("  -c, --config <file>   Configuration file\n");
    printf("  -t, --timeout <secs>  Query timeout, overrides DNS_TIMEOUT\n");
    printf("  -e, --exact           lookup: all records matching type and class\n");
    printf("  -s, --skip-fallback   hosts-equal: do not fall back to the system resolver\n");
    printf("  -d, --debug           Log debug messages to stderr\n");
    printf("  -h, --help            This help\n");
}

int main(int argc, char** argv)
{
    static struct option long_options[] = {
        { "config",        required_argument, nullptr, 'c' },
        { "timeout",       required_argument, nullptr, 't' },
        { "exact",         no_argument,       nullptr, 'e' },
        { "skip-fallback", no_argument,       nullptr, 's' },
        { "debug",         no_argument,       nullptr, 'd' },
        { "help",          no_argument,       nullptr, 'h' },
        { nullptr,         0,                 nullptr, 0   },
    };

    bool exact = false;
    bool skipFallback = false;
    bool debug = false;
    unsigned timeout = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, "c:t:esdh", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'c':
            if (!config.parseFile(optarg)) {
                return 1;
            }
            break;
        case 't':
            timeout = static_cast<unsigned>(std::atol(optarg));
            if (timeout == 0) {
                fprintf(stderr, "ERROR: Invalid timeout %s\n", optarg);
                return 1;
            }
            break;
        case 'e':
            exact = true;
            break;
        case 's':
            skipFallback = true;
            break;
        case 'd':
            debug = true;
            break;
        case 'h':
            usage(argv[0]);
            return 0;
        default:
            usage(argv[0]);
            return 1;
        }
    }

    std::vector<std::string> args(argv + optind, argv + argc);
    if (args.empty()) {
        usage(argv[0]);
        return 1;
    }

    Log::init(config.syslog_id, config.syslog_facility, debug ? Log::Level::Debug : config.log_level);

    try {
        DnsContext context(config);
        DnsClient dns(context, timeout > 0 ? timeout : config.dns_timeout);

        const auto& command = args[0];
        if (command == "lookup" && args.size() >= 2 && args.size() <= 4) {
            auto qtype = args.size() > 2 ? args[2] : "A";
            auto qclass = args.size() > 3 ? args[3] : "IN";
            for (auto& value: dns.lookup(args[1], qtype, qclass, exact)) {
                printf("%s\n", value.c_str());
            }
            return 0;

        } else if (command == "ns" && args.size() == 2) {
            for (auto& ns: dns.getNs(args[1])) {
                printf("%s\n", ns.c_str());
            }
            return 0;

        } else if (command == "hosts-equal" && args.size() == 3) {
            LocalAddresses local(config.local_ip_cache_owner);
            HostMatcher matcher(dns, local);
            auto equal = matcher.hostsEqual(args[1], args[2], config.local_ip_cache, skipFallback, config.external_ip_url);
            printf("%s\n", equal ? "true" : "false");
            return equal ? 0 : 2;
        }
    } catch (std::invalid_argument& e) {
        LOG_ERROR(e.what());
        return 1;
    } catch (std::runtime_error& e) {
        LOG_ERROR(e.what());
        return 1;
    }

    usage(argv[0]);
    return 1;
}
