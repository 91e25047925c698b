#include "logfetch/environment_probe.hpp"
#include "logfetch/log_collector.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <getopt.h>
#include <iostream>
#include <string>

namespace {

void PrintUsage(std::FILE* to, const char *argv) {
    std::fprintf(to,
        "Usage:\n"
        "   %s [-z] [-g] [-v] [-p <profile.json>] [asm|database|crs|listener|all]\n"
        "\n"
        "Prints the current Oracle diagnostic logs of the selected component.\n"
        "Without a component an interactive menu lists the available ones.\n"
        "\n"
        "Options:\n"
        "  -z, --archive          Also write the logs to /tmp/logs_<timestamp>.tar.gz\n"
        "  -g, --filter           Also print lines matching error|warn|ORA-\n"
        "  -p, --profile          Profile file (default ~/.logfetch.json)\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv);
}

} // namespace

int main(int argc, char **argv) {
    logfetch::RunConfig cfg;
    std::string profile_path;
    bool verbose = false;

    static option long_opts[] = {
        {"archive", no_argument, nullptr, 'z'},
        {"filter", no_argument, nullptr, 'g'},
        {"profile", required_argument, nullptr, 'p'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "zgp:vh", long_opts, &idx)) != -1) {
        switch (c) {
            case 'z':
                cfg.archive = true;
                break;

            case 'g':
                cfg.filter = true;
                break;

            case 'p':
                profile_path = optarg;
                break;

            case 'v':
                verbose = true;
                break;

            case 'h':
                // Help does not end the run; the menu follows.
                PrintUsage(stdout, argv[0]);
                break;

            default:
                PrintUsage(stderr, argv[0]);
                return 1;
        }
    }

    if (argc - optind > 1) {
        std::fprintf(stderr, "error: only one component may be given\n");
        PrintUsage(stderr, argv[0]);
        return 1;
    }
    if (optind < argc) {
        logfetch::ComponentRequest request;
        if (!logfetch::ParseComponentToken(argv[optind], request)) {
            std::fprintf(stderr, "error: unknown component '%s'\n", argv[optind]);
            PrintUsage(stderr, argv[0]);
            return 1;
        }
        cfg.component = request;
    }

    if (verbose) {
        logfetch::Logger::Instance().SetLevel(logfetch::LogLevel::Debug);
    }

    if (auto r = logfetch::Identity::Current(cfg.identity); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }

    logfetch::EnvironmentProbe::LoadProfile(cfg.identity, profile_path, cfg.profile);
    if (!verbose && cfg.profile.log_level.has_value()) {
        logfetch::Logger::Instance().SetLevel(*cfg.profile.log_level);
    }
    cfg.ApplyProfile();

    logfetch::LogCollector collector;
    logfetch::RunSummary summary;
    auto res = collector.Run(cfg, std::cin, std::cout, summary);
    if (!res.ok) {
        LogError("%s", res.msg.c_str());
        return 1;
    }

    return 0;
}
