#include "jswitch/config.hpp"
#include "jswitch/env_store.hpp"
#include "jswitch/logger.hpp"
#include "jswitch/result.hpp"
#include "jswitch/switcher.hpp"

#include <cstdio>
#include <getopt.h>
#include <iostream>
#include <string>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s [-c <config.json>] [-e <env-file>] [--restore-on-failure] [-v]\n"
        "\n"
        "Options:\n"
        "  -c, --config               Configuration file (default <exe dir>/../config/config.json)\n"
        "  -e, --env-file             Machine environment file (default /etc/environment, not used on Windows)\n"
        "      --restore-on-failure   Put JAVA_HOME back if the path update fails\n"
        "  -v, --verbose              Print debug output\n"
        "  -h, --help                 Show this help\n",
        argv);
}

void ReportFailure(const jswitch::RunReport &report, const jswitch::SwitchOptions &opt) {
    using jswitch::ErrorKind;

    jswitch::LogError("%s (stopped after %s)", report.result.msg.c_str(), jswitch::ToString(report.state));

    if (report.result.kind == ErrorKind::EnvironmentWritePermissionDenied) {
        jswitch::LogError("Machine-wide variables need administrator/root privileges");
    }

    if (report.restore) {
        if (report.restore->ok) {
            jswitch::LogInfo("%s was restored to its previous value", opt.mutator.home_variable.c_str());
        } else {
            jswitch::LogError("Restoring %s failed: %s", opt.mutator.home_variable.c_str(),
                              report.restore->msg.c_str());
        }
    }

    if (report.inconsistent) {
        jswitch::LogError("Inconsistent environment: %s is %s but %s was not updated",
                          opt.mutator.home_variable.c_str(),
                          report.selection ? report.selection->c_str() : "?",
                          opt.mutator.path_variable.c_str());
    }
}

} // namespace

int main(int argc, char **argv) {
    std::string config_path;
    std::string env_file;

    jswitch::SwitchOptions opt{};
    opt.restore_on_failure = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"env-file", required_argument, nullptr, 'e'},
        {"restore-on-failure", no_argument, nullptr, 1000},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:e:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'e':
                env_file = optarg;
                break;

            case 'v':
                jswitch::SetVerbose(true);
                break;

            case 1000:
                opt.restore_on_failure = true;
                break;

            default:
                PrintUsage(argv[0]);
                return jswitch::kExitUsage;
        }
    }

    if (optind < argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        PrintUsage(argv[0]);
        return jswitch::kExitUsage;
    }

    if (config_path.empty()) {
        config_path = jswitch::DefaultConfigPath(argv[0]);
    }

    auto store = jswitch::MakeSystemEnvironmentStore(env_file, opt.mutator.path_variable);
    jswitch::Switcher switcher(std::move(store), std::cin, std::cout, opt);

    const auto report = switcher.Run(config_path);
    if (!report.ok()) {
        ReportFailure(report, opt);
    } else if (!report.warnings.empty()) {
        jswitch::LogInfo("Switch completed with %zu warning(s)", report.warnings.size());
    }

    return report.ExitCode();
}
