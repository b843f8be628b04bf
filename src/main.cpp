#include "bundle/bundle_normalizer.hpp"
#include "bundle/inspection_mode.hpp"
#include "bundle/tar_stream_extractor.hpp"
#include "transfer/single_file_receiver.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>

namespace {

void PrintUsage(const char *argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s inspect <bundle.tar> [-d <dir>] [-f] [-v] [-m <mode>]\n"
        "   %s receive <file> [-p <port>] [-d <dir>] [-f] [-v] [-m <mode>]\n"
        "   %s extract <bundle.tar> -d <dir> [-f] [-v]\n"
        "\n"
        "Commands:\n"
        "  inspect                Unpack a diagnostic bundle for inspection\n"
        "  receive                Wait for one bundle upload and store it in <file>\n"
        "  extract                Unpack a results bundle verbatim\n"
        "\n"
        "Options:\n"
        "  -c, --config           Config file (default %s)\n"
        "  -d, --destination      Destination directory\n"
        "  -f, --force            Remove an existing destination first\n"
        "  -v, --verbose          List every member and enable debug logging\n"
        "  -m, --mode             Inspection mode (goosefoot)\n"
        "  -p, --port             Receiver port (default %u)\n"
        "  -h, --help             Show this help\n",
        argv0, argv0, argv0, gssa::config::kDefaultConfigPath, (unsigned)gssa::kDefaultReceiverPort);
}

struct CliOptions {
    std::string command;
    std::string operand;
    std::string config_path = gssa::config::kDefaultConfigPath;
    std::string destination;
    std::optional<std::uint16_t> port;
    std::optional<gssa::InspectionMode> mode;
    bool force = false;
    bool verbose = false;
};

int Fail(const gssa::Result &r) {
    std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
    return 1;
}

gssa::SingleFileReceiver::Options ReceiverOptions(const gssa::config::GssaConfigFromFile &cfg,
                                                  const CliOptions &cli) {
    gssa::SingleFileReceiver::Options opt;
    if (cfg.receiver_port) opt.port = *cfg.receiver_port;
    if (cfg.receiver_bind_address) opt.bind_address = *cfg.receiver_bind_address;
    if (cfg.receiver_route) opt.route = *cfg.receiver_route;
    if (cfg.receiver_drain_grace_seconds) {
        opt.drain_grace = std::chrono::seconds(*cfg.receiver_drain_grace_seconds);
    }
    if (cfg.receiver_body_limit_bytes) opt.body_limit_bytes = *cfg.receiver_body_limit_bytes;
    if (cli.port) opt.port = *cli.port;
    opt.cancel_on_signals = true;
    return opt;
}

int RunInspect(const CliOptions &cli) {
    gssa::BundleNormalizer::Options opt;
    opt.force = cli.force;
    opt.verbose = cli.verbose;
    opt.mode = cli.mode;

    if (auto r = gssa::BundleNormalizer(opt).Normalize(cli.operand, cli.destination); !r.ok) {
        return Fail(r);
    }
    std::printf("%s\n", cli.destination.c_str());
    return 0;
}

int RunExtract(const CliOptions &cli) {
    if (auto r = gssa::PrepareDestination(cli.destination, cli.force); !r.ok) return Fail(r);

    std::error_code ec;
    std::filesystem::create_directories(cli.destination, ec);
    if (ec) {
        std::fprintf(stderr, "ERROR: cannot create %s: %s\n", cli.destination.c_str(), ec.message().c_str());
        return 1;
    }

    gssa::TarStreamExtractor::Options opt;
    opt.verbose = cli.verbose;
    if (auto r = gssa::TarStreamExtractor(opt).ExtractFileToDir(cli.operand, cli.destination); !r.ok) {
        return Fail(r);
    }
    return 0;
}

int RunReceive(const CliOptions &cli, const gssa::config::GssaConfigFromFile &cfg) {
    std::unique_ptr<gssa::SingleFileReceiver> receiver;
    if (auto r = gssa::SingleFileReceiver::Start(ReceiverOptions(cfg, cli), cli.operand, receiver); !r.ok) {
        return Fail(r);
    }

    const auto stored = receiver->AwaitCompletion();
    const auto outcome = receiver->Outcome();
    const auto reason = receiver->GetTransfer().FailureReason();
    receiver->Close();

    if (!stored) {
        std::fprintf(stderr, "ERROR: transfer %s: %s\n", gssa::ToString(outcome), reason.c_str());
        return 1;
    }
    std::printf("%s\n", stored->c_str());

    if (cli.destination.empty()) return 0;

    gssa::BundleNormalizer::Options opt;
    opt.force = cli.force;
    opt.verbose = cli.verbose;
    opt.mode = cli.mode;
    if (auto r = gssa::BundleNormalizer(opt).Normalize(*stored, cli.destination); !r.ok) {
        return Fail(r);
    }
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        PrintUsage(argv[0]);
        return 2;
    }

    CliOptions cli;
    cli.command = argv[1];
    if (cli.command == "-h" || cli.command == "--help") {
        PrintUsage(argv[0]);
        return 0;
    }

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"destination", required_argument, nullptr, 'd'},
        {"force", no_argument, nullptr, 'f'},
        {"verbose", no_argument, nullptr, 'v'},
        {"mode", required_argument, nullptr, 'm'},
        {"port", required_argument, nullptr, 'p'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // Options follow the command word.
    int sub_argc = argc - 1;
    char **sub_argv = argv + 1;
    int idx = 0;
    int c;
    while ((c = getopt_long(sub_argc, sub_argv, "hc:d:fvm:p:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                cli.config_path = optarg;
                break;

            case 'd':
                cli.destination = optarg;
                break;

            case 'f':
                cli.force = true;
                break;

            case 'v':
                cli.verbose = true;
                break;

            case 'm': {
                gssa::InspectionMode mode;
                if (auto r = gssa::ParseInspectionMode(optarg, mode); !r.ok) {
                    std::fprintf(stderr, "%s\n", r.msg.c_str());
                    return 2;
                }
                cli.mode = mode;
                break;
            }

            case 'p': {
                char *end = nullptr;
                errno = 0;
                unsigned long v = std::strtoul(optarg, &end, 10);
                if (!end || *end != '\0' || errno != 0 || v > 65535) {
                    std::fprintf(stderr, "Invalid --port: %s\n", optarg);
                    return 2;
                }
                cli.port = static_cast<std::uint16_t>(v);
                break;
            }

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind + 1 != sub_argc) {
        PrintUsage(argv[0]);
        return 2;
    }
    cli.operand = sub_argv[optind];

    gssa::config::GssaConfigFromFile cfg;
    if (auto r = cfg.LoadFileOrDefaults(cli.config_path); !r.ok) return Fail(r);

    if (cfg.log_level) {
        if (auto lvl = gssa::ParseLogLevel(*cfg.log_level)) {
            gssa::Logger::Instance().SetLevel(*lvl);
        } else {
            LogWarn("Unknown log.level '%s' in %s", cfg.log_level->c_str(), cli.config_path.c_str());
        }
    }
    if (cli.verbose) {
        gssa::Logger::Instance().SetLevel(gssa::LogLevel::Debug);
    }

    if (cli.destination.empty() && cfg.bundle_destination && cli.command != "receive") {
        cli.destination = *cfg.bundle_destination;
    }

    if (cli.command == "inspect") {
        if (cli.destination.empty()) {
            std::fprintf(stderr, "inspect: no destination (-d) given and no bundle.destination configured\n");
            return 2;
        }
        return RunInspect(cli);
    }
    if (cli.command == "extract") {
        if (cli.destination.empty()) {
            std::fprintf(stderr, "extract: -d <dir> is required\n");
            return 2;
        }
        return RunExtract(cli);
    }
    if (cli.command == "receive") {
        return RunReceive(cli, cfg);
    }

    std::fprintf(stderr, "Unknown command: %s\n", cli.command.c_str());
    PrintUsage(argv[0]);
    return 2;
}
