/**
 * @file main.cpp
 * @brief VerifiedCompute command-line entry point.
 *
 * Runs one job group end to end against the in-process TEE worker:
 *   Config → Logger → Orchestrator → start → poll → aggregate → ledger → publish
 */

#include "core/config.hpp"
#include "core/digest.hpp"
#include "core/logger.hpp"
#include "dispatch/simulated_worker.hpp"
#include "orchestrator/orchestrator.hpp"
#include "services/in_memory_services.hpp"
#include "telemetry/json_sink.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace verified_compute;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║         VerifiedCompute v1.0.0            ║
  ║   Attested Distributed Compute over       ║
  ║   Trusted Execution Environments          ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct FaultSpec {
    PartitionId partition = 0;
    SimulatedFault fault = SimulatedFault::ReportFailure;
};

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string dataset = "dataset://demo";
    uint64_t records = 100;
    uint32_t partitions = 0;                     ///< 0 = [partitioning] default
    std::string strategy;
    std::string environment = "sklearn-cpu";
    std::vector<std::string> metrics = {"accuracy", "f1_score"};
    std::vector<FaultSpec> faults;
    std::string log_dir;
};

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, sep)) {
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

void print_usage() {
    std::cout << "Usage: verified_compute [OPTIONS]\n"
              << "  --config <path>           Configuration file (default: config/default.toml)\n"
              << "  --dataset <ref>           Dataset reference (default: dataset://demo)\n"
              << "  --records <n>             Records in the demo dataset (default: 100)\n"
              << "  --partitions <k>          Number of partitions\n"
              << "  --strategy <name>         equal_size | by_key | custom\n"
              << "  --environment <name>      Compute environment (default: sklearn-cpu)\n"
              << "  --metrics <a,b,...>       Metrics to compute (default: accuracy,f1_score)\n"
              << "  --fail-partition <id[:fault]>  Inject a worker fault (repeatable)\n"
              << "  --log-dir <path>          Log output directory\n"
              << "  --help, -h                Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--dataset" && i + 1 < argc) {
                args.dataset = argv[++i];
            } else if (arg == "--records" && i + 1 < argc) {
                args.records = std::stoull(argv[++i]);
            } else if (arg == "--partitions" && i + 1 < argc) {
                args.partitions = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--strategy" && i + 1 < argc) {
                args.strategy = argv[++i];
            } else if (arg == "--environment" && i + 1 < argc) {
                args.environment = argv[++i];
            } else if (arg == "--metrics" && i + 1 < argc) {
                args.metrics = split(argv[++i], ',');
            } else if (arg == "--fail-partition" && i + 1 < argc) {
                auto parts = split(argv[++i], ':');
                if (parts.empty()) {
                    return make_error<CLIArgs>(ErrorCode::ConfigurationError,
                                               "--fail-partition needs a partition id");
                }
                FaultSpec spec;
                spec.partition = static_cast<PartitionId>(std::stoul(parts[0]));
                if (parts.size() > 1) {
                    auto fault = parse_simulated_fault(parts[1]);
                    if (!fault) return fault.error();
                    spec.fault = *fault;
                }
                args.faults.push_back(spec);
            } else if (arg == "--log-dir" && i + 1 < argc) {
                args.log_dir = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                std::exit(0);
            } else {
                return make_error<CLIArgs>(ErrorCode::ConfigurationError,
                                           "Unknown or incomplete option: " + arg);
            }
        }
    } catch (const std::exception& ex) {
        return make_error<CLIArgs>(ErrorCode::ConfigurationError,
                                   std::string{"Invalid numeric argument: "} + ex.what());
    }
    return args;
}

void print_aggregate(const AggregateResult& result) {
    std::cout << "\nGroup " << result.group_id << "\n"
              << "  partitions : " << result.group_size << "\n"
              << "  succeeded  : " << result.success_count << "\n"
              << "  failed     : " << result.failed_count << "\n"
              << "  compute    : " << result.total_compute_time.count() << " us\n"
              << "  confidence : " << result.confidence_score << "\n";
    for (const auto& [name, value] : result.metrics) {
        std::cout << "  " << name << " = " << value << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::cerr << parsed.error().message << std::endl;
        print_usage();
        return 2;
    }
    auto args = std::move(*parsed);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    PartitionConfig part_config = config.partitioning;
    if (args.partitions != 0) part_config.num_partitions = args.partitions;
    if (!args.strategy.empty()) part_config.strategy = args.strategy;
    if (part_config.strategy == "by_key" && !part_config.key_field) part_config.key_field = "region";

    auto level = parse_log_level(config.telemetry.log_level);

    // ── Simulated TEE worker ─────────────────
    auto signer = Ed25519Signer::generate();
    if (!signer) {
        std::cerr << "Cannot create attestation key: " << signer.error().message << std::endl;
        return 1;
    }
    std::string_view image = "verified-compute/sim-runtime:1.0";
    SimulatedWorkerConfig worker_config{
        .measurement = sha256_hex(Bytes(image.begin(), image.end()))
    };
    SimulatedWorkerClient worker(std::move(*signer), worker_config);
    for (const auto& f : args.faults) {
        worker.script(f.partition, PartitionScript{.fault = f.fault});
    }

    // The simulated signer is trusted only for this run.
    config.trust.signers.push_back(SignerConfig{
        .identity = worker_config.signer_identity,
        .public_key = worker.public_key(),
        .allowed = true
    });
    config.trust.approved_measurements.push_back(worker_config.measurement);

    // ── Services ─────────────────────────────
    InMemoryAssetService assets(config.orchestrator.staging_dir / "assets");
    assets.register_dataset(args.dataset, args.records,
                            {{"region", {"africa", "apac", "eu", "latam", "mena", "us"}}});
    InMemoryLedger ledger;

    // ── Orchestrator ─────────────────────────
    const auto& tc = config.telemetry;
    Orchestrator::Options opts{
        .config = config,
        .log_sink = std::make_unique<JsonFileSink>(tc.log_dir, "verified_compute",
                                                   tc.max_file_size_mb, tc.rotate_count),
        .log_level = level ? *level : LogLevel::Info,
        .metrics_sink = std::make_unique<JsonFileSink>(tc.log_dir, "metrics",
                                                       tc.max_file_size_mb, tc.rotate_count),
        .signature_verifier = nullptr
    };
    Orchestrator orch(std::move(opts), worker, assets, &ledger);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    GroupRequest request{
        .dataset_reference = args.dataset,
        .algorithm_reference = {},
        .compute_config = ComputeConfig{.metrics = args.metrics},
        .environment_name = args.environment,
        .partition_config = part_config
    };

    auto group = orch.start_group(request);
    if (!group) {
        std::cerr << "Group rejected [" << to_string(group.error().code) << "]: "
                  << group.error().message << std::endl;
        return 2;
    }
    std::cout << "Started " << *group << " on " << args.environment << std::endl;

    // Ctrl+C cancels the running group.
    std::jthread watcher([&orch, id = *group](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_shutdown_requested) {
                auto cancelled = orch.cancel_group(id);
                if (cancelled) {
                    std::cerr << "Cancelled " << *cancelled << " job(s)" << std::endl;
                }
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto outcome = orch.poll_group(*group);
    watcher.request_stop();
    if (!outcome) {
        std::cerr << "Polling failed: " << outcome.error().message << std::endl;
        return 1;
    }

    for (const auto& job : outcome->jobs) {
        std::cout << "  " << job.job_id << "  " << describe(job.partition.scope) << "  "
                  << to_string(job.status);
        if (job.failure_reason) {
            std::cout << " (" << to_string(*job.failure_reason) << ": " << job.detail << ")";
        }
        std::cout << "\n";
    }

    auto aggregate = orch.aggregate(*group);
    if (!aggregate) {
        std::cerr << "Aggregation failed: " << aggregate.error().message << std::endl;
        return 1;
    }
    print_aggregate(*aggregate);

    if (aggregate->success_count > 0) {
        auto commit = orch.commit_result(*aggregate);
        if (commit) {
            std::cout << "  digest     : " << commit->digest << "\n"
                      << "  paid       : " << commit->payment.amount << " to "
                      << commit->payment.recipient << "\n";
        } else {
            std::cerr << "Ledger commit failed: " << commit.error().message << std::endl;
        }

        auto published = orch.publish_result(*aggregate, *group + "-results");
        if (published) {
            std::cout << "  published  : " << *published << "\n";
        } else {
            std::cerr << "Publishing failed: " << published.error().message << std::endl;
        }
    }

    return outcome->succeeded() ? 0 : 1;
}
