#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "coop_ledger/apps/cli_support.h"
#include "coop_ledger/apps/day_control_app.h"
#include "coop_ledger/core/business_clock.h"
#include "coop_ledger/core/in_memory_ledger_event_queue.h"
#include "coop_ledger/core/ledger_config_loader.h"
#include "coop_ledger/core/local_wal_ledger_event_sink.h"
#include "coop_ledger/core/storage_client_factory.h"
#include "coop_ledger/core/storage_connection_config.h"
#include "coop_ledger/core/structured_log.h"
#include "coop_ledger/core/structured_log_audit_sink.h"
#include "coop_ledger/monitoring/metric_registry.h"

namespace {

void PrintUsage(std::ostream& out) {
    out << "usage: coop_ledger_day_control <command> [--tenant T] [--actor A] [--config PATH]"
           " [--today YYYY-MM-DD] [--metrics-out PATH] [options]\n"
           "       coop_ledger_day_control batch --file PATH [--tenant T] [--actor A]\n"
           "commands:";
    for (const auto& name : coop_ledger::apps::DayControlApp::CommandNames()) {
        out << ' ' << name;
    }
    out << '\n';
}

// Only fails the process when the command itself succeeded.
int FinishWithMetrics(const std::string& metrics_path,
                      const coop_ledger::LedgerRuntimeConfig& runtime,
                      int exit_code) {
    if (metrics_path.empty()) {
        return exit_code;
    }
    std::string error;
    if (!coop_ledger::WriteMetricsSnapshot(metrics_path, &error)) {
        coop_ledger::EmitStructuredLog(&runtime,
                                       "coop_ledger_day_control",
                                       "error",
                                       "metrics_write_failed",
                                       {{"path", metrics_path}, {"error", error}});
        return exit_code == coop_ledger::apps::kExitOk ? coop_ledger::apps::kExitUsage
                                                       : exit_code;
    }
    return exit_code;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace coop_ledger;
    using namespace coop_ledger::apps;

    LedgerRuntimeConfig bootstrap_runtime;
    std::vector<std::string> positional;
    ArgMap args = ParseArgs(argc, argv, &positional);
    if (positional.empty() || HasArg(args, "help")) {
        PrintUsage(std::cerr);
        return positional.empty() && !HasArg(args, "help") ? kExitUsage : kExitOk;
    }
    const std::string command = positional.front();

    LedgerFileConfig file_config;
    const std::string config_path =
        GetArg(args, "config", GetEnvOrDefault("COOP_LEDGER_CONFIG_PATH", ""));
    if (!config_path.empty()) {
        std::string config_error;
        if (!LedgerConfigLoader::LoadFromYaml(config_path, &file_config, &config_error)) {
            EmitStructuredLog(&bootstrap_runtime,
                              "coop_ledger_day_control",
                              "error",
                              "config_load_failed",
                              {{"config_path", config_path}, {"error", config_error}});
            return kExitUsage;
        }
    }
    const auto& runtime = file_config.runtime;

    std::shared_ptr<IBusinessClock> clock;
    const std::string today = GetArg(args, "today");
    if (!today.empty()) {
        if (!IsValidBusinessDate(today)) {
            EmitStructuredLog(&runtime,
                              "coop_ledger_day_control",
                              "error",
                              "invalid_arguments",
                              {{"error", "invalid --today: " + today}});
            return kExitUsage;
        }
        clock = std::make_shared<FixedBusinessClock>(today);
    } else {
        clock = std::make_shared<SystemBusinessClock>();
    }

    const auto storage_config = StorageConnectionConfig::FromEnvironment();
    std::string storage_error;
    auto store = StorageClientFactory::CreateLedgerStore(storage_config, &storage_error);
    if (!storage_error.empty()) {
        EmitStructuredLog(&runtime,
                          "coop_ledger_day_control",
                          storage_config.allow_inmemory_fallback ? "warn" : "error",
                          "ledger_store_degraded",
                          {{"error", storage_error},
                           {"fallback",
                            storage_config.allow_inmemory_fallback ? "in_memory" : "none"}});
        if (!storage_config.allow_inmemory_fallback) {
            return kExitUsage;
        }
    }

    std::shared_ptr<ILedgerEventSink> event_sink;
    if (!runtime.event_wal_path.empty()) {
        auto wal_sink = std::make_shared<LocalWalLedgerEventSink>(runtime.event_wal_path);
        if (!wal_sink->is_open()) {
            EmitStructuredLog(&runtime,
                              "coop_ledger_day_control",
                              "error",
                              "event_wal_open_failed",
                              {{"path", runtime.event_wal_path}});
            return kExitUsage;
        }
        event_sink = wal_sink;
    } else {
        event_sink = std::make_shared<InMemoryLedgerEventQueue>();
    }

    DayControlDependencies deps;
    deps.store = store;
    deps.event_sink = event_sink;
    deps.clock = clock;
    deps.runtime = runtime;
    deps.audit_sink = std::make_shared<StructuredLogAuditSink>(&deps.runtime);
    DayControlApp app(deps);

    if (GetArg(args, "tenant").empty() && !file_config.default_tenant_id.empty()) {
        args["tenant"] = file_config.default_tenant_id;
    }
    if (GetArg(args, "actor").empty()) {
        args["actor"] = GetEnvOrDefault("COOP_LEDGER_ACTOR", GetEnvOrDefault("USER", "cli"));
    }

    const std::string metrics_path = GetArg(args, "metrics-out");
    args.erase("metrics-out");

    if (command == "batch") {
        const std::string batch_path = GetArg(args, "file");
        if (batch_path.empty()) {
            PrintUsage(std::cerr);
            return kExitUsage;
        }
        std::ifstream batch(batch_path);
        if (!batch.is_open()) {
            EmitStructuredLog(&runtime,
                              "coop_ledger_day_control",
                              "error",
                              "batch_open_failed",
                              {{"path", batch_path}});
            return kExitUsage;
        }
        ArgMap defaults;
        defaults["tenant"] = GetArg(args, "tenant");
        defaults["actor"] = GetArg(args, "actor");
        return FinishWithMetrics(
            metrics_path, runtime, app.RunBatch(batch, defaults, std::cout));
    }
    return FinishWithMetrics(metrics_path, runtime, app.Run(command, args, std::cout));
}
