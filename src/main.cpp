#include "AuditLog.h"
#include "ConvergenceEngine.h"
#include "EngineConfig.h"
#include "EvaluationScheduler.h"
#include "Logger.h"
#include "ReportGenerator.h"
#include "StateStore.h"
#include "TimeUtil.h"
#include "UpstreamClient.h"
#include "WebhookNotifier.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

static std::atomic<bool> g_stop{false};

static void onSignal(int) {
    g_stop = true;
}

static void usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " [--config <file>]                 run the periodic monitor\n"
              << "  " << prog << " [--config <file>] --once          evaluate once and print the report\n"
              << "  " << prog << " [--config <file>] --append <utc> <phase_deg>\n"
              << "  " << prog << " --manual-current <rad> --manual-slope <value> [--slope-units rad_per_day|rad_per_sec]\n";
}

static int runManual(double current, double slope, const std::string& units) {
    SlopeUnits u;
    if (units == "rad_per_day") u = SlopeUnits::RAD_PER_DAY;
    else if (units == "rad_per_sec") u = SlopeUnits::RAD_PER_SEC;
    else {
        std::cerr << "unknown slope units: " << units << "\n";
        return 2;
    }
    EtaProjector projector;
    EtaRecord rec;
    rec.asOfUtc = nowUtc();
    rec.eta = projector.instantaneous(current, slope, u, rec.asOfUtc);
    rec.phiNowRad = current;
    rec.slopeRadPerDay = (u == SlopeUnits::RAD_PER_SEC) ? slope * kSecondsPerDay : slope;
    std::cout << ReportGenerator::etaToJson(rec).dump(2) << std::endl;
    return 0;
}

int main(int argc, char** argv) {
    std::string configPath = "config/phasegap.json";
    bool once = false;
    bool manual = false;
    bool append = false;
    std::string appendTs;
    double appendDeg = 0.0, manualCurrent = 0.0, manualSlope = 0.0;
    bool haveCurrent = false, haveSlope = false;
    std::string slopeUnits = "rad_per_sec";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* what) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << what << "\n";
                std::exit(2);
            }
            return argv[++i];
        };
        try {
            if (arg == "--config") configPath = next("--config");
            else if (arg == "--once") once = true;
            else if (arg == "--append") {
                append = true;
                appendTs = next("--append");
                appendDeg = std::stod(next("--append"));
            } else if (arg == "--manual-current") {
                manual = haveCurrent = true;
                manualCurrent = std::stod(next("--manual-current"));
            } else if (arg == "--manual-slope") {
                manual = haveSlope = true;
                manualSlope = std::stod(next("--manual-slope"));
            } else if (arg == "--slope-units") slopeUnits = next("--slope-units");
            else if (arg == "-h" || arg == "--help") {
                usage(argv[0]);
                return 0;
            } else {
                usage(argv[0]);
                return 2;
            }
        } catch (const std::exception& e) {
            std::cerr << "invalid number for " << arg << ": " << e.what() << "\n";
            return 2;
        }
    }

    if (manual) {
        if (!haveCurrent || !haveSlope) {
            std::cerr << "--manual-current and --manual-slope are both required\n";
            return 2;
        }
        return runManual(manualCurrent, manualSlope, slopeUnits);
    }

    EngineConfig cfg;
    try {
        cfg = ConfigLoader::loadFromFile(configPath);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    Logger::instance().setLevel(Logger::parseLevel(cfg.runtime.logLevel));
    if (!cfg.runtime.logFile.empty()) Logger::instance().setLogFile(cfg.runtime.logFile);

    PhaseHistoryStore store(cfg.history.maxSamples);
    store.loadFromFile(cfg.history.historyFile);

    if (append) {
        Sample s;
        s.asOfUtc = parseIsoUtc(appendTs);
        s.phaseDeg = appendDeg;
        AppendStatus st = store.append(s);
        if (st != AppendStatus::OK) {
            std::cerr << (st == AppendStatus::DUPLICATE_TIMESTAMP ? "duplicate timestamp" : "malformed sample")
                      << ": " << appendTs << std::endl;
            return 1;
        }
        return store.saveToFile(cfg.history.historyFile) ? 0 : 1;
    }

    WebhookNotifier& notifier = WebhookNotifier::instance();
    notifier.setWebhook(cfg.runtime.webhookUrl);
    notifier.setTimeoutSeconds(cfg.runtime.fetchTimeoutSeconds);

    AuditLog audit(cfg.runtime.auditFile);
    ConvergenceEngine engine(cfg, store, &notifier, &audit);

    StateStore stateStore(cfg.runtime.stateFile);
    if (auto restored = stateStore.load()) {
        engine.restoreState(*restored);
        LOG_INFO(std::string("restored event state: ") + EventTrigger::stateName(restored->isTriggered));
    }

    UpstreamClient upstream(cfg.runtime.fetchTimeoutSeconds);
    EvaluationScheduler scheduler(cfg, engine, store, upstream, stateStore);

    if (once) {
        EvaluationReport rep = scheduler.runCycle();
        ReportGenerator report;
        report.printToConsole(rep.status, rep.eta);
        return rep.skipped ? 1 : 0;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    LOG_INFO("starting phase gap monitor...");
    scheduler.start();
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    LOG_INFO("stopping phase gap monitor...");
    scheduler.stop();
    store.saveToFile(cfg.history.historyFile);
    return 0;
}
