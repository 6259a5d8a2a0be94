#include "EvaluationScheduler.h"
#include "Logger.h"
#include "TimeUtil.h"
#include <chrono>

EvaluationScheduler::EvaluationScheduler(const EngineConfig& cfg, ConvergenceEngine& engine,
                                         PhaseHistoryStore& store, UpstreamClient& upstream,
                                         StateStore& stateStore)
    : cfg_(cfg), engine_(engine), store_(store), upstream_(upstream), stateStore_(stateStore) {}

EvaluationScheduler::~EvaluationScheduler() {
    stop();
}

void EvaluationScheduler::start() {
    if (running_) {
        LOG_WARN("evaluation scheduler already running");
        return;
    }
    stop_ = false;
    running_ = true;
    thread_ = std::thread(&EvaluationScheduler::loop, this);
    LOG_INFO("evaluation scheduler started (interval: " + std::to_string(cfg_.runtime.intervalSeconds) + "s)");
}

void EvaluationScheduler::stop() {
    stop_ = true;
    if (thread_.joinable()) {
        thread_.join();
        LOG_INFO("evaluation scheduler stopped");
    }
    running_ = false;
}

std::optional<double> EvaluationScheduler::readClarity() {
    if (!cfg_.runtime.clarityUrl.empty()) return upstream_.fetchClarity(cfg_.runtime.clarityUrl);
    if (!cfg_.runtime.clarityFile.empty()) return upstream_.readClarityFile(cfg_.runtime.clarityFile);
    return std::nullopt;
}

EvaluationReport EvaluationScheduler::runCycle() {
    std::lock_guard<std::mutex> lk(cycleMu_);

    if (!cfg_.runtime.samplesUrl.empty()) {
        auto fresh = upstream_.fetchSamples(cfg_.runtime.samplesUrl);
        if (!fresh.empty()) {
            AppendSummary sum = store_.appendAll(fresh);
            if (sum.accepted > 0) {
                LOG_INFO("ingested " + std::to_string(sum.accepted) + " new samples");
                store_.saveToFile(cfg_.history.historyFile);
            }
        }
    }

    std::optional<double> clarity = readClarity();
    EvaluationReport rep = engine_.evaluate(clarity, nowUtc());

    if (rep.transitioned) {
        stateStore_.save(engine_.state());
    }
    if (!cfg_.runtime.statusFile.empty()) {
        report_.saveToFile(cfg_.runtime.statusFile, rep.status, rep.eta);
    }
    return rep;
}

void EvaluationScheduler::loop() {
    while (!stop_) {
        try {
            runCycle();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("evaluation cycle error: ") + e.what());
        }

        // 每秒检查一次停止标志
        for (int i = 0; i < cfg_.runtime.intervalSeconds && !stop_; ++i) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    running_ = false;
}
