#ifndef EVALUATION_SCHEDULER_H
#define EVALUATION_SCHEDULER_H

#include "ConvergenceEngine.h"
#include "EngineConfig.h"
#include "PhaseHistoryStore.h"
#include "ReportGenerator.h"
#include "StateStore.h"
#include "UpstreamClient.h"
#include <atomic>
#include <mutex>
#include <thread>

// 后台线程, 按固定间隔执行一次评估
class EvaluationScheduler {
public:
    EvaluationScheduler(const EngineConfig& cfg, ConvergenceEngine& engine,
                        PhaseHistoryStore& store, UpstreamClient& upstream, StateStore& stateStore);
    ~EvaluationScheduler();

    void start();
    void stop();
    bool running() const { return running_; }

    // 一个完整周期: 拉取 -> 评估 -> 持久化
    EvaluationReport runCycle();

private:
    void loop();
    std::optional<double> readClarity();

    EngineConfig cfg_;
    ConvergenceEngine& engine_;
    PhaseHistoryStore& store_;
    UpstreamClient& upstream_;
    StateStore& stateStore_;
    ReportGenerator report_;

    std::atomic<bool> stop_{false};
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex cycleMu_;
};

#endif
