// ConvergenceEngine 端到端: 历史 -> 拟合 -> 触发 -> 告警/审计/报告
#include "AngularUnwrapper.h"
#include "ConvergenceEngine.h"
#include "EvaluationScheduler.h"
#include "ReportGenerator.h"
#include "TestSupport.h"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <atomic>
#include <thread>
#include <vector>

using json = nlohmann::json;

class CountingNotifier : public AlertNotifier {
public:
    bool sendMessage(const std::string& text) override {
        count++;
        last = text;
        return true;
    }
    int count = 0;
    std::string last;
};

// 40 天, 每天 -0.5 度, 最后一个样本 0.5 度
static void fillClosingHistory(PhaseHistoryStore& store, int64_t t0 = kT0) {
    store.appendAll(linearSeries(40, 20.0, -0.5, kSecondsPerDay, t0));
}

static int64_t lastSampleTime(const PhaseHistoryStore& store) {
    return store.latest()->asOfUtc;
}

void test_ClosingEpisodeEntersAndAlertsOnce() {
    EngineConfig cfg;
    PhaseHistoryStore store;
    fillClosingHistory(store);
    CountingNotifier notifier;
    AuditLog audit;
    ConvergenceEngine engine(cfg, store, &notifier, &audit);

    const int64_t now = lastSampleTime(store) + 2 * kSecondsPerHour;
    EvaluationReport rep = engine.evaluate(0.8, now);
    ASSERT_FALSE(rep.skipped);
    ASSERT_TRUE(rep.transitioned);
    ASSERT_TRUE(rep.alertEmitted);
    ASSERT_TRUE(rep.status.isTriggered);
    ASSERT_TRUE(rep.status.dataStatus == DataStatus::OK);
    ASSERT_NEAR(*rep.status.phaseGapDeg, 0.5, 1e-9);
    ASSERT_NEAR(*rep.status.closingRateDegPerDay, 0.5, 1e-6);
    ASSERT_NEAR(*rep.status.dataFreshHours, 2.0, 1e-9);
    ASSERT_EQ(rep.status.samplesConfirmed, 39);
    // 0.8 + 0.30 * 1 - 0.20 * 0 (ETA 样本不足, 冷启动离散度 0), 截断到 1
    ASSERT_NEAR(rep.status.confidence, 1.0, 1e-9);

    ASSERT_TRUE(rep.eta.eta.closing());
    ASSERT_NEAR(*rep.eta.eta.etaDays, 1.0, 1e-4);
    ASSERT_NEAR(*rep.eta.slopeRadPerDay, degToRad(-0.5), 1e-6);

    ASSERT_EQ(notifier.count, 1);
    ASSERT_TRUE(notifier.last.find("phase_gap_deg") != std::string::npos);

    for (int i = 1; i <= 3; ++i) {
        EvaluationReport again = engine.evaluate(0.8, now + i * 300);
        ASSERT_TRUE(again.status.isTriggered);
        ASSERT_FALSE(again.alertEmitted);
    }
    ASSERT_EQ(notifier.count, 1);

    auto entries = audit.recent();
    ASSERT_EQ(entries.size(), size_t(1));
    ASSERT_EQ(entries[0].fromState, std::string("OPEN"));
    ASSERT_EQ(entries[0].toState, std::string("CLOSING"));
    ASSERT_TRUE(entries[0].alertEmitted);
    ASSERT_EQ(entries[0].windowSize, size_t(40));
}

void test_WideningGapResetsToOpen() {
    EngineConfig cfg;
    PhaseHistoryStore store;
    fillClosingHistory(store);
    CountingNotifier notifier;
    AuditLog audit;
    ConvergenceEngine engine(cfg, store, &notifier, &audit);

    int64_t now = lastSampleTime(store) + kSecondsPerHour;
    ASSERT_TRUE(engine.evaluate(0.8, now).status.isTriggered);

    Sample jump;
    jump.asOfUtc = lastSampleTime(store) + kSecondsPerDay;
    jump.phaseDeg = 3.0;
    ASSERT_TRUE(store.append(jump) == AppendStatus::OK);

    now = jump.asOfUtc + kSecondsPerHour;
    EvaluationReport rep = engine.evaluate(0.8, now);
    ASSERT_TRUE(rep.transitioned);
    ASSERT_FALSE(rep.status.isTriggered);
    ASSERT_EQ(rep.status.samplesConfirmed, 0);
    ASSERT_EQ(engine.state().since, now);
    ASSERT_EQ(audit.recent().size(), size_t(2));
    ASSERT_EQ(notifier.count, 1);
}

void test_WideningFitBlocksTrigger() {
    EngineConfig cfg;
    PhaseHistoryStore store;
    // 40 天每天 +0.02 度, 然后连续 3 个样本各降 0.001 度
    std::vector<Sample> series = linearSeries(40, 0.0, 0.02);
    double phase = series.back().phaseDeg;
    int64_t t = series.back().asOfUtc;
    for (int i = 0; i < 3; ++i) {
        Sample s;
        t += kSecondsPerDay;
        phase -= 0.001;
        s.asOfUtc = t;
        s.phaseDeg = phase;
        series.push_back(s);
    }
    store.appendAll(series);
    CountingNotifier notifier;
    ConvergenceEngine engine(cfg, store, &notifier);

    EvaluationReport rep = engine.evaluate(0.8, lastSampleTime(store) + kSecondsPerHour);
    ASSERT_EQ(rep.status.samplesConfirmed, 3);
    ASSERT_TRUE(rep.eta.eta.status == ConvergenceStatus::NOT_CLOSING);
    ASSERT_FALSE(rep.status.isTriggered);
    ASSERT_FALSE(rep.alertEmitted);
    ASSERT_TRUE(rep.status.reason.find("fitted slope not closing") != std::string::npos);
    ASSERT_EQ(notifier.count, 0);
}

void test_FutureSampleIsStale() {
    EngineConfig cfg;
    PhaseHistoryStore store;
    fillClosingHistory(store);
    CountingNotifier notifier;
    ConvergenceEngine engine(cfg, store, &notifier);

    EvaluationReport rep = engine.evaluate(0.8, lastSampleTime(store) - 10 * kSecondsPerDay);
    ASSERT_FALSE(rep.status.isTriggered);
    ASSERT_TRUE(rep.status.dataStatus == DataStatus::STALE);
    ASSERT_NEAR(*rep.status.dataFreshHours, -240.0, 1e-9);
    ASSERT_EQ(notifier.count, 0);

    // 一分钟的时钟偏差在容差内
    EvaluationReport skew = engine.evaluate(0.8, lastSampleTime(store) - 60);
    ASSERT_TRUE(skew.status.dataStatus == DataStatus::OK);
    ASSERT_TRUE(skew.status.isTriggered);
}

void test_ReferenceScenarioConfidence() {
    EngineConfig cfg;
    PhaseHistoryStore store;
    // 36 天从 18.6 度每天 -0.5 到 1.1, 之后 1.2 -> 1.0 -> 0.9 -> 0.75 -> 0.6
    std::vector<Sample> series = linearSeries(36, 18.6, -0.5);
    const double tailDeg[] = {1.2, 1.0, 0.9, 0.75, 0.6};
    int64_t t = series.back().asOfUtc;
    for (double deg : tailDeg) {
        Sample s;
        t += kSecondsPerDay;
        s.asOfUtc = t;
        s.phaseDeg = deg;
        series.push_back(s);
    }
    store.appendAll(series);
    ConvergenceEngine engine(cfg, store);

    const int64_t now = lastSampleTime(store) + 2 * kSecondsPerHour + 6 * 60;
    EvaluationReport rep = engine.evaluate(0.72, now);
    ASSERT_TRUE(rep.status.isTriggered);
    ASSERT_NEAR(*rep.status.phaseGapDeg, 0.6, 1e-9);
    ASSERT_NEAR(*rep.status.dataFreshHours, 2.1, 1e-9);
    ASSERT_EQ(rep.status.samplesConfirmed, 4);
    // 0.72 + 0.30 * 0.5 - 0.20 * 0
    ASSERT_NEAR(rep.status.confidence, 0.87, 1e-9);
}

void test_ConvergenceEventComparesPrediction() {
    EngineConfig cfg;
    PhaseHistoryStore store;
    // 38 个样本, 最后一个 1.5 度: 尚未进入, ETA 3 天
    store.appendAll(linearSeries(38, 20.0, -0.5));
    CountingNotifier notifier;
    AuditLog audit;
    ConvergenceEngine engine(cfg, store, &notifier, &audit);

    const int64_t first = lastSampleTime(store) + kSecondsPerHour;
    EvaluationReport before = engine.evaluate(0.8, first);
    ASSERT_FALSE(before.status.isTriggered);
    ASSERT_FALSE(before.event.has_value());
    ASSERT_NEAR(*before.eta.eta.etaDays, 3.0, 1e-4);

    for (double deg : {1.0, 0.5}) {
        Sample s;
        s.asOfUtc = lastSampleTime(store) + kSecondsPerDay;
        s.phaseDeg = deg;
        ASSERT_TRUE(store.append(s) == AppendStatus::OK);
    }
    const int64_t now = lastSampleTime(store) + kSecondsPerHour;
    EvaluationReport rep = engine.evaluate(0.8, now);
    ASSERT_TRUE(rep.transitioned);
    ASSERT_TRUE(rep.event.has_value());
    ASSERT_EQ(rep.event->eventUtc, now);
    ASSERT_TRUE(rep.event->predictedUtc.has_value());
    // 第一次评估预测 first + 3 天, 实际提前 24 小时进入
    ASSERT_NEAR(double(*rep.event->predictedUtc - first), 3.0 * kSecondsPerDay, 10.0);
    ASSERT_NEAR(*rep.event->predictionErrorHours, -24.0, 0.01);
    ASSERT_EQ(rep.event->verification, std::string("PROBABLE"));
    ASSERT_TRUE(engine.latestEvent().has_value());

    ASSERT_TRUE(notifier.last.find("verification=PROBABLE") != std::string::npos);
    ASSERT_TRUE(notifier.last.find("prediction_error_hours") != std::string::npos);

    auto entries = audit.recent();
    ASSERT_EQ(entries.size(), size_t(1));
    ASSERT_EQ(entries[0].verificationStatus, std::string("PROBABLE"));
    ASSERT_TRUE(entries[0].predictionErrorHours.has_value());
    json line = json::parse(AuditLog::toJsonLine(entries[0]));
    ASSERT_EQ(line["verification_status"].get<std::string>(), std::string("PROBABLE"));
    ASSERT_TRUE(line["predicted_utc"].is_string());
    ASSERT_NEAR(line["prediction_error_hours"].get<double>(), -24.0, 0.01);
}

void test_ConvergenceEventConfirmedAtZeroGap() {
    EngineConfig cfg;
    PhaseHistoryStore store;
    // 最后一个样本恰好 0 度
    store.appendAll(linearSeries(40, 19.5, -0.5));
    AuditLog audit;
    ConvergenceEngine engine(cfg, store, nullptr, &audit);

    EvaluationReport rep = engine.evaluate(0.8, lastSampleTime(store) + kSecondsPerHour);
    ASSERT_TRUE(rep.status.isTriggered);
    ASSERT_TRUE(rep.event.has_value());
    ASSERT_EQ(rep.event->verification, std::string("CONFIRMED"));
    ASSERT_EQ(audit.recent()[0].verificationStatus, std::string("CONFIRMED"));

    // clarity 不超过 0.7 时只算 PROBABLE
    PhaseHistoryStore store2;
    store2.appendAll(linearSeries(40, 19.5, -0.5));
    ConvergenceEngine engine2(cfg, store2);
    EvaluationReport dim = engine2.evaluate(0.68, lastSampleTime(store2) + kSecondsPerHour);
    ASSERT_TRUE(dim.status.isTriggered);
    ASSERT_EQ(dim.event->verification, std::string("PROBABLE"));
}

void test_ConcurrentEvaluateWithAppendsAlertsOnce() {
    EngineConfig cfg;
    PhaseHistoryStore store;
    fillClosingHistory(store);
    CountingNotifier notifier;
    AuditLog audit;
    ConvergenceEngine engine(cfg, store, &notifier, &audit);

    const int64_t now = lastSampleTime(store) + kSecondsPerHour;
    std::atomic<int> notTriggered(0);
    std::vector<std::thread> workers;
    for (int w = 0; w < 8; ++w) {
        workers.emplace_back([&]() {
            for (int i = 0; i < 20; ++i) {
                if (!engine.evaluate(0.8, now).status.isTriggered) notTriggered++;
            }
        });
    }
    // 同时回填更早的样本, 延长同一条直线, 不改变最新样本
    std::thread writer([&]() {
        for (int i = 0; i < 100; ++i) {
            Sample s;
            s.asOfUtc = kT0 - int64_t(i + 1) * kSecondsPerDay;
            s.phaseDeg = 20.0 + 0.5 * (i + 1);
            store.append(s);
        }
    });
    for (auto& t : workers) t.join();
    writer.join();

    ASSERT_EQ(notifier.count, 1);
    ASSERT_EQ(notTriggered.load(), 0);
    ASSERT_EQ(audit.recent().size(), size_t(1));
    ASSERT_EQ(store.size(), size_t(140));
    ASSERT_TRUE(engine.state().isTriggered);
}

void test_StaleDataDoesNotTrigger() {
    EngineConfig cfg;
    PhaseHistoryStore store;
    fillClosingHistory(store);
    CountingNotifier notifier;
    ConvergenceEngine engine(cfg, store, &notifier);

    EvaluationReport rep = engine.evaluate(0.8, lastSampleTime(store) + 25 * kSecondsPerHour);
    ASSERT_FALSE(rep.status.isTriggered);
    ASSERT_TRUE(rep.status.dataStatus == DataStatus::STALE);
    ASSERT_NEAR(*rep.status.dataFreshHours, 25.0, 1e-9);
    ASSERT_EQ(notifier.count, 0);

    // clarity 拉取失败同样视为陈旧
    EvaluationReport noClarity = engine.evaluate(std::nullopt, lastSampleTime(store) + kSecondsPerHour);
    ASSERT_FALSE(noClarity.status.isTriggered);
    ASSERT_TRUE(noClarity.status.dataStatus == DataStatus::STALE);
    ASSERT_FALSE(noClarity.status.gti.has_value());
}

void test_InsufficientHistory() {
    EngineConfig cfg;
    PhaseHistoryStore store;
    store.appendAll(linearSeries(10, 50.0, -0.5));
    ConvergenceEngine engine(cfg, store);

    EvaluationReport rep = engine.evaluate(0.9, lastSampleTime(store) + kSecondsPerHour);
    ASSERT_TRUE(rep.eta.eta.status == ConvergenceStatus::INSUFFICIENT_DATA);
    ASSERT_TRUE(rep.status.dataStatus == DataStatus::INSUFFICIENT_DATA);
    ASSERT_FALSE(rep.status.closingRateDegPerDay.has_value());
    ASSERT_FALSE(rep.status.isTriggered);

    PhaseHistoryStore empty;
    ConvergenceEngine emptyEngine(cfg, empty);
    EvaluationReport none = emptyEngine.evaluate(0.9, kT0);
    ASSERT_FALSE(none.status.phaseGapDeg.has_value());
    ASSERT_TRUE(none.status.dataStatus == DataStatus::STALE);
}

void test_UnavailableStoreSkipsCycle() {
    EngineConfig cfg;
    PhaseHistoryStore store;
    fillClosingHistory(store);
    ConvergenceEngine engine(cfg, store);

    const int64_t now = lastSampleTime(store) + kSecondsPerHour;
    ASSERT_TRUE(engine.evaluate(0.8, now).status.isTriggered);

    store.markUnavailable("history volume unmounted");
    EvaluationReport rep = engine.evaluate(0.8, now + 300);
    ASSERT_TRUE(rep.skipped);
    ASSERT_TRUE(rep.status.cycleSkipped);
    ASSERT_TRUE(rep.status.isTriggered);
    ASSERT_EQ(rep.status.asOfUtc, now + 300);
    ASSERT_TRUE(rep.status.reason.find("unmounted") != std::string::npos);
    ASSERT_EQ(engine.skippedCycles(), 1);
    ASSERT_TRUE(engine.state().isTriggered);
    ASSERT_TRUE(engine.latestStatus()->cycleSkipped);

    store.markAvailable();
    EvaluationReport back = engine.evaluate(0.8, now + 600);
    ASSERT_FALSE(back.skipped);
    ASSERT_TRUE(back.status.isTriggered);
}

void test_RestoredStateDoesNotRealert() {
    EngineConfig cfg;
    PhaseHistoryStore store;
    fillClosingHistory(store);
    CountingNotifier notifier;
    ConvergenceEngine engine(cfg, store, &notifier);

    EventState st;
    st.isTriggered = true;
    st.since = kT0;
    st.samplesConfirmed = 10;
    engine.restoreState(st);

    EvaluationReport rep = engine.evaluate(0.8, lastSampleTime(store) + kSecondsPerHour);
    ASSERT_TRUE(rep.status.isTriggered);
    ASSERT_FALSE(rep.transitioned);
    ASSERT_EQ(notifier.count, 0);
    ASSERT_EQ(engine.state().since, kT0);
}

void test_ReportJsonKeys() {
    EngineConfig cfg;
    PhaseHistoryStore store;
    fillClosingHistory(store);
    ConvergenceEngine engine(cfg, store);
    EvaluationReport rep = engine.evaluate(0.8, lastSampleTime(store) + kSecondsPerHour);

    json st = ReportGenerator::statusToJson(rep.status);
    ASSERT_TRUE(st["is_triggered"].get<bool>());
    ASSERT_TRUE(st["is_0000"].get<bool>());
    ASSERT_NEAR(st["gti"].get<double>(), 0.8, 1e-12);
    ASSERT_TRUE(st["confidence"].is_number());
    ASSERT_EQ(st["evidence"]["samples_confirmed"].get<int>(), 39);
    ASSERT_TRUE(st["evidence"]["closing_rate_deg_per_day"].is_number());
    ASSERT_NEAR(st["evidence"]["data_fresh_hours"].get<double>(), 1.0, 1e-9);
    ASSERT_EQ(st["data_status"].get<std::string>(), std::string("OK"));

    json eta = ReportGenerator::etaToJson(rep.eta);
    ASSERT_TRUE(eta["closing"].get<bool>());
    ASSERT_EQ(eta["status"].get<std::string>(), std::string("CONVERGING"));
    ASSERT_TRUE(eta["eta_days"].is_number());
    ASSERT_TRUE(eta["eta_date"].is_string());
    ASSERT_TRUE(eta["ci95"].is_array() || eta["ci95"].is_null());
    ASSERT_EQ(eta["n_used"].get<size_t>(), rep.eta.nUsed);

    const std::string path = "test_status_report.json";
    ReportGenerator gen;
    ASSERT_TRUE(gen.saveToFile(path, rep.status, rep.eta));
    std::ifstream ifs(path);
    json saved = json::parse(ifs);
    ASSERT_TRUE(saved.contains("status"));
    ASSERT_TRUE(saved.contains("eta"));
    ifs.close();
    std::remove(path.c_str());
}

void test_SchedulerCyclePersistsState() {
    EngineConfig cfg;
    cfg.runtime.clarityFile = "test_sched_gti.json";
    cfg.runtime.statusFile = "test_sched_status.json";
    cfg.runtime.stateFile = "test_sched_state.json";
    cfg.runtime.intervalSeconds = 1;
    {
        std::ofstream ofs(cfg.runtime.clarityFile);
        ofs << R"({"gti_value": 0.9})";
    }

    PhaseHistoryStore store;
    const int64_t start = nowUtc() - 39 * kSecondsPerDay - kSecondsPerHour;
    fillClosingHistory(store, start);

    ConvergenceEngine engine(cfg, store);
    UpstreamClient upstream(1);
    StateStore stateStore(cfg.runtime.stateFile);
    EvaluationScheduler scheduler(cfg, engine, store, upstream, stateStore);

    EvaluationReport rep = scheduler.runCycle();
    ASSERT_TRUE(rep.transitioned);
    ASSERT_TRUE(rep.status.isTriggered);

    auto persisted = stateStore.load();
    ASSERT_TRUE(persisted.has_value());
    ASSERT_TRUE(persisted->isTriggered);
    std::ifstream status(cfg.runtime.statusFile);
    ASSERT_TRUE(status.good());
    status.close();

    scheduler.start();
    ASSERT_TRUE(scheduler.running());
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    scheduler.stop();
    ASSERT_FALSE(scheduler.running());
    ASSERT_TRUE(engine.state().isTriggered);

    std::remove(cfg.runtime.clarityFile.c_str());
    std::remove(cfg.runtime.statusFile.c_str());
    std::remove(cfg.runtime.stateFile.c_str());
}

int main() {
    quietLogs();
    std::cout << "========================================\n";
    std::cout << "Convergence Engine Tests\n";
    std::cout << "========================================\n\n";

    RUN_TEST(ClosingEpisodeEntersAndAlertsOnce);
    RUN_TEST(WideningGapResetsToOpen);
    RUN_TEST(WideningFitBlocksTrigger);
    RUN_TEST(FutureSampleIsStale);
    RUN_TEST(ReferenceScenarioConfidence);
    RUN_TEST(ConvergenceEventComparesPrediction);
    RUN_TEST(ConvergenceEventConfirmedAtZeroGap);
    RUN_TEST(ConcurrentEvaluateWithAppendsAlertsOnce);
    RUN_TEST(StaleDataDoesNotTrigger);
    RUN_TEST(InsufficientHistory);
    RUN_TEST(UnavailableStoreSkipsCycle);
    RUN_TEST(RestoredStateDoesNotRealert);
    RUN_TEST(ReportJsonKeys);
    RUN_TEST(SchedulerCyclePersistsState);

    return summarize("test_engine");
}
