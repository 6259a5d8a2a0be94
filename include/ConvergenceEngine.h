#pragma once
#include "AlertNotifier.h"
#include "AuditLog.h"
#include "ClosingTrendValidator.h"
#include "ConfidenceScorer.h"
#include "EngineConfig.h"
#include "EtaProjector.h"
#include "EventTrigger.h"
#include "PhaseHistoryStore.h"
#include "TrendFitter.h"
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

enum class DataStatus { OK, STALE, INSUFFICIENT_DATA };

// 对外的事件状态记录
struct StatusRecord {
    int64_t asOfUtc = 0;
    bool isTriggered = false;
    std::optional<double> phaseGapDeg;
    std::optional<double> gti;
    double confidence = 0.0;
    std::optional<double> closingRateDegPerDay;     // 正值 = 收敛
    int samplesConfirmed = 0;
    std::optional<double> dataFreshHours;
    DataStatus dataStatus = DataStatus::INSUFFICIENT_DATA;
    bool cycleSkipped = false;
    std::string reason;
};

// 对外的 ETA 记录
struct EtaRecord {
    int64_t asOfUtc = 0;
    EtaResult eta;
    std::optional<double> slopeRadPerDay;
    std::optional<double> phiNowRad;
    size_t nUsed = 0;
    std::optional<StabilityReport> stability;
};

// 进入 CLOSING 时记录的收敛事件, 与此前的 ETA 预测对照
struct ConvergenceEvent {
    int64_t eventUtc = 0;
    double phaseGapDeg = 0.0;
    std::optional<double> clarity;
    std::optional<int64_t> predictedUtc;        // 最近一次 CONVERGING 预测的时刻
    std::optional<double> predictionErrorHours; // 事件 - 预测, 正值 = 晚于预测
    std::string verification;                   // CONFIRMED / PROBABLE
};

struct EvaluationReport {
    StatusRecord status;
    EtaRecord eta;
    std::optional<ConvergenceEvent> event;
    bool alertEmitted = false;
    bool transitioned = false;
    bool skipped = false;
};

// 单次评估: unwrap -> fit -> project -> validate -> transition -> score
class ConvergenceEngine {
public:
    ConvergenceEngine(const EngineConfig& cfg, PhaseHistoryStore& store,
                      AlertNotifier* notifier = nullptr, AuditLog* audit = nullptr);

    // clarity 为空表示上游拉取失败/超时, 按陈旧数据处理
    EvaluationReport evaluate(std::optional<double> clarity, int64_t nowUtc);

    std::optional<StatusRecord> latestStatus() const;
    std::optional<EtaRecord> latestEta() const;
    std::optional<ConvergenceEvent> latestEvent() const;

    EventState state() const { return trigger_.read(); }
    void restoreState(const EventState& st) { trigger_.restore(st); }
    int skippedCycles() const { return trigger_.skippedCycles(); }

    static std::string dataStatusToStr(DataStatus s);
    static std::string alertText(const StatusRecord& st, const EtaRecord& eta,
                                 const std::optional<ConvergenceEvent>& event = std::nullopt);

    static constexpr double kConfirmedGapDeg = 0.01;
    static constexpr double kConfirmedClarity = 0.7;

private:
    EvaluationReport runPipeline(const std::vector<Sample>& history, std::optional<double> clarity, int64_t nowUtc);
    EvaluationReport skippedReport(const std::string& why, int64_t nowUtc);

    EngineConfig cfg_;
    PhaseHistoryStore& store_;
    AlertNotifier* notifier_;
    AuditLog* audit_;

    TrendFitter fitter_;
    EtaProjector projector_;
    ClosingTrendValidator validator_;
    EventTrigger trigger_;
    ConfidenceScorer scorer_;

    std::deque<double> etaLog_;
    std::deque<double> slopeLog_;
    std::optional<int64_t> lastPredictedUtc_;

    std::optional<StatusRecord> lastStatus_;
    std::optional<EtaRecord> lastEta_;
    std::optional<ConvergenceEvent> lastEvent_;

    std::mutex evalMu_;             // 同一时刻只允许一次评估
    mutable std::mutex recordMu_;
};
