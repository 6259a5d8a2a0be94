#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

enum class ValidationMode { SIGN, RANK, BOTH, EITHER };

struct HistoryConfig {
    size_t maxSamples = 5000;           // FIFO 保留上限
    std::string historyFile = "artifacts/phase_gap_history.json";
};

struct TrendConfig {
    double maxDays = 300.0;             // 拟合窗口 [t_end - maxDays, t_end]
    size_t fallbackSamples = 200;       // 窗口过稀时退回最近 N 个样本
    size_t minSamples = 20;
    size_t minTrimSamples = 10;
    int trimIterations = 2;
    double trimLowPct = 5.0;
    double trimHighPct = 95.0;
    double maxGapDays = 30.0;           // 超过此间隔视为断档, 断档前的数据作废
    double minSpanDays = 0.0;           // 0 = 不检查窗口跨度
};

struct ValidatorConfig {
    int k = 3;                          // 连续收敛样本数
    ValidationMode mode = ValidationMode::SIGN;
    size_t rankWindow = 12;
    double rankAlpha = 0.05;
};

struct TriggerConfig {
    double enterDeg = 1.0;              // θ_enter
    double exitDeg = 1.5;               // θ_exit, 必须 > θ_enter
    double clarityMin = 0.65;           // τ
    double freshnessHours = 24.0;       // X
    double futureToleranceHours = 0.1;  // 样本时间超前当前时刻的容差, 超出按陈旧处理
    int clarityExitEvaluations = 3;     // clarity < τ 持续多少次评估后复位
};

struct ConfidenceConfig {
    double persistWeight = 0.30;
    double persistSaturation = 2.0;     // 超过 k 的确认数达到该值时奖励饱和
    double dispersionWeight = 0.20;
    double etaIqrScaleDays = 90.0;
    size_t minEtaEstimates = 4;
    double coldStartDispersion = 0.0;   // ETA 估计不足 minEtaEstimates 时使用, 0 = 不惩罚
    size_t etaLogSize = 50;
};

struct RuntimeConfig {
    int intervalSeconds = 300;
    int fetchTimeoutSeconds = 10;
    std::string samplesUrl;             // 空 = 不从上游拉取样本
    std::string clarityUrl;
    std::string clarityFile = "artifacts/latest_gti.json";
    std::string webhookUrl;
    std::string stateFile = "artifacts/event_state.json";
    std::string auditFile = "artifacts/event_audit.jsonl";
    std::string statusFile = "artifacts/zero_reset_status.json";
    std::string logFile = "phasegap_monitor.log";
    std::string logLevel = "info";
};

struct EngineConfig {
    HistoryConfig history;
    TrendConfig trend;
    ValidatorConfig validator;
    TriggerConfig trigger;
    ConfidenceConfig confidence;
    RuntimeConfig runtime;

    // 阈值/范围检查, 失败抛 ConfigError
    void validate() const;
};

class ConfigLoader {
public:
    static EngineConfig loadFromFile(const std::string& path);
    static EngineConfig loadFromJsonString(const std::string& jsonStr);

    // ${VAR} -> 环境变量, 未定义的替换为空串
    static std::string substituteEnvVars(const std::string& content);
};

std::string validationModeToStr(ValidationMode mode);
ValidationMode validationModeFromStr(const std::string& name);
