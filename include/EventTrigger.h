#pragma once
#include "EngineConfig.h"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

struct EventState {
    bool isTriggered = false;           // false = OPEN, true = CLOSING
    int64_t since = 0;                  // 进入当前状态的时间
    int samplesConfirmed = 0;
};

struct TriggerInputs {
    int64_t asOfUtc = 0;
    std::optional<double> phaseGapDeg;  // 无数据时为空
    std::optional<double> clarity;      // 拉取超时/失败时为空, 按陈旧处理
    bool trendConfirmed = false;
    bool fitClosing = false;            // 拟合斜率 < 0 (ETA 为 CONVERGING)
    int samplesConfirmed = 0;
    std::optional<double> dataAgeHours; // 最新样本距今小时数
};

struct TransitionResult {
    EventState state;
    bool alertEmitted = false;
    bool transitioned = false;
    bool dataFresh = false;
    std::string reason;
};

// OPEN / CLOSING 滞回状态机; EventState 的唯一写入者
class EventTrigger {
public:
    explicit EventTrigger(const TriggerConfig& cfg, int k);

    EventState read() const;
    TransitionResult evaluate(const TriggerInputs& in);

    // 启动时从持久化状态恢复
    void restore(const EventState& st);
    // 评估周期中止: 状态保持不变
    void markSkipped();
    int skippedCycles() const;

    static const char* stateName(bool triggered) { return triggered ? "CLOSING" : "OPEN"; }

private:
    bool isFresh(const TriggerInputs& in) const;

    TriggerConfig cfg_;
    int k_;
    EventState state_;
    bool alertArmed_ = true;
    int lowClarityStreak_ = 0;
    int skipped_ = 0;
    mutable std::mutex mu_;
};
