#pragma once
#include "TrendFitter.h"
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class ConvergenceStatus { CONVERGING, NOT_CLOSING, INSUFFICIENT_DATA };

using Interval = std::pair<double, double>;

struct EtaResult {
    ConvergenceStatus status = ConvergenceStatus::INSUFFICIENT_DATA;
    std::optional<double> etaDays;
    std::optional<std::string> etaDate;     // YYYY-MM-DD, UTC
    std::optional<Interval> ci68;
    std::optional<Interval> ci95;
    std::string message;
    std::vector<std::string> notes;

    bool closing() const { return status == ConvergenceStatus::CONVERGING; }
};

// 有放回重采样得到的 ETA 带宽 (IQR) 分布
struct BootstrapBand {
    double iqrMedianDays = 0.0;
    double iqr95Days = 0.0;
    int nBoot = 0;
};

// 打乱时间顺序后的 "伪最新" ETA 中位数分布, 作为无时间结构时的对照
struct PlaceboEta {
    double medianDays = 0.0;
    double iqrDays = 0.0;
    int nTrials = 0;
};

// 历史 ETA / 斜率序列的稳定性评估
struct StabilityReport {
    size_t nPoints = 0;
    double etaDaysLatest = 0.0;
    double etaDaysMedian = 0.0;
    double bandIqrDays = 0.0;
    std::optional<double> kendallTau;
    std::optional<double> kendallPValue;
    std::optional<BootstrapBand> bootstrap;
    std::optional<PlaceboEta> placebo;
    std::string assessment;
};

enum class SlopeUnits { RAD_PER_DAY, RAD_PER_SEC };

class EtaProjector {
public:
    static constexpr double kMaxEtaDays = 36500.0;  // 100 年
    static constexpr double kZ68 = 1.0;
    static constexpr double kZ95 = 1.96;

    EtaResult project(const TrendEstimate& trend, int64_t nowUtc) const;

    // 仅由当前相位和斜率计算, 无误差带
    EtaResult instantaneous(double phaseRad, double slope, SlopeUnits units, int64_t nowUtc) const;

    EtaResult insufficient(const std::string& reason) const;

    static std::optional<StabilityReport> assessStability(const std::deque<double>& etaDays,
                                                          const std::deque<double>& slopes);

    // 取最近 50 个估计, 不足 5 个返回空. 固定种子, 结果可复现
    static std::optional<BootstrapBand> bootstrapEtaBand(const std::vector<double>& etaDays,
                                                         int nBoot = 300, unsigned seed = 321);
    // 每次打乱后取末尾 12 个的中位数; 不足 12 个估计返回空
    static std::optional<PlaceboEta> placeboEta(const std::vector<double>& etaDays,
                                                int nTrials = 200, unsigned seed = 123);

    static std::string statusToStr(ConvergenceStatus s);

private:
    EtaResult fromSlope(double phaseRad, double slopePerDay, int64_t nowUtc) const;
};
