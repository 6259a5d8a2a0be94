#pragma once
#include "EngineConfig.h"
#include "PhaseHistoryStore.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// 拟合窗口: 历史的派生视图, 每次评估临时生成
struct FitWindow {
    std::vector<int64_t> times;
    std::vector<double> phaseDeg;       // 原始 (有界) 角度
    std::vector<double> phaseRad;       // 解缠后, 末点对齐到最新的有界角度
    std::vector<double> xDays;          // 距窗口首样本的天数
    int64_t windowStart = 0;
    int64_t windowEnd = 0;
    size_t droppedBeforeGap = 0;
};

struct TrendEstimate {
    double slopePerDay = 0.0;           // rad/day
    double intercept = 0.0;             // rad, x = 0 处
    double phiNow = 0.0;                // 窗口末时刻的拟合相位, rad
    int64_t windowStart = 0;
    int64_t windowEnd = 0;
    size_t nUsed = 0;                   // 剔除离群点后参与拟合的点数
    size_t nWindow = 0;
    double xNowDays = 0.0;
    double residualStd = 0.0;
    double residualIqrRad = 0.0;
    bool hasUncertainty = false;
    double slopeStdErr = 0.0;
    double interceptStdErr = 0.0;
    double covInterceptSlope = 0.0;
};

enum class FitStatus { OK, INSUFFICIENT_DATA };

struct FitOutcome {
    FitStatus status = FitStatus::INSUFFICIENT_DATA;
    std::optional<TrendEstimate> estimate;
    std::string reason;
};

struct LineFit {
    bool ok = false;
    double slope = 0.0;
    double intercept = 0.0;
    double xMean = 0.0;
    double sxx = 0.0;
    double ssr = 0.0;
    size_t n = 0;
};

class TrendFitter {
public:
    explicit TrendFitter(const TrendConfig& cfg);

    std::optional<FitWindow> selectWindow(const std::vector<Sample>& history, std::string* reason = nullptr) const;
    FitOutcome fit(const std::vector<Sample>& history) const;
    FitOutcome fitWindow(const FitWindow& window) const;

    static LineFit ordinaryLeastSquares(const std::vector<double>& x, const std::vector<double>& y);

private:
    TrendConfig cfg_;
};
