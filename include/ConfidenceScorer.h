#pragma once
#include "EngineConfig.h"
#include <deque>

struct ConfidenceInputs {
    double clarity = 0.0;
    double dispersion = 1.0;    // 归一化离散度, >= 1 为最大惩罚
    int samplesConfirmed = 0;
};

class ConfidenceScorer {
public:
    ConfidenceScorer(const ConfidenceConfig& cfg, int k);

    // 对 clarity 单调不减, 对 dispersion 单调不增, 对 samplesConfirmed 单调不减, 结果在 [0,1]
    double score(const ConfidenceInputs& in) const;

    // 近期 ETA 的 IQR / eta_iqr_scale_days; 样本不足时返回 cold_start_dispersion
    double etaDispersion(const std::deque<double>& recentEtaDays) const;

private:
    ConfidenceConfig cfg_;
    int k_;
};
