#pragma once
#include <cstddef>
#include <vector>

// numpy.percentile 默认 (linear) 插值, pct ∈ [0,100]; 空输入返回 NaN
double percentile(std::vector<double> values, double pct);
double median(const std::vector<double>& values);
double interquartileRange(const std::vector<double>& values);

struct KendallResult {
    double tau = 0.0;
    double z = 0.0;
    double pTwoSided = 1.0;
    double pDecreasing = 1.0;   // 单侧: H1 为下降趋势
    size_t n = 0;
    bool valid = false;
};

// Kendall tau-b, 正态近似 (含 ties 修正)
KendallResult kendallTau(const std::vector<double>& x, const std::vector<double>& y);

// 以下标为 x 的单调性检验
KendallResult kendallTrend(const std::vector<double>& series);

double clampUnit(double x);
