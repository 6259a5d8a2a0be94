#include "Statistics.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

double percentile(std::vector<double> values, double pct) {
    if (values.empty()) return std::numeric_limits<double>::quiet_NaN();
    std::sort(values.begin(), values.end());
    pct = std::max(0.0, std::min(100.0, pct));
    double rank = pct / 100.0 * double(values.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(rank));
    size_t hi = static_cast<size_t>(std::ceil(rank));
    double frac = rank - double(lo);
    return values[lo] + (values[hi] - values[lo]) * frac;
}

double median(const std::vector<double>& values) {
    return percentile(values, 50.0);
}

double interquartileRange(const std::vector<double>& values) {
    return percentile(values, 75.0) - percentile(values, 25.0);
}

double clampUnit(double x) {
    if (std::isnan(x)) return 0.0;
    return std::max(0.0, std::min(1.0, x));
}

// 同值分组的 Σ t(t-1), Σ t(t-1)(t-2), Σ t(t-1)(2t+5)
struct TieSums {
    double v0 = 0.0;
    double v1 = 0.0;
    double v2 = 0.0;
};

static TieSums tieSums(const std::vector<double>& v) {
    std::map<double, size_t> counts;
    for (double x : v) counts[x]++;
    TieSums s;
    for (const auto& kv : counts) {
        double t = double(kv.second);
        if (t < 2) continue;
        s.v0 += t * (t - 1.0);
        s.v1 += t * (t - 1.0) * (t - 2.0);
        s.v2 += t * (t - 1.0) * (2.0 * t + 5.0);
    }
    return s;
}

KendallResult kendallTau(const std::vector<double>& x, const std::vector<double>& y) {
    KendallResult r;
    size_t n = std::min(x.size(), y.size());
    r.n = n;
    if (n < 3) return r;

    double concordant = 0.0, discordant = 0.0;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            double dx = x[j] - x[i];
            double dy = y[j] - y[i];
            double prod = dx * dy;
            if (prod > 0) concordant += 1.0;
            else if (prod < 0) discordant += 1.0;
        }
    }

    std::vector<double> xs(x.begin(), x.begin() + n), ys(y.begin(), y.begin() + n);
    TieSums tx = tieSums(xs), ty = tieSums(ys);
    double n0 = double(n) * double(n - 1) / 2.0;
    double n1 = tx.v0 / 2.0;
    double n2 = ty.v0 / 2.0;
    double denom = std::sqrt((n0 - n1) * (n0 - n2));
    if (denom <= 0.0) return r;

    double s = concordant - discordant;
    r.tau = s / denom;

    double nn = double(n);
    double var = (nn * (nn - 1.0) * (2.0 * nn + 5.0) - tx.v2 - ty.v2) / 18.0
               + (tx.v1 * ty.v1) / (9.0 * nn * (nn - 1.0) * (nn - 2.0))
               + (tx.v0 * ty.v0) / (2.0 * nn * (nn - 1.0));
    if (var <= 0.0) return r;

    r.z = s / std::sqrt(var);
    r.pTwoSided = std::min(1.0, std::erfc(std::fabs(r.z) / std::sqrt(2.0)));
    r.pDecreasing = 0.5 * std::erfc(-r.z / std::sqrt(2.0));
    r.valid = true;
    return r;
}

KendallResult kendallTrend(const std::vector<double>& series) {
    std::vector<double> idx(series.size());
    for (size_t i = 0; i < series.size(); ++i) idx[i] = double(i);
    return kendallTau(idx, series);
}
