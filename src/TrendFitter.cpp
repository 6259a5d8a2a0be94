#include "TrendFitter.h"
#include "AngularUnwrapper.h"
#include "Logger.h"
#include "Statistics.h"
#include "TimeUtil.h"
#include <algorithm>
#include <cmath>

TrendFitter::TrendFitter(const TrendConfig& cfg) : cfg_(cfg) {}

LineFit TrendFitter::ordinaryLeastSquares(const std::vector<double>& x, const std::vector<double>& y) {
    LineFit f;
    size_t n = std::min(x.size(), y.size());
    f.n = n;
    if (n < 2) return f;

    double sumX = 0, sumY = 0;
    for (size_t i = 0; i < n; i++) {
        sumX += x[i];
        sumY += y[i];
    }
    double meanX = sumX / n;
    double meanY = sumY / n;

    double sxx = 0, sxy = 0;
    for (size_t i = 0; i < n; i++) {
        double dx = x[i] - meanX;
        sxx += dx * dx;
        sxy += dx * (y[i] - meanY);
    }
    if (sxx <= 0.0) return f;   // 所有点同一时刻, 斜率无定义

    f.slope = sxy / sxx;
    f.intercept = meanY - f.slope * meanX;
    f.xMean = meanX;
    f.sxx = sxx;
    for (size_t i = 0; i < n; i++) {
        double r = y[i] - (f.intercept + f.slope * x[i]);
        f.ssr += r * r;
    }
    f.ok = std::isfinite(f.slope) && std::isfinite(f.intercept);
    return f;
}

std::optional<FitWindow> TrendFitter::selectWindow(const std::vector<Sample>& history, std::string* reason) const {
    auto fail = [&](const std::string& why) -> std::optional<FitWindow> {
        if (reason) *reason = why;
        return std::nullopt;
    };

    const size_t n = history.size();
    if (n < cfg_.minSamples) {
        return fail("insufficient data: " + std::to_string(n) + " samples (need " + std::to_string(cfg_.minSamples) + ")");
    }

    const int64_t tEnd = history.back().asOfUtc;
    const int64_t tStart = tEnd - static_cast<int64_t>(cfg_.maxDays * kSecondsPerDay);
    auto it = std::lower_bound(history.begin(), history.end(), tStart,
                               [](const Sample& s, int64_t t) { return s.asOfUtc < t; });
    size_t first = static_cast<size_t>(it - history.begin());
    if (n - first < cfg_.minSamples) {
        first = (n > cfg_.fallbackSamples) ? n - cfg_.fallbackSamples : 0;
    }

    // 断档: 只保留最后一个断档之后的数据
    size_t dropped = 0;
    const int64_t maxGap = static_cast<int64_t>(cfg_.maxGapDays * kSecondsPerDay);
    for (size_t i = n - 1; i > first; --i) {
        if (history[i].asOfUtc - history[i - 1].asOfUtc > maxGap) {
            dropped = i - first;
            first = i;
            break;
        }
    }
    if (dropped > 0) {
        LOG_INFO("fit window: gap over " + std::to_string(cfg_.maxGapDays) + " days, dropped " +
                 std::to_string(dropped) + " samples before it");
    }

    if (n - first < cfg_.minSamples) {
        return fail("insufficient data: " + std::to_string(n - first) + " samples in fit window (need " +
                    std::to_string(cfg_.minSamples) + ")");
    }

    const double spanDays = double(tEnd - history[first].asOfUtc) / kSecondsPerDay;
    if (cfg_.minSpanDays > 0.0 && spanDays < cfg_.minSpanDays) {
        return fail("insufficient data: window spans " + std::to_string(spanDays) + " days (need " +
                    std::to_string(cfg_.minSpanDays) + ")");
    }

    FitWindow w;
    w.droppedBeforeGap = dropped;
    w.windowStart = history[first].asOfUtc;
    w.windowEnd = tEnd;
    for (size_t i = first; i < n; ++i) {
        w.times.push_back(history[i].asOfUtc);
        w.phaseDeg.push_back(history[i].phaseDeg);
        w.xDays.push_back(double(history[i].asOfUtc - w.windowStart) / kSecondsPerDay);
    }

    AngularUnwrapper unwrapper;
    w.phaseRad = unwrapper.unwrapDegrees(w.phaseDeg);

    // 整体平移 2π 的整数倍, 使末点等于最新的有界角度
    const double wrappedLast = AngularUnwrapper::wrapRadians(degToRad(w.phaseDeg.back()));
    const double turns = std::round((wrappedLast - w.phaseRad.back()) / (2.0 * kPi));
    if (turns != 0.0) {
        for (double& v : w.phaseRad) v += turns * 2.0 * kPi;
    }
    return w;
}

FitOutcome TrendFitter::fitWindow(const FitWindow& window) const {
    FitOutcome out;
    std::vector<double> x = window.xDays;
    std::vector<double> y = window.phaseRad;

    LineFit best = ordinaryLeastSquares(x, y);
    if (!best.ok) {
        out.reason = "insufficient data: degenerate fit window";
        return out;
    }

    for (int iter = 0; iter < cfg_.trimIterations; ++iter) {
        std::vector<double> resid(x.size());
        for (size_t i = 0; i < x.size(); ++i) resid[i] = y[i] - (best.intercept + best.slope * x[i]);
        const double lo = percentile(resid, cfg_.trimLowPct);
        const double hi = percentile(resid, cfg_.trimHighPct);

        std::vector<double> kx, ky;
        for (size_t i = 0; i < x.size(); ++i) {
            if (resid[i] >= lo && resid[i] <= hi) {
                kx.push_back(x[i]);
                ky.push_back(y[i]);
            }
        }
        if (kx.size() < cfg_.minTrimSamples) break;

        LineFit refit = ordinaryLeastSquares(kx, ky);
        if (!refit.ok) break;
        best = refit;
        x.swap(kx);
        y.swap(ky);
    }

    TrendEstimate est;
    est.slopePerDay = best.slope;
    est.intercept = best.intercept;
    est.windowStart = window.windowStart;
    est.windowEnd = window.windowEnd;
    est.nUsed = best.n;
    est.nWindow = window.xDays.size();
    est.xNowDays = window.xDays.back();
    est.phiNow = best.intercept + best.slope * est.xNowDays;

    std::vector<double> resid(x.size());
    for (size_t i = 0; i < x.size(); ++i) resid[i] = y[i] - (best.intercept + best.slope * x[i]);
    est.residualIqrRad = interquartileRange(resid);

    if (best.n > 2) {
        const double s2 = best.ssr / double(best.n - 2);
        est.residualStd = std::sqrt(s2);
        est.slopeStdErr = std::sqrt(s2 / best.sxx);
        est.interceptStdErr = std::sqrt(s2 * (1.0 / best.n + best.xMean * best.xMean / best.sxx));
        est.covInterceptSlope = -best.xMean * s2 / best.sxx;
        est.hasUncertainty = std::isfinite(est.slopeStdErr) && std::isfinite(est.interceptStdErr);
    }

    out.status = FitStatus::OK;
    out.estimate = est;
    return out;
}

FitOutcome TrendFitter::fit(const std::vector<Sample>& history) const {
    std::string reason;
    auto window = selectWindow(history, &reason);
    if (!window) {
        FitOutcome out;
        out.reason = reason;
        return out;
    }
    return fitWindow(*window);
}
