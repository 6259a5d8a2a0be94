#include "EtaProjector.h"
#include "Statistics.h"
#include "TimeUtil.h"
#include <algorithm>
#include <cmath>
#include <random>

std::string EtaProjector::statusToStr(ConvergenceStatus s) {
    switch (s) {
        case ConvergenceStatus::CONVERGING: return "CONVERGING";
        case ConvergenceStatus::NOT_CLOSING: return "NOT_CLOSING";
        case ConvergenceStatus::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
    }
    return "INSUFFICIENT_DATA";
}

EtaResult EtaProjector::insufficient(const std::string& reason) const {
    EtaResult r;
    r.status = ConvergenceStatus::INSUFFICIENT_DATA;
    r.message = reason.empty() ? "insufficient data for trend fit" : reason;
    return r;
}

EtaResult EtaProjector::fromSlope(double phaseRad, double slopePerDay, int64_t nowUtc) const {
    EtaResult r;
    if (!std::isfinite(phaseRad) || !std::isfinite(slopePerDay)) {
        return insufficient("non-finite phase or slope");
    }
    if (slopePerDay >= 0.0) {
        r.status = ConvergenceStatus::NOT_CLOSING;
        r.message = "phase gap not closing (slope >= 0)";
        return r;
    }

    double eta = std::fabs(phaseRad) / (-slopePerDay);
    r.status = ConvergenceStatus::CONVERGING;
    r.etaDays = eta;
    r.message = "converging";
    // 超过 100 年不给日期, 也避免秒数溢出
    if (eta > kMaxEtaDays) {
        r.notes.push_back("ETA exceeds 100 years - likely not converging");
        return r;
    }
    std::string date = formatDateUtc(nowUtc + static_cast<int64_t>(std::llround(eta * kSecondsPerDay)));
    if (!date.empty()) r.etaDate = date;
    if (eta < 1.0) r.notes.push_back("convergence imminent (<1 day)");
    return r;
}

EtaResult EtaProjector::project(const TrendEstimate& trend, int64_t nowUtc) const {
    EtaResult r = fromSlope(trend.phiNow, trend.slopePerDay, nowUtc);
    if (!r.closing() || !trend.hasUncertainty) return r;

    // 一阶误差传播: eta = |φ| / (-m), φ = b + x·m
    const double m = trend.slopePerDay;
    const double phi = trend.phiNow;
    const double x = trend.xNowDays;
    const double varM = trend.slopeStdErr * trend.slopeStdErr;
    const double varB = trend.interceptStdErr * trend.interceptStdErr;
    const double covBM = trend.covInterceptSlope;
    const double varPhi = varB + x * x * varM + 2.0 * x * covBM;
    const double covPhiM = covBM + x * varM;

    const double sign = (phi >= 0.0) ? 1.0 : -1.0;
    const double dPhi = sign / (-m);
    const double dM = std::fabs(phi) / (m * m);
    const double var = dPhi * dPhi * varPhi + dM * dM * varM + 2.0 * dPhi * dM * covPhiM;
    if (!std::isfinite(var) || var < 0.0) return r;

    const double sd = std::sqrt(var);
    const double eta = *r.etaDays;
    r.ci68 = Interval(std::max(0.0, eta - kZ68 * sd), eta + kZ68 * sd);
    r.ci95 = Interval(std::max(0.0, eta - kZ95 * sd), eta + kZ95 * sd);
    return r;
}

EtaResult EtaProjector::instantaneous(double phaseRad, double slope, SlopeUnits units, int64_t nowUtc) const {
    double slopePerDay = (units == SlopeUnits::RAD_PER_SEC) ? slope * kSecondsPerDay : slope;
    EtaResult r = fromSlope(phaseRad, slopePerDay, nowUtc);
    r.notes.push_back(std::string("phase in radians; slope units=") +
                      (units == SlopeUnits::RAD_PER_SEC ? "rad_per_sec" : "rad_per_day"));
    return r;
}

std::optional<BootstrapBand> EtaProjector::bootstrapEtaBand(const std::vector<double>& etaDays,
                                                            int nBoot, unsigned seed) {
    const size_t kRecent = 50;
    std::vector<double> recent(etaDays.end() - std::min(etaDays.size(), kRecent), etaDays.end());
    if (recent.size() < 5 || nBoot <= 0) return std::nullopt;

    std::mt19937 rng(seed);
    std::uniform_int_distribution<size_t> pick(0, recent.size() - 1);
    std::vector<double> iqrs;
    iqrs.reserve(nBoot);
    std::vector<double> sample(recent.size());
    for (int b = 0; b < nBoot; ++b) {
        for (size_t i = 0; i < sample.size(); ++i) sample[i] = recent[pick(rng)];
        iqrs.push_back(interquartileRange(sample));
    }

    BootstrapBand band;
    band.iqrMedianDays = median(iqrs);
    band.iqr95Days = percentile(iqrs, 95.0);
    band.nBoot = nBoot;
    return band;
}

std::optional<PlaceboEta> EtaProjector::placeboEta(const std::vector<double>& etaDays, int nTrials, unsigned seed) {
    const size_t kPseudoRecent = 12;
    if (etaDays.size() < kPseudoRecent || nTrials <= 0) return std::nullopt;

    std::mt19937 rng(seed);
    std::vector<double> shuffled(etaDays);
    std::vector<double> meds;
    meds.reserve(nTrials);
    for (int t = 0; t < nTrials; ++t) {
        std::shuffle(shuffled.begin(), shuffled.end(), rng);
        meds.push_back(median(std::vector<double>(shuffled.end() - kPseudoRecent, shuffled.end())));
    }

    PlaceboEta p;
    p.medianDays = median(meds);
    p.iqrDays = interquartileRange(meds);
    p.nTrials = nTrials;
    return p;
}

std::optional<StabilityReport> EtaProjector::assessStability(const std::deque<double>& etaDays,
                                                             const std::deque<double>& slopes) {
    std::vector<double> etas;
    for (double e : etaDays) {
        if (e > 0.0 && e < kMaxEtaDays) etas.push_back(e);
    }
    if (etas.empty()) return std::nullopt;

    StabilityReport rep;
    rep.nPoints = etas.size();
    rep.etaDaysLatest = etas.back();
    rep.etaDaysMedian = median(etas);
    rep.bandIqrDays = interquartileRange(etas);

    rep.bootstrap = bootstrapEtaBand(etas);
    rep.placebo = placeboEta(etas);

    if (slopes.size() >= 8) {
        KendallResult k = kendallTrend(std::vector<double>(slopes.begin(), slopes.end()));
        if (k.valid) {
            rep.kendallTau = k.tau;
            rep.kendallPValue = k.pTwoSided;
        }
    }

    if (rep.bandIqrDays > 90.0) {
        rep.assessment = "UNSTABLE - prediction varies widely (>90 days IQR)";
    } else if (rep.bandIqrDays > 45.0) {
        rep.assessment = "MODERATE - some variability in prediction";
    } else {
        rep.assessment = "STABLE - consistent prediction band";
        if (rep.kendallTau && *rep.kendallTau < -0.3) rep.assessment += " with accelerating convergence";
        else if (rep.kendallTau && *rep.kendallTau > 0.3) rep.assessment += " but slope increasing (diverging trend)";
    }
    return rep;
}
