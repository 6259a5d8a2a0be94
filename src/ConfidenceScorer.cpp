#include "ConfidenceScorer.h"
#include "Statistics.h"
#include <algorithm>
#include <cmath>
#include <vector>

ConfidenceScorer::ConfidenceScorer(const ConfidenceConfig& cfg, int k) : cfg_(cfg), k_(k) {}

double ConfidenceScorer::score(const ConfidenceInputs& in) const {
    double clarity = std::isfinite(in.clarity) ? std::max(0.0, std::min(1.0, in.clarity)) : 0.0;
    double dispersion = std::isnan(in.dispersion) ? 1.0 : std::max(0.0, std::min(1.0, in.dispersion));

    int extra = std::max(0, in.samplesConfirmed - k_);
    double persistence = std::min(1.0, double(extra) / cfg_.persistSaturation);

    return clampUnit(clarity + cfg_.persistWeight * persistence - cfg_.dispersionWeight * dispersion);
}

double ConfidenceScorer::etaDispersion(const std::deque<double>& recentEtaDays) const {
    if (recentEtaDays.size() < cfg_.minEtaEstimates) return cfg_.coldStartDispersion;
    std::vector<double> v(recentEtaDays.begin(), recentEtaDays.end());
    double iqr = interquartileRange(v);
    if (!std::isfinite(iqr)) return 1.0;
    return std::min(1.0, iqr / cfg_.etaIqrScaleDays);
}
