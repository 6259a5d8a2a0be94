#include "ClosingTrendValidator.h"
#include <algorithm>

ClosingTrendValidator::ClosingTrendValidator(const ValidatorConfig& cfg) : cfg_(cfg) {}

int ClosingTrendValidator::closingStreak(const std::vector<double>& unwrappedRad) {
    int streak = 0;
    for (size_t i = unwrappedRad.size(); i > 1; --i) {
        if (unwrappedRad[i - 1] - unwrappedRad[i - 2] < 0.0) streak++;
        else break;
    }
    return streak;
}

ValidationResult ClosingTrendValidator::validate(const std::vector<double>& unwrappedRad) const {
    ValidationResult r;
    r.samplesConfirmed = closingStreak(unwrappedRad);
    r.signConfirmed = r.samplesConfirmed >= cfg_.k;

    if (cfg_.mode != ValidationMode::SIGN && unwrappedRad.size() >= 3) {
        size_t m = std::min(cfg_.rankWindow, unwrappedRad.size());
        std::vector<double> tail(unwrappedRad.end() - m, unwrappedRad.end());
        KendallResult k = kendallTrend(tail);
        r.rank = k;
        r.rankConfirmed = k.valid && k.tau < 0.0 && k.pDecreasing < cfg_.rankAlpha;
    }

    switch (cfg_.mode) {
        case ValidationMode::SIGN:   r.confirmed = r.signConfirmed; break;
        case ValidationMode::RANK:   r.confirmed = r.rankConfirmed; break;
        case ValidationMode::BOTH:   r.confirmed = r.signConfirmed && r.rankConfirmed; break;
        case ValidationMode::EITHER: r.confirmed = r.signConfirmed || r.rankConfirmed; break;
    }
    return r;
}
