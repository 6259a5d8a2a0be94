#include "ReportGenerator.h"
#include "Logger.h"
#include "TimeUtil.h"
#include <fstream>
#include <iomanip>
#include <iostream>

using json = nlohmann::json;

template <typename T>
static json orNull(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

static json intervalToJson(const std::optional<Interval>& iv) {
    if (!iv) return nullptr;
    return json::array({iv->first, iv->second});
}

json ReportGenerator::statusToJson(const StatusRecord& st) {
    json j;
    j["as_of_utc"] = formatIsoUtc(st.asOfUtc);
    j["is_triggered"] = st.isTriggered;
    j["is_0000"] = st.isTriggered;
    j["phase_gap_deg"] = orNull(st.phaseGapDeg);
    j["gti"] = orNull(st.gti);
    j["confidence"] = st.confidence;
    j["evidence"] = {
        {"closing_rate_deg_per_day", orNull(st.closingRateDegPerDay)},
        {"samples_confirmed", st.samplesConfirmed},
        {"data_fresh_hours", orNull(st.dataFreshHours)},
    };
    j["data_status"] = ConvergenceEngine::dataStatusToStr(st.dataStatus);
    j["cycle_skipped"] = st.cycleSkipped;
    j["reason"] = st.reason;
    return j;
}

json ReportGenerator::etaToJson(const EtaRecord& eta) {
    json j;
    j["as_of_utc"] = formatIsoUtc(eta.asOfUtc);
    j["closing"] = eta.eta.closing();
    j["status"] = EtaProjector::statusToStr(eta.eta.status);
    j["eta_days"] = orNull(eta.eta.etaDays);
    j["eta_date"] = orNull(eta.eta.etaDate);
    j["ci68"] = intervalToJson(eta.eta.ci68);
    j["ci95"] = intervalToJson(eta.eta.ci95);
    j["slope_rad_per_day"] = orNull(eta.slopeRadPerDay);
    j["phi_now_rad"] = orNull(eta.phiNowRad);
    j["n_used"] = eta.nUsed;
    j["message"] = eta.eta.message;
    j["notes"] = eta.eta.notes;
    if (eta.stability) {
        const auto& s = *eta.stability;
        j["stability"] = {
            {"n_points", s.nPoints},
            {"eta_days_latest", s.etaDaysLatest},
            {"eta_days_median", s.etaDaysMedian},
            {"band_iqr_days", s.bandIqrDays},
            {"kendall_tau", orNull(s.kendallTau)},
            {"kendall_pvalue", orNull(s.kendallPValue)},
            {"assessment", s.assessment},
        };
        if (s.bootstrap) {
            j["stability"]["bootstrap"] = {
                {"iqr_median_days", s.bootstrap->iqrMedianDays},
                {"iqr_95pct_days", s.bootstrap->iqr95Days},
                {"n_boot", s.bootstrap->nBoot},
            };
        } else {
            j["stability"]["bootstrap"] = nullptr;
        }
        if (s.placebo) {
            j["stability"]["placebo"] = {
                {"median_days", s.placebo->medianDays},
                {"iqr_days", s.placebo->iqrDays},
                {"n_trials", s.placebo->nTrials},
            };
        } else {
            j["stability"]["placebo"] = nullptr;
        }
    } else {
        j["stability"] = nullptr;
    }
    return j;
}

void ReportGenerator::printToConsole(const StatusRecord& st, const EtaRecord& eta) {
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "===== Phase Gap Report " << formatIsoUtc(st.asOfUtc) << " =====\n";
    std::cout << "State: " << (st.isTriggered ? "CLOSING" : "OPEN")
              << (st.cycleSkipped ? " (cycle skipped)" : "") << "\n";
    std::cout << "Data: " << ConvergenceEngine::dataStatusToStr(st.dataStatus);
    if (st.dataFreshHours) std::cout << " (latest sample " << *st.dataFreshHours << " h old)";
    std::cout << "\n";
    if (st.phaseGapDeg) std::cout << "Phase gap: " << *st.phaseGapDeg << " deg\n";
    if (st.gti) std::cout << "GTI: " << *st.gti << "\n";
    std::cout << "Confidence: " << st.confidence << "  Samples confirmed: " << st.samplesConfirmed << "\n";

    if (eta.eta.closing()) {
        std::cout << "ETA: " << *eta.eta.etaDays << " days";
        if (eta.eta.etaDate) std::cout << " (" << *eta.eta.etaDate << ")";
        std::cout << "\n";
        if (eta.eta.ci68) std::cout << "  68% band: [" << eta.eta.ci68->first << ", " << eta.eta.ci68->second << "]\n";
        if (eta.eta.ci95) std::cout << "  95% band: [" << eta.eta.ci95->first << ", " << eta.eta.ci95->second << "]\n";
    } else {
        std::cout << "ETA: none (" << eta.eta.message << ")\n";
    }
    if (eta.slopeRadPerDay) std::cout << "Slope: " << *eta.slopeRadPerDay << " rad/day\n";
    for (const auto& n : eta.eta.notes) std::cout << "  note: " << n << "\n";
    if (eta.stability) {
        std::cout << "Stability: " << eta.stability->assessment
                  << " (IQR " << eta.stability->bandIqrDays << " days, n=" << eta.stability->nPoints << ")\n";
        if (eta.stability->bootstrap) {
            std::cout << "  bootstrap IQR: median " << eta.stability->bootstrap->iqrMedianDays
                      << " / 95th pct " << eta.stability->bootstrap->iqr95Days << " days\n";
        }
        if (eta.stability->placebo) {
            std::cout << "  placebo ETA: median " << eta.stability->placebo->medianDays
                      << " days, IQR " << eta.stability->placebo->iqrDays << " days\n";
        }
    }
    if (!st.reason.empty()) std::cout << "Reason: " << st.reason << "\n";
    std::cout << "========================================\n";
}

bool ReportGenerator::saveToFile(const std::string& path, const StatusRecord& st, const EtaRecord& eta) {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs) {
        LOG_ERROR("Failed to write report: " + path);
        return false;
    }
    json j;
    j["status"] = statusToJson(st);
    j["eta"] = etaToJson(eta);
    ofs << j.dump(2);
    return static_cast<bool>(ofs);
}
