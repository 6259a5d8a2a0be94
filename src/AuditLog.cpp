#include "AuditLog.h"
#include "Logger.h"
#include "TimeUtil.h"
#include <nlohmann/json.hpp>
#include <fstream>

using json = nlohmann::json;

template <typename T>
static json optionalToJson(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

AuditLog::AuditLog(const std::string& path, size_t keepInMemory) : path_(path), keep_(keepInMemory) {}

std::string AuditLog::toJsonLine(const AuditEntry& e) {
    json j;
    j["as_of_utc"] = formatIsoUtc(e.asOfUtc);
    j["from"] = e.fromState;
    j["to"] = e.toState;
    j["alert_emitted"] = e.alertEmitted;
    j["phase_gap_deg"] = optionalToJson(e.phaseGapDeg);
    j["slope_rad_per_day"] = optionalToJson(e.slopeRadPerDay);
    j["clarity"] = optionalToJson(e.clarity);
    j["data_age_hours"] = optionalToJson(e.dataAgeHours);
    j["window_size"] = e.windowSize;
    j["samples_confirmed"] = e.samplesConfirmed;
    j["confidence"] = e.confidence;
    j["reason"] = e.reason;
    j["predicted_utc"] = e.predictedUtc ? json(formatIsoUtc(*e.predictedUtc)) : json(nullptr);
    j["prediction_error_hours"] = optionalToJson(e.predictionErrorHours);
    j["verification_status"] = e.verificationStatus.empty() ? json(nullptr) : json(e.verificationStatus);
    return j.dump();
}

void AuditLog::record(const AuditEntry& e) {
    std::lock_guard<std::mutex> lk(mu_);
    entries_.push_back(e);
    while (entries_.size() > keep_) entries_.pop_front();

    if (path_.empty()) return;
    std::ofstream ofs(path_, std::ios::app);
    if (!ofs) {
        LOG_ERROR("Failed to open audit file: " + path_);
        return;
    }
    ofs << toJsonLine(e) << "\n";
}

std::vector<AuditEntry> AuditLog::recent() const {
    std::lock_guard<std::mutex> lk(mu_);
    return std::vector<AuditEntry>(entries_.begin(), entries_.end());
}
