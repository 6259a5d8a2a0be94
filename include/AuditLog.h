#pragma once
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// 状态变化的审计记录, 足以复现当时的判定
struct AuditEntry {
    int64_t asOfUtc = 0;
    std::string fromState;
    std::string toState;
    bool alertEmitted = false;
    std::optional<double> phaseGapDeg;
    std::optional<double> slopeRadPerDay;
    std::optional<double> clarity;
    std::optional<double> dataAgeHours;
    size_t windowSize = 0;
    int samplesConfirmed = 0;
    double confidence = 0.0;
    std::string reason;
    // 仅在进入 CLOSING 时填写
    std::optional<int64_t> predictedUtc;
    std::optional<double> predictionErrorHours;
    std::string verificationStatus;
};

class AuditLog {
public:
    explicit AuditLog(const std::string& path = "", size_t keepInMemory = 200);

    void record(const AuditEntry& e);
    std::vector<AuditEntry> recent() const;

    static std::string toJsonLine(const AuditEntry& e);

private:
    std::string path_;
    size_t keep_;
    std::deque<AuditEntry> entries_;
    mutable std::mutex mu_;
};
