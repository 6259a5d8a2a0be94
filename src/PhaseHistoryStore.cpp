#include "PhaseHistoryStore.h"
#include "Logger.h"
#include "SampleLoader.h"
#include <algorithm>
#include <cmath>
#include <fstream>

static bool earlier(const Sample& a, const Sample& b) {
    return a.asOfUtc < b.asOfUtc;
}

PhaseHistoryStore::PhaseHistoryStore(size_t maxSamples)
    : maxSamples_(std::max<size_t>(1, maxSamples)),
      samples_(std::make_shared<const std::vector<Sample>>()) {}

bool PhaseHistoryStore::isMalformed(const Sample& s) {
    return s.asOfUtc <= 0 || !std::isfinite(s.phaseDeg) || std::fabs(s.phaseDeg) > 360.0;
}

AppendStatus PhaseHistoryStore::insertLocked(std::vector<Sample>& v, const Sample& s) {
    if (isMalformed(s)) return AppendStatus::MALFORMED_SAMPLE;

    auto pos = std::lower_bound(v.begin(), v.end(), s, earlier);
    if (pos != v.end() && pos->asOfUtc == s.asOfUtc) {
        return AppendStatus::DUPLICATE_TIMESTAMP;
    }
    v.insert(pos, s);
    return AppendStatus::OK;
}

size_t PhaseHistoryStore::evictLocked(std::vector<Sample>& v) {
    if (v.size() <= maxSamples_) return 0;
    size_t excess = v.size() - maxSamples_;
    v.erase(v.begin(), v.begin() + excess);
    return excess;
}

AppendStatus PhaseHistoryStore::append(const Sample& s) {
    std::lock_guard<std::mutex> lk(mu_);
    auto next = std::make_shared<std::vector<Sample>>(*samples_);
    AppendStatus st = insertLocked(*next, s);
    if (st == AppendStatus::MALFORMED_SAMPLE) {
        LOG_WARN("rejected malformed sample ts=" + std::to_string(s.asOfUtc) + " phase=" + std::to_string(s.phaseDeg));
        return st;
    }
    if (st == AppendStatus::DUPLICATE_TIMESTAMP) {
        LOG_WARN("rejected duplicate timestamp ts=" + std::to_string(s.asOfUtc));
        return st;
    }
    evictLocked(*next);
    samples_ = std::move(next);
    return st;
}

AppendSummary PhaseHistoryStore::appendAll(const std::vector<Sample>& samples) {
    AppendSummary sum;
    std::lock_guard<std::mutex> lk(mu_);
    auto next = std::make_shared<std::vector<Sample>>(*samples_);
    next->reserve(next->size() + samples.size());
    for (const auto& s : samples) {
        switch (insertLocked(*next, s)) {
            case AppendStatus::OK: sum.accepted++; break;
            case AppendStatus::DUPLICATE_TIMESTAMP: sum.duplicates++; break;
            case AppendStatus::MALFORMED_SAMPLE: sum.malformed++; break;
        }
    }
    sum.evicted = evictLocked(*next);
    samples_ = std::move(next);

    if (sum.duplicates > 0 || sum.malformed > 0) {
        LOG_WARN("appendAll: rejected " + std::to_string(sum.duplicates) + " duplicate and " +
                 std::to_string(sum.malformed) + " malformed samples");
    }
    return sum;
}

HistorySnapshot PhaseHistoryStore::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (!available_) throw StoreUnavailable("history store unavailable: " + unavailableReason_);
    return samples_;
}

SampleRange PhaseHistoryStore::query(int64_t fromUtc, int64_t toUtc) const {
    HistorySnapshot snap = snapshot();
    Sample lo{fromUtc, 0.0}, hi{toUtc, 0.0};
    size_t first = std::lower_bound(snap->begin(), snap->end(), lo, earlier) - snap->begin();
    size_t last = std::lower_bound(snap->begin(), snap->end(), hi, earlier) - snap->begin();
    if (last < first) last = first;
    return SampleRange(std::move(snap), first, last);
}

std::optional<Sample> PhaseHistoryStore::latest() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (samples_->empty()) return std::nullopt;
    return samples_->back();
}

size_t PhaseHistoryStore::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return samples_->size();
}

void PhaseHistoryStore::markUnavailable(const std::string& reason) {
    std::lock_guard<std::mutex> lk(mu_);
    available_ = false;
    unavailableReason_ = reason;
}

void PhaseHistoryStore::markAvailable() {
    std::lock_guard<std::mutex> lk(mu_);
    available_ = true;
    unavailableReason_.clear();
}

bool PhaseHistoryStore::loadFromFile(const std::string& path) {
    std::ifstream existing(path);
    if (!existing) {
        LOG_INFO("No history file at " + path + ", starting empty");
        return false;
    }
    existing.close();

    SampleLoader loader;
    auto loaded = loader.loadFromFile(path);
    AppendSummary sum = appendAll(loaded);
    LOG_INFO("Loaded " + std::to_string(sum.accepted) + " samples from " + path);
    return true;
}

bool PhaseHistoryStore::saveToFile(const std::string& path) const {
    HistorySnapshot snap;
    {
        std::lock_guard<std::mutex> lk(mu_);
        snap = samples_;
    }
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs) {
        LOG_ERROR("Failed to write history file: " + path);
        return false;
    }
    ofs << SampleLoader::toJsonString(*snap);
    return static_cast<bool>(ofs);
}
