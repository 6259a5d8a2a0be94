#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct Sample {
    int64_t asOfUtc = 0;    // epoch 秒, UTC
    double phaseDeg = 0.0;
};

enum class AppendStatus { OK, DUPLICATE_TIMESTAMP, MALFORMED_SAMPLE };

struct AppendSummary {
    size_t accepted = 0;
    size_t duplicates = 0;
    size_t malformed = 0;
    size_t evicted = 0;
};

class StoreUnavailable : public std::runtime_error {
public:
    explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {}
};

using HistorySnapshot = std::shared_ptr<const std::vector<Sample>>;

// 快照上的半开区间 [from, to), 可重复遍历
class SampleRange {
public:
    using const_iterator = std::vector<Sample>::const_iterator;

    SampleRange(HistorySnapshot snap, size_t first, size_t last)
        : snap_(std::move(snap)), first_(first), last_(last) {}

    const_iterator begin() const { return snap_->begin() + first_; }
    const_iterator end() const { return snap_->begin() + last_; }
    size_t size() const { return last_ - first_; }
    bool empty() const { return first_ == last_; }

private:
    HistorySnapshot snap_;
    size_t first_;
    size_t last_;
};

class PhaseHistoryStore {
public:
    explicit PhaseHistoryStore(size_t maxSamples = 5000);

    // 重复时间戳 (整秒比较): 拒绝, 保留已有样本. 迟到样本按时间插入
    AppendStatus append(const Sample& s);
    AppendSummary appendAll(const std::vector<Sample>& samples);

    // 不可变快照; 之后的追加/淘汰不影响已取出的快照
    HistorySnapshot snapshot() const;
    SampleRange query(int64_t fromUtc, int64_t toUtc) const;
    std::optional<Sample> latest() const;

    size_t size() const;
    size_t maxSamples() const { return maxSamples_; }

    void markUnavailable(const std::string& reason);
    void markAvailable();

    bool loadFromFile(const std::string& path);
    bool saveToFile(const std::string& path) const;

    static bool isMalformed(const Sample& s);

private:
    AppendStatus insertLocked(std::vector<Sample>& v, const Sample& s);
    size_t evictLocked(std::vector<Sample>& v);

    size_t maxSamples_;
    HistorySnapshot samples_;
    bool available_ = true;
    std::string unavailableReason_;
    mutable std::mutex mu_;
};
