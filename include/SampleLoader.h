// 相位历史加载与序列化
#pragma once
#include "PhaseHistoryStore.h"
#include <string>
#include <vector>

class SampleLoader {
public:
    // {"history":[{"as_of_utc": "...Z", "phase_deg": x}, ...]} 或直接数组
    std::vector<Sample> loadFromJsonString(const std::string& jsonStr);
    std::vector<Sample> loadFromFile(const std::string& path);

    static std::string toJsonString(const std::vector<Sample>& samples);
};
