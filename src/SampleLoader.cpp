#include "SampleLoader.h"
#include "Logger.h"
#include "TimeUtil.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

std::vector<Sample> SampleLoader::loadFromJsonString(const std::string& jsonStr) {
    std::vector<Sample> out;
    json j;
    try {
        j = json::parse(jsonStr);
    } catch (const json::parse_error& e) {
        LOG_WARN(std::string("history JSON parse error: ") + e.what());
        return out;
    }

    const json* arr = &j;
    if (j.is_object()) {
        if (!j.contains("history")) return out;
        arr = &j["history"];
    }
    if (!arr->is_array()) return out;

    size_t skipped = 0;
    for (auto& el : *arr) {
        if (!el.is_object() || !el.contains("as_of_utc") || !el.contains("phase_deg")) {
            skipped++;
            continue;
        }
        const auto& ts = el["as_of_utc"];
        const auto& val = el["phase_deg"];
        Sample s;
        if (ts.is_string()) s.asOfUtc = parseIsoUtc(ts.get<std::string>());
        else if (ts.is_number()) s.asOfUtc = ts.get<int64_t>();
        else s.asOfUtc = -1;
        if (s.asOfUtc <= 0 || !val.is_number()) {
            skipped++;
            continue;
        }
        s.phaseDeg = val.get<double>();
        out.push_back(s);
    }
    if (skipped > 0) {
        LOG_WARN("history: skipped " + std::to_string(skipped) + " malformed entries");
    }
    std::stable_sort(out.begin(), out.end(), [](const Sample& a, const Sample& b) { return a.asOfUtc < b.asOfUtc; });
    return out;
}

std::vector<Sample> SampleLoader::loadFromFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        LOG_WARN("Failed to open history file: " + path);
        return {};
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return loadFromJsonString(content);
}

std::string SampleLoader::toJsonString(const std::vector<Sample>& samples) {
    json hist = json::array();
    for (const auto& s : samples) {
        hist.push_back({{"as_of_utc", formatIsoUtc(s.asOfUtc)}, {"phase_deg", s.phaseDeg}});
    }
    json root;
    root["history"] = hist;
    return root.dump();
}
