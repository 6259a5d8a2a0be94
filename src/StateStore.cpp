#include "StateStore.h"
#include "Logger.h"
#include "TimeUtil.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

std::string StateStore::toJsonString(const EventState& st) {
    json j;
    j["is_triggered"] = st.isTriggered;
    j["since"] = formatIsoUtc(st.since);
    j["samples_confirmed"] = st.samplesConfirmed;
    return j.dump();
}

std::optional<EventState> StateStore::fromJsonString(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);
        if (!j.is_object() || !j.contains("is_triggered")) return std::nullopt;
        EventState st;
        st.isTriggered = j["is_triggered"].get<bool>();
        int64_t since = parseIsoUtc(j.value("since", std::string()));
        st.since = since > 0 ? since : 0;
        st.samplesConfirmed = j.value("samples_confirmed", 0);
        return st;
    } catch (const json::exception& e) {
        LOG_WARN(std::string("event state parse error: ") + e.what());
        return std::nullopt;
    }
}

std::optional<EventState> StateStore::load() const {
    std::ifstream ifs(path_);
    if (!ifs) return std::nullopt;
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return fromJsonString(content);
}

bool StateStore::save(const EventState& st) const {
    std::ofstream ofs(path_, std::ios::trunc);
    if (!ofs) {
        LOG_ERROR("Failed to write event state: " + path_);
        return false;
    }
    ofs << toJsonString(st);
    return static_cast<bool>(ofs);
}
