#pragma once
#include "EventTrigger.h"
#include <optional>
#include <string>

// EventState 的持久化, 启动时恢复
class StateStore {
public:
    explicit StateStore(const std::string& path) : path_(path) {}

    std::optional<EventState> load() const;
    bool save(const EventState& st) const;

    static std::string toJsonString(const EventState& st);
    static std::optional<EventState> fromJsonString(const std::string& jsonStr);

private:
    std::string path_;
};
