#pragma once
#include <cstdint>
#include <string>

constexpr int64_t kSecondsPerDay = 86400;
constexpr int64_t kSecondsPerHour = 3600;

int64_t nowUtc();

// "2025-01-31T12:00:00Z" / "2025-01-31T12:00:00+00:00" / "2025-01-31 12:00:00"; -1 if unparseable
// 精度为整秒, 小数秒被截断: 同一秒内的两个样本在历史中视为重复时间戳
int64_t parseIsoUtc(const std::string& text);

// 超出 gmtime 范围时返回空串
std::string formatIsoUtc(int64_t epochSeconds);
std::string formatDateUtc(int64_t epochSeconds);
