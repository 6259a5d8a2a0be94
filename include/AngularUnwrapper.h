#pragma once
#include <vector>

constexpr double kPi = 3.14159265358979323846;

inline double degToRad(double deg) { return deg * kPi / 180.0; }
inline double radToDeg(double rad) { return rad * 180.0 / kPi; }

// 有界角度序列 -> 连续弧度序列. 必须按时间递增顺序输入, 不做断档检测
class AngularUnwrapper {
public:
    std::vector<double> unwrapDegrees(const std::vector<double>& degrees) const;
    std::vector<double> unwrapRadians(const std::vector<double>& radians) const;

    // 映射到 (-180, 180]
    static double wrapDegrees(double deg);
    // 映射到 (-π, π]
    static double wrapRadians(double rad);
};
