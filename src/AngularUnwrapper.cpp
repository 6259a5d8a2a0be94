#include "AngularUnwrapper.h"
#include <cmath>

double AngularUnwrapper::wrapRadians(double rad) {
    return rad - 2.0 * kPi * std::ceil((rad - kPi) / (2.0 * kPi));
}

double AngularUnwrapper::wrapDegrees(double deg) {
    return deg - 360.0 * std::ceil((deg - 180.0) / 360.0);
}

std::vector<double> AngularUnwrapper::unwrapRadians(const std::vector<double>& radians) const {
    std::vector<double> out;
    if (radians.empty()) return out;
    out.reserve(radians.size());
    out.push_back(radians.front());
    for (size_t i = 1; i < radians.size(); ++i) {
        double step = wrapRadians(radians[i] - radians[i - 1]);
        out.push_back(out.back() + step);
    }
    return out;
}

std::vector<double> AngularUnwrapper::unwrapDegrees(const std::vector<double>& degrees) const {
    std::vector<double> rad;
    rad.reserve(degrees.size());
    for (double d : degrees) rad.push_back(degToRad(d));
    return unwrapRadians(rad);
}
