#pragma once

#include <algorithm>

namespace animation {

inline double clamp01(double t) {
    return std::max(0.0, std::min(1.0, t));
}

inline double ease_out_cubic(double t) {
    if (t >= 1.0) return 1.0;
    const double inv = 1.0 - t;
    return 1.0 - inv * inv * inv;
}

inline double lerp(double from, double to, double t) {
    return from + (to - from) * t;
}

} // namespace animation
