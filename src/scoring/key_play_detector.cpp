#include "scoring/key_play_detector.hpp"

#include <cmath>

namespace scorebook {

bool isKeyPlay(const PlayEvent & /*event*/, double wpBefore, double wpAfter, double threshold)
{
    // Tolerate binary rounding so a swing of exactly the threshold still counts.
    return std::fabs(wpAfter - wpBefore) + 1e-9 >= threshold;
}

} // namespace scorebook
