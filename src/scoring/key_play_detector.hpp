#pragma once

#include "common/models.hpp"

namespace scorebook {

// A play is key when the home win probability moves by at least threshold.
bool isKeyPlay(const PlayEvent &event, double wpBefore, double wpAfter, double threshold);

} // namespace scorebook
