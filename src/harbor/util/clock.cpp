#include "harbor/util/clock.hpp"

namespace harbor::util {

std::shared_ptr<Clock> system_clock() {
    static const std::shared_ptr<Clock> clock = std::make_shared<SystemClock>(); // process-wide
    return clock;
}

} // namespace harbor::util
