#include "vigil/infra/Clock.hpp"

namespace vigil::infra {

namespace {

struct WallAnchor {
    double   wall_s;
    MonoTime mono;

    WallAnchor()
        : wall_s(std::chrono::duration<double>(
              std::chrono::system_clock::now().time_since_epoch()).count()),
          mono(MonoClock::now()) {}
};

const WallAnchor& anchor() {
    static const WallAnchor a;
    return a;
}

} // namespace

double wall_seconds() noexcept {
    const WallAnchor& a = anchor();
    return a.wall_s + Seconds(MonoClock::now() - a.mono).count();
}

} // namespace vigil::infra
