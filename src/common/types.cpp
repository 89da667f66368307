#include "common/types.hpp"

#include <cmath>
#include <stdexcept>

namespace common {

// ============================================
// Report Implementation
// ============================================

Report::Report()
    : position_(Eigen::Vector3d::Zero()),
      time_(0.0),
      id_(-1)
{
}

Report::Report(double x, double y, double z, double time, int id)
    : Report(Eigen::Vector3d(x, y, z), time, id)
{
}

Report::Report(const Eigen::Vector3d& position, double time, int id)
    : position_(position),
      time_(time),
      id_(id)
{
    if (!position_.allFinite()) {
        throw std::invalid_argument("Report position must be finite");
    }

    if (!std::isfinite(time_)) {
        throw std::invalid_argument("Report time must be finite");
    }
}

bool Report::is_valid() const {
    return position_.allFinite() && std::isfinite(time_);
}

} // namespace common
