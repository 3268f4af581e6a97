#include "constraints/torque_limits.hpp"

TorqueLimits::TorqueLimits(const QpLayout& layout, const Eigen::VectorXd& tau_max)
    : tau_max_(tau_max)
{
    A_.setZero(layout.na, layout.numVars());
    A_.block(0, layout.tau(), layout.na, layout.na).setIdentity();
}
