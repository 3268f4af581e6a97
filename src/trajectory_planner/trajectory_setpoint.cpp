#include "trajectory_planner/trajectory_setpoint.hpp"
#include <algorithm>

int TrajectorySetpoint::numContact() const
{
    return static_cast<int>(std::count(contact.begin(), contact.end(), true));
}

TrajectorySetpoint TrajectorySetpoint::standing(const Eigen::Vector3d& rpy_body,
                                                const Eigen::Vector3d& p_body,
                                                const std::vector<Eigen::Vector3d>& p_feet)
{
    TrajectorySetpoint sp;
    sp.rpy_body = rpy_body;
    sp.p_body   = p_body;

    const size_t n = p_feet.size();
    sp.p_feet   = p_feet;
    sp.pd_feet.assign(n, Eigen::Vector3d::Zero());
    sp.pdd_feet.assign(n, Eigen::Vector3d::Zero());
    sp.contact.assign(n, true);
    return sp;
}
