#pragma once
#include <Eigen/Dense>
#include <cmath>

namespace quadclf {

// Roll-Pitch-Yaw, R = Rz(yaw) * Ry(pitch) * Rx(roll)
inline Eigen::Vector3d rpyFromRotation(const Eigen::Matrix3d& R)
{
    double roll  = std::atan2(R(2, 1), R(2, 2));
    double pitch = std::atan2(-R(2, 0), std::sqrt(R(2, 1) * R(2, 1) + R(2, 2) * R(2, 2)));
    double yaw   = std::atan2(R(1, 0), R(0, 0));
    return Eigen::Vector3d(roll, pitch, yaw);
}

inline Eigen::Matrix3d rotationFromRpy(const Eigen::Vector3d& rpy)
{
    return (Eigen::AngleAxisd(rpy(2), Eigen::Vector3d::UnitZ()) *
            Eigen::AngleAxisd(rpy(1), Eigen::Vector3d::UnitY()) *
            Eigen::AngleAxisd(rpy(0), Eigen::Vector3d::UnitX())).toRotationMatrix();
}

// ω(world) = E(rpy) * d(rpy)/dt
//   E = [ cy*cp  -sy  0 ]
//       [ sy*cp   cy  0 ]
//       [ -sp     0   1 ]
inline Eigen::Matrix3d rpyRateToAngularVelocity(const Eigen::Vector3d& rpy)
{
    const double cp = std::cos(rpy(1)), sp = std::sin(rpy(1));
    const double cy = std::cos(rpy(2)), sy = std::sin(rpy(2));

    Eigen::Matrix3d E;
    E << cy * cp, -sy, 0.0,
         sy * cp,  cy, 0.0,
            -sp,  0.0, 1.0;
    return E;
}

// (-pi, pi] 로 정규화
inline double wrapAngle(double a)
{
    a = std::fmod(a + M_PI, 2.0 * M_PI);
    if (a <= 0.0) a += 2.0 * M_PI;
    return a - M_PI;
}

} // namespace quadclf
