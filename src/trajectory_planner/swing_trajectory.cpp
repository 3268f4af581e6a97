#include "trajectory_planner/swing_trajectory.hpp"
#include <cmath>
#include <algorithm>

SwingTrajectory::SwingTrajectory(const Eigen::Vector3d& start_pos,
                                 double start_time,
                                 double swing_time,
                                 double swing_height,
                                 const Eigen::Vector2d& displacement)
    : start_pos_(start_pos), displacement_(displacement),
      start_time_(start_time), swing_time_(swing_time),
      swing_height_(swing_height)
{}

bool SwingTrajectory::isSwinging(double t) const
{
    return t >= start_time_ && t < start_time_ + swing_time_;
}

Eigen::Vector3d SwingTrajectory::landingPos() const
{
    return Eigen::Vector3d(start_pos_.x() + displacement_.x(),
                           start_pos_.y() + displacement_.y(),
                           start_pos_.z());
}

// ── 5차 Bezier Z ──
// 제어점: [gz, gz, gz+h, gz+h, gz, gz]
// B(s) = gz + h * 10 s^2 (1-s)^2
double SwingTrajectory::bezierZ(double s) const
{
    double u = 1.0 - s;
    return start_pos_.z() + swing_height_ * 10.0 * s * s * u * u;
}

// dB/ds = h * 20 s(1-s)(1-2s)
double SwingTrajectory::bezierZ_ds(double s) const
{
    return swing_height_ * 20.0 * s * (1.0 - s) * (1.0 - 2.0 * s);
}

// d²B/ds² = h * 20 (1 - 6s + 6s^2)
double SwingTrajectory::bezierZ_dds(double s) const
{
    return swing_height_ * 20.0 * (1.0 - 6.0 * s + 6.0 * s * s);
}

SwingSample SwingTrajectory::sample(double t) const
{
    SwingSample out;

    // 스윙 전/후 → 정지
    if (t < start_time_) {
        out.pos = start_pos_;
        out.vel.setZero();
        out.acc.setZero();
        return out;
    }
    if (t >= start_time_ + swing_time_) {
        out.pos = landingPos();
        out.vel.setZero();
        out.acc.setZero();
        return out;
    }

    double phase = std::min((t - start_time_) / swing_time_, 1.0);
    double theta = 2.0 * M_PI * phase;
    double ds_dt = 1.0 / swing_time_;

    // ── Cycloid XY ──
    double cycloid     = (theta - std::sin(theta)) / (2.0 * M_PI);
    double cycloid_vel = (1.0 - std::cos(theta)) / swing_time_;
    double cycloid_acc = 2.0 * M_PI * std::sin(theta) / (swing_time_ * swing_time_);

    out.pos = Eigen::Vector3d(start_pos_.x() + displacement_.x() * cycloid,
                              start_pos_.y() + displacement_.y() * cycloid,
                              bezierZ(phase));
    out.vel = Eigen::Vector3d(displacement_.x() * cycloid_vel,
                              displacement_.y() * cycloid_vel,
                              bezierZ_ds(phase) * ds_dt);
    out.acc = Eigen::Vector3d(displacement_.x() * cycloid_acc,
                              displacement_.y() * cycloid_acc,
                              bezierZ_dds(phase) * ds_dt * ds_dt);
    return out;
}
