#pragma once
#include <Eigen/Dense>
#include "config.hpp"

// 한 발의 lift-and-place 궤적
// XY: Cycloid (displacement = 0 이면 순수 수직), Z: 5차 Bezier
// 시간 t 에서 위치 + 속도 + 가속도를 해석적으로 계산
// swing_height 는 Bezier 제어점 높이 (최고점 = 0.625 * swing_height, 중간 시각)

struct SwingSample {
    Eigen::Vector3d pos;
    Eigen::Vector3d vel;
    Eigen::Vector3d acc;
};

class SwingTrajectory {
public:
    SwingTrajectory(const Eigen::Vector3d& start_pos,
                    double start_time,
                    double swing_time   = SWING_TIME,
                    double swing_height = SWING_BEZIER_HEIGHT,
                    const Eigen::Vector2d& displacement = Eigen::Vector2d::Zero());

    SwingSample sample(double t) const;

    // start_time <= t < start_time + swing_time
    bool isSwinging(double t) const;

    double endTime() const { return start_time_ + swing_time_; }
    Eigen::Vector3d landingPos() const;

private:
    Eigen::Vector3d start_pos_;
    Eigen::Vector2d displacement_;
    double start_time_, swing_time_, swing_height_;

    double bezierZ(double s) const;
    double bezierZ_ds(double s) const;
    double bezierZ_dds(double s) const;
};
