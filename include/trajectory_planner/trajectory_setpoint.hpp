#pragma once
#include <Eigen/Dense>
#include <vector>
#include "config.hpp"

// 매 틱 외부에서 주어지는 목표 궤적 (읽기 전용)
//   몸통: rpy / p 의 위치, 속도, 가속도
//   발:   위치, 속도, 가속도 + 접촉 플래그
struct TrajectorySetpoint {
    Eigen::Vector3d rpy_body       = Eigen::Vector3d::Zero();
    Eigen::Vector3d rpy_dot_body   = Eigen::Vector3d::Zero();
    Eigen::Vector3d rpy_ddot_body  = Eigen::Vector3d::Zero();

    Eigen::Vector3d p_body         = Eigen::Vector3d::Zero();
    Eigen::Vector3d pd_body        = Eigen::Vector3d::Zero();
    Eigen::Vector3d pdd_body       = Eigen::Vector3d::Zero();

    std::vector<Eigen::Vector3d> p_feet;
    std::vector<Eigen::Vector3d> pd_feet;
    std::vector<Eigen::Vector3d> pdd_feet;
    std::vector<bool>            contact;

    int numFeet() const { return static_cast<int>(contact.size()); }
    int numContact() const;

    // 정지 자세: 속도/가속도 0, 모든 발 접촉
    static TrajectorySetpoint standing(const Eigen::Vector3d& rpy_body,
                                       const Eigen::Vector3d& p_body,
                                       const std::vector<Eigen::Vector3d>& p_feet);
};
