#pragma once

#include <Eigen/Dense>
#include <vector>
#include "config.hpp"
#include "dynamics_model/robot_dynamics.hpp"
#include "trajectory_planner/trajectory_setpoint.hpp"

// 스택된 태스크 공간 상태 / 오차 (틱마다 재계산)
//
//   x = [rpy_body; p_body; p_swing_0; ...; p_swing_{ns-1}]   (6 + 3*ns)
//   xd 의 각속도 채널은 world 각속도 (자코비안 각속도 행과 동일 규약)
//
//   J   = [J_body; J_swing_0; ...]        (6 + 3*ns) x nv
//   Jdv = [Jdv_body; Jdv_swing_0; ...]
//   J_c = [J_contact_0; ...]               3*nc x nv
struct TaskSpaceError {
    std::vector<int> swing_feet;
    std::vector<int> contact_feet;

    Eigen::VectorXd x, xd;
    Eigen::VectorXd x_nom, xd_nom, xdd_nom;
    Eigen::VectorXd x_tilde, xd_tilde;

    Eigen::MatrixXd J;
    Eigen::VectorXd Jdv;

    Eigen::MatrixXd J_c;
    Eigen::VectorXd Jdv_c;

    int taskDim()     const { return static_cast<int>(x.size()); }
    int numSwing()    const { return static_cast<int>(swing_feet.size()); }
    int numContact()  const { return static_cast<int>(contact_feet.size()); }

    // eta = [x_tilde; xd_tilde]
    Eigen::VectorXd eta() const;
};

class TaskSpaceErrorBuilder {
public:
    TaskSpaceErrorBuilder() = default;

    // body: 몸통 6행 기구학, feet: 발 3행 기구학 (발 순서 = setpoint 순서)
    // 발 개수가 다르면 std::invalid_argument
    TaskSpaceError build(const FrameKinematics& body,
                         const std::vector<FrameKinematics>& feet,
                         const Eigen::VectorXd& v,
                         const TrajectorySetpoint& setpoint) const;
};
