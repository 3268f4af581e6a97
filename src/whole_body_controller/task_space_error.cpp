#include "whole_body_controller/task_space_error.hpp"
#include "utils/math_utils.hpp"
#include <stdexcept>

Eigen::VectorXd TaskSpaceError::eta() const
{
    Eigen::VectorXd e(2 * taskDim());
    e << x_tilde, xd_tilde;
    return e;
}

TaskSpaceError TaskSpaceErrorBuilder::build(const FrameKinematics& body,
                                            const std::vector<FrameKinematics>& feet,
                                            const Eigen::VectorXd& v,
                                            const TrajectorySetpoint& setpoint) const
{
    const int n_feet = static_cast<int>(feet.size());
    if (setpoint.numFeet() != n_feet ||
        static_cast<int>(setpoint.p_feet.size())   != n_feet ||
        static_cast<int>(setpoint.pd_feet.size())  != n_feet ||
        static_cast<int>(setpoint.pdd_feet.size()) != n_feet)
        throw std::invalid_argument("TaskSpaceErrorBuilder: setpoint foot count mismatch");

    TaskSpaceError e;

    // ── 1. 스윙 / 접촉 분할 ──
    for (int i = 0; i < n_feet; ++i) {
        if (setpoint.contact[i]) e.contact_feet.push_back(i);
        else                     e.swing_feet.push_back(i);
    }
    const int ns = e.numSwing();
    const int nc = e.numContact();
    const int n  = BODY_TASK_DIM + FOOT_TASK_DIM * ns;
    const int nv = static_cast<int>(v.size());

    e.x.resize(n);     e.xd.resize(n);
    e.x_nom.resize(n); e.xd_nom.resize(n); e.xdd_nom.resize(n);
    e.J.resize(n, nv); e.Jdv.resize(n);

    // ── 2. 몸통 [rpy; p] ──
    // 각속도 <-> rpy 변화율 변환은 현재 자세의 E(rpy) 하나만 사용
    Eigen::Vector3d rpy = quadclf::rpyFromRotation(body.R);
    Eigen::Matrix3d E   = quadclf::rpyRateToAngularVelocity(rpy);
    Eigen::VectorXd body_vel = body.J * v;  // [omega; pd]

    e.x.head<3>()         = rpy;
    e.x.segment<3>(3)     = body.p;
    e.xd.head<6>()        = body_vel;

    e.x_nom.head<3>()      = setpoint.rpy_body;
    e.x_nom.segment<3>(3)  = setpoint.p_body;
    e.xd_nom.head<3>()     = E * setpoint.rpy_dot_body;
    e.xd_nom.segment<3>(3) = setpoint.pd_body;
    // Edot * rpy_dot 항 없음: E 는 틱 동안 상수
    e.xdd_nom.head<3>()    = E * setpoint.rpy_ddot_body;
    e.xdd_nom.segment<3>(3) = setpoint.pdd_body;

    e.J.topRows(BODY_TASK_DIM) = body.J;
    e.Jdv.head(BODY_TASK_DIM)  = body.Jdv;

    // ── 3. 스윙발 위치 ──
    for (int k = 0; k < ns; ++k) {
        const int i   = e.swing_feet[k];
        const int row = BODY_TASK_DIM + FOOT_TASK_DIM * k;

        e.x.segment<3>(row)       = feet[i].p;
        e.xd.segment<3>(row)      = feet[i].J * v;
        e.x_nom.segment<3>(row)   = setpoint.p_feet[i];
        e.xd_nom.segment<3>(row)  = setpoint.pd_feet[i];
        e.xdd_nom.segment<3>(row) = setpoint.pdd_feet[i];

        e.J.middleRows(row, FOOT_TASK_DIM) = feet[i].J;
        e.Jdv.segment(row, FOOT_TASK_DIM)  = feet[i].Jdv;
    }

    // ── 4. 접촉발 자코비안 (no-slip / 동역학 구속용) ──
    e.J_c.resize(3 * nc, nv);
    e.Jdv_c.resize(3 * nc);
    for (int k = 0; k < nc; ++k) {
        const int i = e.contact_feet[k];
        e.J_c.middleRows(3 * k, 3) = feet[i].J;
        e.Jdv_c.segment(3 * k, 3)  = feet[i].Jdv;
    }

    // ── 5. 오차 ──
    e.x_tilde  = e.x - e.x_nom;
    e.xd_tilde = e.xd - e.xd_nom;
    for (int j = 0; j < 3; ++j)
        e.x_tilde(j) = quadclf::wrapAngle(e.x_tilde(j));

    return e;
}
