#pragma once

#include <Eigen/Dense>
#include <pinocchio/multibody/model.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hpp"
#include "dynamics_model/robot_dynamics.hpp"
#include "lyapunov/lyapunov_certificate.hpp"
#include "trajectory_planner/trajectory_setpoint.hpp"
#include "whole_body_controller/task_space_error.hpp"

// 틱 QP 실패: 안전 정지 이벤트, 대체 토크 없음
class QpSolveError : public std::runtime_error {
public:
    explicit QpSolveError(const std::string& what) : std::runtime_error(what) {}
};

struct ClfQpSolution {
    Eigen::VectorXd tau;                     // na
    Eigen::VectorXd vd;                      // nv
    std::vector<Eigen::Vector3d> forces;     // 접촉발 순서
    std::vector<int> contact_feet;
    double delta = 0.0;

    // 진단
    double V = 0.0;
    double Vdot = 0.0;
    double gamma = 0.0;
    double tracking_error = 0.0;             // ||x_tilde||
    long long solve_us = 0;
    bool deadline_missed = false;            // solve 시간 > CONTROL_DT
};

// ============================================================
// CLF-QP 역동역학 전신 제어기
//
//   minimize   ||J*vd + Jdv - xdd_nom||^2 + w * 2eta'PGJ*vd
//   subject to V_dot <= -gamma*V + delta,  delta <= 0
//              M*vd + Cv + tau_g = S'*tau + sum(J_c' f)
//              f in friction pyramids                 (접촉발 있을 때)
//              J_c*vd + Jdv_c = -k_d*J_c*v            (접촉발 있을 때)
//
// 매 틱 독립적인 QP, 틱 사이에 유지되는 것은 인증서와 모델뿐
// ============================================================

class ClfQpController {
public:
    // body_frame: 부유 기저 프레임, foot_frames: 발 점 프레임 (setpoint 발 순서)
    // 인증서 생성 실패 시 CertificateError, 프레임 없으면 std::invalid_argument
    ClfQpController(const pinocchio::Model& model,
                    const std::string& body_frame,
                    const std::vector<std::string>& foot_frames,
                    double q_weight = CLF_Q_WEIGHT,
                    double r_weight = CLF_R_WEIGHT);

    // 한 틱 계산, QP 실패 시 QpSolveError
    ClfQpSolution update(const RobotState& state, const TrajectorySetpoint& setpoint);

    // 현재 상태의 태스크 공간 오차만 계산 (진단 / 테스트용)
    TaskSpaceError computeTaskError(const RobotState& state, const TrajectorySetpoint& setpoint);

    // 음수 mu / kd / 토크 한계는 std::invalid_argument
    void setFriction(double mu);
    void setTrackingWeight(double w) { w_tracking_ = w; }
    void setVdotWeight(double w) { w_vdot_ = w; }
    void setNoSlipDamping(double kd);
    void setTorqueLimits(const Eigen::VectorXd& tau_max);

    // 스윙발 num_swing 개일 때의 인증서
    const LyapunovCertificate& getCertificate(int num_swing) const;

    int numFeet()      const { return static_cast<int>(foot_ids_.size()); }
    int numActuators() const { return dynamics_.na(); }
    int numVelocities() const { return dynamics_.nv(); }

private:
    RobotDynamics         dynamics_;
    TaskSpaceErrorBuilder task_builder_;

    int body_id_;
    std::vector<int> foot_ids_;

    // 인덱스 = 스윙발 수 (0..N), 생성자에서 한 번 계산
    std::vector<LyapunovCertificate> certificates_;

    double mu_              = FRICTION_MU;
    double w_tracking_      = TRACKING_WEIGHT;
    double w_vdot_          = VDOT_WEIGHT;
    double no_slip_damping_ = NO_SLIP_DAMPING;
    Eigen::VectorXd tau_max_;   // 비어 있으면 토크 한계 없음
};
