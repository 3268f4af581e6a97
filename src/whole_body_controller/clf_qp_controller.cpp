#include "whole_body_controller/clf_qp_controller.hpp"
#include "whole_body_controller/qp_problem.hpp"
#include "constraints/qp_layout.hpp"
#include "constraints/tracking_cost.hpp"
#include "constraints/clf_constraint.hpp"
#include "constraints/dynamics_constraint.hpp"
#include "constraints/friction_pyramid.hpp"
#include "constraints/contact_constraint.hpp"
#include "constraints/torque_limits.hpp"
#include <chrono>
#include <iostream>

ClfQpController::ClfQpController(const pinocchio::Model& model,
                                 const std::string& body_frame,
                                 const std::vector<std::string>& foot_frames,
                                 double q_weight,
                                 double r_weight)
    : dynamics_(model),
      body_id_(dynamics_.getFrameId(body_frame))
{
    if (foot_frames.empty())
        throw std::invalid_argument("ClfQpController: at least one foot frame required");

    for (const auto& name : foot_frames)
        foot_ids_.push_back(dynamics_.getFrameId(name));

    // 태스크 차원 6 + 3*ns 마다 CARE 한 번씩
    certificates_.reserve(foot_ids_.size() + 1);
    for (int ns = 0; ns <= numFeet(); ++ns)
        certificates_.emplace_back(BODY_TASK_DIM + FOOT_TASK_DIM * ns, q_weight, r_weight);
}

void ClfQpController::setFriction(double mu)
{
    if (mu < 0.0)
        throw std::invalid_argument("ClfQpController: friction coefficient must be non-negative");
    mu_ = mu;
}

void ClfQpController::setNoSlipDamping(double kd)
{
    if (kd < 0.0)
        throw std::invalid_argument("ClfQpController: no-slip damping must be non-negative");
    no_slip_damping_ = kd;
}

void ClfQpController::setTorqueLimits(const Eigen::VectorXd& tau_max)
{
    if (tau_max.size() != numActuators() || (tau_max.array() < 0.0).any())
        throw std::invalid_argument("ClfQpController: torque limits must be non-negative, size na");
    tau_max_ = tau_max;
}

const LyapunovCertificate& ClfQpController::getCertificate(int num_swing) const
{
    return certificates_.at(static_cast<size_t>(num_swing));
}

TaskSpaceError ClfQpController::computeTaskError(const RobotState& state,
                                                 const TrajectorySetpoint& setpoint)
{
    if (state.q.size() != dynamics_.nq() || state.v.size() != dynamics_.nv())
        throw std::invalid_argument("ClfQpController: state dimension mismatch");

    dynamics_.updateKinematics(state.q, state.v);

    FrameKinematics body = dynamics_.bodyKinematics(body_id_);
    std::vector<FrameKinematics> feet;
    feet.reserve(foot_ids_.size());
    for (int id : foot_ids_)
        feet.push_back(dynamics_.pointKinematics(id));

    return task_builder_.build(body, feet, state.v, setpoint);
}

ClfQpSolution ClfQpController::update(const RobotState& state, const TrajectorySetpoint& setpoint)
{
    // =======================================================================
    // 1. 동역학 / 태스크 공간 오차
    // =======================================================================
    if (state.q.size() != dynamics_.nq() || state.v.size() != dynamics_.nv())
        throw std::invalid_argument("ClfQpController: state dimension mismatch");

    DynamicsQuantities dyn = dynamics_.computeDynamics(state.q, state.v);
    TaskSpaceError err = computeTaskError(state, setpoint);

    const LyapunovCertificate& clf = certificates_[err.numSwing()];
    const Eigen::VectorXd eta = err.eta();

    // =======================================================================
    // 2. QP 조립: x = [vd | tau | f_0 .. f_{nc-1} | delta]
    // =======================================================================
    const QpLayout layout(dynamics_.nv(), dynamics_.na(), err.numContact());
    QpProblem qp(layout.numVars());

    // min ||J*vd + Jdv - xdd_nom||^2 + w * 2eta'PGJ*vd
    qp.addCost(TrackingCost(layout, err.J, err.Jdv, err.xdd_nom, w_tracking_));
    qp.addCost(LyapunovRateCost(layout, clf, eta, err.J, w_vdot_));
    qp.addCost(Regularization(layout));

    // V_dot <= -gamma*V + delta,  delta <= 0
    qp.addConstraint(ClfConstraint(layout, clf, eta, err.J, err.Jdv, err.xdd_nom));
    qp.addConstraint(SlackSignConstraint(layout));

    // M*vd + Cv + tau_g = S'*tau + sum(J_c' f)
    qp.addConstraint(DynamicsConstraint(layout, dyn, err.J_c));

    if (err.numContact() > 0) {
        qp.addConstraint(FrictionPyramid(layout, mu_));
        qp.addConstraint(ContactConstraint(layout, err.J_c, err.Jdv_c, state.v, no_slip_damping_));
    }

    if (tau_max_.size() > 0)
        qp.addConstraint(TorqueLimits(layout, tau_max_));

    // =======================================================================
    // 3. 풀이 (실패 = 치명적)
    // =======================================================================
    auto t_start = std::chrono::high_resolution_clock::now();
    bool ok = qp.solve();
    auto t_end = std::chrono::high_resolution_clock::now();

    if (!ok) {
        std::cerr << "[ClfQpController] QP failed: swing=" << err.numSwing()
                  << " contact=" << err.numContact()
                  << " V=" << clf.value(eta) << "\n";
        throw QpSolveError("ClfQpController: QP solve failed, status=" +
                           std::to_string(static_cast<int>(qp.getStatus())));
    }

    // =======================================================================
    // 4. 해 추출 + 진단
    // =======================================================================
    const Eigen::VectorXd& x = qp.getSolution();

    ClfQpSolution sol;
    sol.vd  = x.segment(layout.vd(), layout.nv);
    sol.tau = x.segment(layout.tau(), layout.na);
    for (int k = 0; k < layout.nc; ++k)
        sol.forces.push_back(x.segment<3>(layout.force(k)));
    sol.contact_feet = err.contact_feet;
    sol.delta = x(layout.delta());

    Eigen::VectorXd nu = err.J * sol.vd + err.Jdv - err.xdd_nom;
    sol.V     = clf.value(eta);
    sol.Vdot  = clf.rate(eta, nu);
    sol.gamma = clf.getGamma();
    sol.tracking_error = err.x_tilde.norm();

    sol.solve_us = std::chrono::duration_cast<std::chrono::microseconds>(t_end - t_start).count();
    sol.deadline_missed = sol.solve_us > static_cast<long long>(CONTROL_DT * 1e6);

    return sol;
}
