#include "dynamics_model/robot_dynamics.hpp"
#include <pinocchio/algorithm/crba.hpp>
#include <pinocchio/algorithm/rnea.hpp>
#include <pinocchio/algorithm/kinematics.hpp>
#include <pinocchio/algorithm/frames.hpp>
#include <pinocchio/algorithm/jacobian.hpp>
#include <stdexcept>

RobotDynamics::RobotDynamics(const pinocchio::Model& model)
    : model_(model), data_(model_)
{
    if (model_.nv < 6)
        throw std::invalid_argument("RobotDynamics: floating-base model expected (nv >= 6)");

    // S = [0 (na x 6)  I (na x na)]
    S_.setZero(na(), nv());
    S_.rightCols(na()).setIdentity();
}

DynamicsQuantities RobotDynamics::computeDynamics(const Eigen::VectorXd& q,
                                                  const Eigen::VectorXd& v)
{
    DynamicsQuantities dyn;

    // 질량 행렬 (crba 는 상삼각만 채움)
    pinocchio::crba(model_, data_, q);
    data_.M.triangularView<Eigen::StrictlyLower>() =
        data_.M.transpose().triangularView<Eigen::StrictlyLower>();
    dyn.M = data_.M;

    // nle = C(q,v)v + g(q)
    dyn.tau_g = pinocchio::computeGeneralizedGravity(model_, data_, q);
    pinocchio::nonLinearEffects(model_, data_, q, v);
    dyn.Cv = data_.nle - dyn.tau_g;

    dyn.S = S_;
    return dyn;
}

void RobotDynamics::updateKinematics(const Eigen::VectorXd& q, const Eigen::VectorXd& v)
{
    // a = 0 → classical acceleration = Jdot * v
    pinocchio::forwardKinematics(model_, data_, q, v, Eigen::VectorXd::Zero(model_.nv));
    pinocchio::computeJointJacobians(model_, data_, q);
    pinocchio::updateFramePlacements(model_, data_);
}

FrameKinematics RobotDynamics::bodyKinematics(int frame_id)
{
    const auto fid = static_cast<pinocchio::FrameIndex>(frame_id);

    FrameKinematics fk;
    fk.R = data_.oMf[fid].rotation();
    fk.p = data_.oMf[fid].translation();

    // Pinocchio: [선속도; 각속도] → [각속도; 선속도] 로 재배열
    pinocchio::Data::Matrix6x J6 = pinocchio::Data::Matrix6x::Zero(6, model_.nv);
    pinocchio::getFrameJacobian(model_, data_, fid, pinocchio::LOCAL_WORLD_ALIGNED, J6);
    fk.J.resize(6, model_.nv);
    fk.J.topRows(3)    = J6.bottomRows(3);
    fk.J.bottomRows(3) = J6.topRows(3);

    const pinocchio::Motion a =
        pinocchio::getFrameClassicalAcceleration(model_, data_, fid, pinocchio::LOCAL_WORLD_ALIGNED);
    fk.Jdv.resize(6);
    fk.Jdv << a.angular(), a.linear();
    return fk;
}

FrameKinematics RobotDynamics::pointKinematics(int frame_id)
{
    const auto fid = static_cast<pinocchio::FrameIndex>(frame_id);

    FrameKinematics fk;
    fk.R = data_.oMf[fid].rotation();
    fk.p = data_.oMf[fid].translation();

    pinocchio::Data::Matrix6x J6 = pinocchio::Data::Matrix6x::Zero(6, model_.nv);
    pinocchio::getFrameJacobian(model_, data_, fid, pinocchio::LOCAL_WORLD_ALIGNED, J6);
    fk.J = J6.topRows(3);

    fk.Jdv = pinocchio::getFrameClassicalAcceleration(
        model_, data_, fid, pinocchio::LOCAL_WORLD_ALIGNED).linear();
    return fk;
}

int RobotDynamics::getFrameId(const std::string& name) const
{
    if (!model_.existFrame(name))
        throw std::invalid_argument("RobotDynamics: unknown frame '" + name + "'");
    return static_cast<int>(model_.getFrameId(name));
}
