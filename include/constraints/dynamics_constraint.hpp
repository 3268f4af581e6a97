#pragma once
#include "constraints/constraint_core.hpp"
#include "constraints/qp_layout.hpp"
#include "dynamics_model/robot_dynamics.hpp"

// 부유 기저 운동 방정식 (등식, nv 행)
//
//   M*vd + Cv + tau_g = S'*tau + sum_k J_c,k' * f_k
//
//   [M  -S'  -J_c,0' ... -J_c,nc-1'  0] x = -(Cv + tau_g)
//
// 접촉발이 없으면 M*vd + Cv + tau_g = S'*tau
class DynamicsConstraint : public ConstraintCore {
public:
    // J_c: 3*nc x nv (접촉발 순서대로 스택)
    DynamicsConstraint(const QpLayout& layout,
                       const DynamicsQuantities& dyn,
                       const Eigen::MatrixXd& J_c);

    Eigen::MatrixXd getA()          const override { return A_; }
    Eigen::VectorXd getLowerBound() const override { return b_; }
    Eigen::VectorXd getUpperBound() const override { return b_; }
    bool isEquality() const override { return true; }

private:
    Eigen::MatrixXd A_;
    Eigen::VectorXd b_;
};
