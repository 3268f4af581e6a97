#pragma once
#include "constraints/constraint_core.hpp"
#include "constraints/qp_layout.hpp"
#include "config.hpp"

// 접촉발 no-slip (등식, 3*nc 행)
//
//   J_c*vd + Jdv_c = -k_d * J_c*v
//
// k_d: 접촉점 상대 속도를 0 으로 끌어당기는 감쇠 계수 (1/s)
//      k_d = 0 이면 접촉점 가속도 = 0
class ContactConstraint : public ConstraintCore {
public:
    ContactConstraint(const QpLayout& layout,
                      const Eigen::MatrixXd& J_c,
                      const Eigen::VectorXd& Jdv_c,
                      const Eigen::VectorXd& v,
                      double damping = NO_SLIP_DAMPING);

    Eigen::MatrixXd getA()          const override { return A_; }
    Eigen::VectorXd getLowerBound() const override { return b_; }
    Eigen::VectorXd getUpperBound() const override { return b_; }
    bool isEquality() const override { return true; }

private:
    Eigen::MatrixXd A_;
    Eigen::VectorXd b_;
};
