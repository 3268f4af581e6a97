#pragma once
#include "constraints/constraint_core.hpp"
#include "constraints/qp_layout.hpp"
#include "lyapunov/lyapunov_certificate.hpp"

// CLF 감소 조건 (1행 부등식)
//
//   V_dot <= -gamma*V + delta
//   V_dot  = 2 eta'P(F eta + G nu),  nu = J*vd + Jdv - xdd_nom
//
// vd 항은 좌변, 상수항은 우변:
//   2eta'PGJ*vd - delta <= -gamma*V - 2eta'PF eta - 2eta'PG(Jdv - xdd_nom)
class ClfConstraint : public ConstraintCore {
public:
    ClfConstraint(const QpLayout& layout,
                  const LyapunovCertificate& clf,
                  const Eigen::VectorXd& eta,
                  const Eigen::MatrixXd& J,
                  const Eigen::VectorXd& Jdv,
                  const Eigen::VectorXd& xdd_nom);

    Eigen::MatrixXd getA()          const override { return A_; }
    Eigen::VectorXd getLowerBound() const override { return l_; }
    Eigen::VectorXd getUpperBound() const override { return u_; }

private:
    Eigen::MatrixXd A_;
    Eigen::VectorXd l_;
    Eigen::VectorXd u_;
};

// delta <= 0
class SlackSignConstraint : public ConstraintCore {
public:
    explicit SlackSignConstraint(const QpLayout& layout);

    Eigen::MatrixXd getA()          const override { return A_; }
    Eigen::VectorXd getLowerBound() const override { return l_; }
    Eigen::VectorXd getUpperBound() const override { return u_; }

private:
    Eigen::MatrixXd A_;
    Eigen::VectorXd l_;
    Eigen::VectorXd u_;
};
