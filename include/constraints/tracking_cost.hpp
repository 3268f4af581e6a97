#pragma once
#include "constraints/constraint_core.hpp"
#include "constraints/qp_layout.hpp"
#include "lyapunov/lyapunov_certificate.hpp"
#include "config.hpp"

// 태스크 가속도 추종: w * ||J*vd + Jdv - xdd_nom||^2
//   H_vd = 2w J'J,  g_vd = 2w J'(Jdv - xdd_nom)
class TrackingCost : public CostCore {
public:
    TrackingCost(const QpLayout& layout,
                 const Eigen::MatrixXd& J,
                 const Eigen::VectorXd& Jdv,
                 const Eigen::VectorXd& xdd_nom,
                 double weight = TRACKING_WEIGHT);

    Eigen::MatrixXd getHessian()  const override { return H_; }
    Eigen::VectorXd getGradient() const override { return g_; }

    // 상수항 포함 비용값 (진단용)
    double evaluate(const Eigen::VectorXd& x) const;

private:
    Eigen::MatrixXd H_;
    Eigen::VectorXd g_;
    double c_;
};

// V_dot 의 입력 의존 부분 (vd 에 대해 선형): w * 2eta'PGJ * vd
class LyapunovRateCost : public CostCore {
public:
    LyapunovRateCost(const QpLayout& layout,
                     const LyapunovCertificate& clf,
                     const Eigen::VectorXd& eta,
                     const Eigen::MatrixXd& J,
                     double weight = VDOT_WEIGHT);

    Eigen::MatrixXd getHessian()  const override { return H_; }
    Eigen::VectorXd getGradient() const override { return g_; }

private:
    Eigen::MatrixXd H_;
    Eigen::VectorXd g_;
};

// 대각 정규화: sum w_i * x_i^2
class Regularization : public CostCore {
public:
    Regularization(const QpLayout& layout,
                   double w_vd    = REG_VD,
                   double w_tau   = REG_TAU,
                   double w_force = REG_FORCE,
                   double w_delta = REG_DELTA);

    Eigen::MatrixXd getHessian()  const override { return H_; }
    Eigen::VectorXd getGradient() const override { return g_; }

private:
    Eigen::MatrixXd H_;
    Eigen::VectorXd g_;
};
