#pragma once
#include "constraints/constraint_core.hpp"
#include "constraints/qp_layout.hpp"

// 액추에이터 토크 한계: -tau_max <= tau <= tau_max
class TorqueLimits : public ConstraintCore {
public:
    TorqueLimits(const QpLayout& layout, const Eigen::VectorXd& tau_max);

    Eigen::MatrixXd getA()          const override { return A_; }
    Eigen::VectorXd getLowerBound() const override { return -tau_max_; }
    Eigen::VectorXd getUpperBound() const override { return tau_max_; }

private:
    Eigen::VectorXd tau_max_;
    Eigen::MatrixXd A_;
};
