#pragma once
#include <Eigen/Dense>

// 선형 제약: l <= A*x <= u  (x = QP 전체 결정변수)
// 등식이면 l == u
class ConstraintCore {
public:
    virtual ~ConstraintCore() = default;

    virtual Eigen::MatrixXd getA()          const = 0;
    virtual Eigen::VectorXd getLowerBound() const = 0;
    virtual Eigen::VectorXd getUpperBound() const = 0;

    virtual bool isEquality() const { return false; }
};

// 비용: 0.5*x'*H*x + g'*x  (ProxQP 규약)
class CostCore {
public:
    virtual ~CostCore() = default;

    virtual Eigen::MatrixXd getHessian()  const = 0;
    virtual Eigen::VectorXd getGradient() const = 0;
};
