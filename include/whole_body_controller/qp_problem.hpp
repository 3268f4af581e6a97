#pragma once

#include <Eigen/Dense>
#include <proxsuite/proxqp/dense/dense.hpp>
#include "config.hpp"
#include "constraints/constraint_core.hpp"

// 틱마다 새로 만들고 풀고 버리는 QP (ProxQP dense)
//
//   min  0.5*x'*H*x + g'*x
//   s.t. A*x = b
//        l <= C*x <= u
//
// 비용/제약은 add* 로 누적 (비용은 합산, 제약은 행 스택)
class QpProblem {
public:
    explicit QpProblem(int num_vars);

    void addCost(const CostCore& cost);
    void addConstraint(const ConstraintCore& constraint);

    // PROXQP_SOLVED 일 때만 true
    bool solve();

    const Eigen::VectorXd& getSolution() const { return x_; }

    int numVars()       const { return num_vars_; }
    int numEqualities() const { return static_cast<int>(A_.rows()); }
    int numInequalities() const { return static_cast<int>(C_.rows()); }

    // 마지막 solve 의 ProxQP 상태
    proxsuite::proxqp::QPSolverOutput getStatus() const { return status_; }

    double objective(const Eigen::VectorXd& x) const;

private:
    int num_vars_;

    Eigen::MatrixXd H_;
    Eigen::VectorXd g_;
    Eigen::MatrixXd A_;
    Eigen::VectorXd b_;
    Eigen::MatrixXd C_;
    Eigen::VectorXd l_;
    Eigen::VectorXd u_;

    Eigen::VectorXd x_;
    proxsuite::proxqp::QPSolverOutput status_;
    int iterations_;
};
