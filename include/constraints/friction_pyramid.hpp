#pragma once
#include "constraints/constraint_core.hpp"
#include "constraints/qp_layout.hpp"

// 접촉력마다 독립적인 선형화 마찰 피라미드
// 접촉발 k 의 f_k = [fx, fy, fz] 에 5행씩, 블록 대각
class FrictionPyramid : public ConstraintCore {
public:
    FrictionPyramid(const QpLayout& layout, double mu);

    Eigen::MatrixXd getA()          const override { return A_; }
    Eigen::VectorXd getLowerBound() const override { return l_; }
    Eigen::VectorXd getUpperBound() const override { return u_; }

    // 한 발 (5 x 3)
    static Eigen::MatrixXd facets(double mu);

private:
    double mu_;
    Eigen::MatrixXd A_;
    Eigen::VectorXd l_;
    Eigen::VectorXd u_;

    void buildConstraint(const QpLayout& layout);
};
