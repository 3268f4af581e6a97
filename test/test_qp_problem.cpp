#include <gtest/gtest.h>
#include <limits>

#include "whole_body_controller/qp_problem.hpp"

namespace {

// 테스트용 고정 비용 / 제약
class FixedCost : public CostCore {
public:
    FixedCost(const Eigen::MatrixXd& H, const Eigen::VectorXd& g) : H_(H), g_(g) {}
    Eigen::MatrixXd getHessian()  const override { return H_; }
    Eigen::VectorXd getGradient() const override { return g_; }
private:
    Eigen::MatrixXd H_;
    Eigen::VectorXd g_;
};

class FixedConstraint : public ConstraintCore {
public:
    FixedConstraint(const Eigen::MatrixXd& A, const Eigen::VectorXd& l,
                    const Eigen::VectorXd& u, bool eq)
        : A_(A), l_(l), u_(u), eq_(eq) {}
    Eigen::MatrixXd getA()          const override { return A_; }
    Eigen::VectorXd getLowerBound() const override { return l_; }
    Eigen::VectorXd getUpperBound() const override { return u_; }
    bool isEquality() const override { return eq_; }
private:
    Eigen::MatrixXd A_;
    Eigen::VectorXd l_, u_;
    bool eq_;
};

} // namespace

TEST(QpProblem, UnconstrainedMinimum)
{
    QpProblem qp(2);
    Eigen::MatrixXd H = 2.0 * Eigen::MatrixXd::Identity(2, 2);
    Eigen::VectorXd g(2);
    g << -2.0, 4.0;
    qp.addCost(FixedCost(H, g));

    ASSERT_TRUE(qp.solve());
    EXPECT_NEAR(qp.getSolution()(0),  1.0, 1e-5);
    EXPECT_NEAR(qp.getSolution()(1), -2.0, 1e-5);
    EXPECT_EQ(qp.numEqualities(), 0);
    EXPECT_EQ(qp.numInequalities(), 0);
}

TEST(QpProblem, CostsAreSummedAndConstraintsStacked)
{
    const double INF = std::numeric_limits<double>::infinity();

    // min (x0-1)^2 + (x1-1)^2  s.t. x0 + x1 = 1, x0 <= 0.2
    QpProblem qp(2);
    qp.addCost(FixedCost(Eigen::MatrixXd::Identity(2, 2), Eigen::Vector2d(-2.0, 0.0)));
    qp.addCost(FixedCost(Eigen::MatrixXd::Identity(2, 2), Eigen::Vector2d(0.0, -2.0)));

    Eigen::MatrixXd A_eq(1, 2);
    A_eq << 1.0, 1.0;
    qp.addConstraint(FixedConstraint(A_eq, Eigen::VectorXd::Ones(1), Eigen::VectorXd::Ones(1), true));

    Eigen::MatrixXd A_in(1, 2);
    A_in << 1.0, 0.0;
    qp.addConstraint(FixedConstraint(A_in, Eigen::VectorXd::Constant(1, -INF),
                                     Eigen::VectorXd::Constant(1, 0.2), false));

    EXPECT_EQ(qp.numEqualities(), 1);
    EXPECT_EQ(qp.numInequalities(), 1);

    ASSERT_TRUE(qp.solve());
    EXPECT_NEAR(qp.getSolution()(0), 0.2, 1e-5);
    EXPECT_NEAR(qp.getSolution()(1), 0.8, 1e-5);
    EXPECT_EQ(qp.getStatus(), proxsuite::proxqp::QPSolverOutput::PROXQP_SOLVED);
}

TEST(QpProblem, InfeasibleReportsFailure)
{
    // x = 1 이면서 2 <= x <= 3
    QpProblem qp(1);
    qp.addCost(FixedCost(Eigen::MatrixXd::Identity(1, 1), Eigen::VectorXd::Zero(1)));
    qp.addConstraint(FixedConstraint(Eigen::MatrixXd::Ones(1, 1), Eigen::VectorXd::Ones(1),
                                     Eigen::VectorXd::Ones(1), true));
    qp.addConstraint(FixedConstraint(Eigen::MatrixXd::Ones(1, 1), Eigen::VectorXd::Constant(1, 2.0),
                                     Eigen::VectorXd::Constant(1, 3.0), false));

    EXPECT_FALSE(qp.solve());
    EXPECT_NE(qp.getStatus(), proxsuite::proxqp::QPSolverOutput::PROXQP_SOLVED);
}

TEST(QpProblem, ColumnMismatchThrows)
{
    QpProblem qp(3);
    EXPECT_THROW(qp.addConstraint(FixedConstraint(Eigen::MatrixXd::Ones(1, 2), Eigen::VectorXd::Zero(1),
                                                  Eigen::VectorXd::Zero(1), true)),
                 std::invalid_argument);
}

TEST(QpProblem, ObjectiveUsesHalfQuadraticConvention)
{
    QpProblem qp(2);
    qp.addCost(FixedCost(4.0 * Eigen::MatrixXd::Identity(2, 2), Eigen::Vector2d(1.0, -1.0)));
    Eigen::Vector2d x(1.0, 2.0);
    // 0.5 * 4 * (1 + 4) + (1 - 2)
    EXPECT_DOUBLE_EQ(qp.objective(x), 9.0);
}
