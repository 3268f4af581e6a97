#include "whole_body_controller/qp_problem.hpp"
#include <iostream>
#include <optional>
#include <stdexcept>

namespace {

void appendRows(Eigen::MatrixXd& M, const Eigen::MatrixXd& rows)
{
    const Eigen::Index r = M.rows();
    M.conservativeResize(r + rows.rows(), Eigen::NoChange);
    M.bottomRows(rows.rows()) = rows;
}

void appendRows(Eigen::VectorXd& v, const Eigen::VectorXd& rows)
{
    const Eigen::Index r = v.size();
    v.conservativeResize(r + rows.size());
    v.tail(rows.size()) = rows;
}

} // namespace

QpProblem::QpProblem(int num_vars)
    : num_vars_(num_vars),
      status_(proxsuite::proxqp::QPSolverOutput::PROXQP_NOT_RUN),
      iterations_(0)
{
    H_.setZero(num_vars_, num_vars_);
    g_.setZero(num_vars_);
    A_.resize(0, num_vars_);
    b_.resize(0);
    C_.resize(0, num_vars_);
    l_.resize(0);
    u_.resize(0);
    x_.setZero(num_vars_);
}

void QpProblem::addCost(const CostCore& cost)
{
    H_ += cost.getHessian();
    g_ += cost.getGradient();
}

void QpProblem::addConstraint(const ConstraintCore& constraint)
{
    Eigen::MatrixXd A = constraint.getA();
    if (A.cols() != num_vars_)
        throw std::invalid_argument("QpProblem: constraint column count mismatch");
    if (A.rows() == 0) return;

    if (constraint.isEquality()) {
        appendRows(A_, A);
        appendRows(b_, constraint.getLowerBound());
    } else {
        appendRows(C_, A);
        appendRows(l_, constraint.getLowerBound());
        appendRows(u_, constraint.getUpperBound());
    }
}

bool QpProblem::solve()
{
    const int n_eq = numEqualities();
    const int n_in = numInequalities();

    proxsuite::proxqp::dense::QP<double> qp(num_vars_, n_eq, n_in);
    qp.settings.eps_abs  = QP_EPS_ABS;
    qp.settings.eps_rel  = QP_EPS_REL;
    qp.settings.max_iter = QP_MAX_ITER;
    qp.settings.verbose  = false;

    // 무한 경계 → proxsuite infinite bound
    Eigen::VectorXd l = l_.cwiseMax(-QP_INF);
    Eigen::VectorXd u = u_.cwiseMin(QP_INF);

    if (n_eq > 0 && n_in > 0)
        qp.init(H_, g_, A_, b_, C_, l, u);
    else if (n_eq > 0)
        qp.init(H_, g_, A_, b_, std::nullopt, std::nullopt, std::nullopt);
    else if (n_in > 0)
        qp.init(H_, g_, std::nullopt, std::nullopt, C_, l, u);
    else
        qp.init(H_, g_, std::nullopt, std::nullopt, std::nullopt, std::nullopt, std::nullopt);

    qp.solve();

    status_     = qp.results.info.status;
    iterations_ = static_cast<int>(qp.results.info.iter);

    if (status_ == proxsuite::proxqp::QPSolverOutput::PROXQP_SOLVED) {
        x_ = qp.results.x;
        return true;
    }

    std::cerr << "[QpProblem] solve failed, status="
              << static_cast<int>(status_) << " iter=" << iterations_ << "\n";
    return false;
}

double QpProblem::objective(const Eigen::VectorXd& x) const
{
    return 0.5 * x.dot(H_ * x) + g_.dot(x);
}
