#include "constraints/tracking_cost.hpp"

TrackingCost::TrackingCost(const QpLayout& layout,
                           const Eigen::MatrixXd& J,
                           const Eigen::VectorXd& Jdv,
                           const Eigen::VectorXd& xdd_nom,
                           double weight)
{
    const int n = layout.numVars();
    Eigen::VectorXd r0 = Jdv - xdd_nom;

    H_.setZero(n, n);
    g_.setZero(n);
    H_.block(layout.vd(), layout.vd(), layout.nv, layout.nv) = 2.0 * weight * J.transpose() * J;
    g_.segment(layout.vd(), layout.nv) = 2.0 * weight * J.transpose() * r0;
    c_ = weight * r0.squaredNorm();
}

double TrackingCost::evaluate(const Eigen::VectorXd& x) const
{
    return 0.5 * x.dot(H_ * x) + g_.dot(x) + c_;
}

LyapunovRateCost::LyapunovRateCost(const QpLayout& layout,
                                   const LyapunovCertificate& clf,
                                   const Eigen::VectorXd& eta,
                                   const Eigen::MatrixXd& J,
                                   double weight)
{
    const int n = layout.numVars();

    H_.setZero(n, n);
    g_.setZero(n);
    // (2 eta' P G J)'
    g_.segment(layout.vd(), layout.nv) = weight * J.transpose() * (clf.getPG2().transpose() * eta);
}

Regularization::Regularization(const QpLayout& layout,
                               double w_vd, double w_tau, double w_force, double w_delta)
{
    const int n = layout.numVars();

    Eigen::VectorXd w(n);
    w.segment(layout.vd(), layout.nv).setConstant(w_vd);
    w.segment(layout.tau(), layout.na).setConstant(w_tau);
    w.segment(layout.forces(), 3 * layout.nc).setConstant(w_force);
    w(layout.delta()) = w_delta;

    H_ = (2.0 * w).asDiagonal();
    g_.setZero(n);
}
