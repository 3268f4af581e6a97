#include "constraints/clf_constraint.hpp"
#include <limits>

ClfConstraint::ClfConstraint(const QpLayout& layout,
                             const LyapunovCertificate& clf,
                             const Eigen::VectorXd& eta,
                             const Eigen::MatrixXd& J,
                             const Eigen::VectorXd& Jdv,
                             const Eigen::VectorXd& xdd_nom)
{
    const double INF = std::numeric_limits<double>::infinity();

    // 2 eta' P G  (1 x n)
    Eigen::RowVectorXd LgV = eta.transpose() * clf.getPG2();
    double V   = clf.value(eta);
    double LfV = 2.0 * eta.dot(clf.getP() * (clf.getF() * eta));

    A_.setZero(1, layout.numVars());
    A_.block(0, layout.vd(), 1, layout.nv) = LgV * J;
    A_(0, layout.delta()) = -1.0;

    l_.resize(1);
    u_.resize(1);
    l_(0) = -INF;
    u_(0) = -clf.getGamma() * V - LfV - (LgV * (Jdv - xdd_nom)).value();
}

SlackSignConstraint::SlackSignConstraint(const QpLayout& layout)
{
    const double INF = std::numeric_limits<double>::infinity();

    A_.setZero(1, layout.numVars());
    A_(0, layout.delta()) = 1.0;

    l_.resize(1);
    u_.resize(1);
    l_(0) = -INF;
    u_(0) = 0.0;
}
