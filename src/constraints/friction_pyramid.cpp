#include "constraints/friction_pyramid.hpp"
#include <cmath>
#include <limits>

FrictionPyramid::FrictionPyramid(const QpLayout& layout, double mu)
    : mu_(mu)
{
    A_.setZero(5 * layout.nc, layout.numVars());
    l_.resize(5 * layout.nc);
    u_.resize(5 * layout.nc);

    buildConstraint(layout);
}

// 선형화된 마찰 원뿔: |fx| <= mu_eff*fz, |fy| <= mu_eff*fz, fz >= 0
// mu_eff = mu / sqrt(2) → 내접 피라미드, ||f_t|| <= mu*fz 보장
Eigen::MatrixXd FrictionPyramid::facets(double mu)
{
    double mu_eff = mu / std::sqrt(2.0);

    Eigen::MatrixXd A = Eigen::MatrixXd::Zero(5, 3);
    A(0, 0) =  1.0; A(0, 2) = -mu_eff;   //  fx - mu_eff*fz <= 0
    A(1, 0) = -1.0; A(1, 2) = -mu_eff;   // -fx - mu_eff*fz <= 0
    A(2, 1) =  1.0; A(2, 2) = -mu_eff;   //  fy - mu_eff*fz <= 0
    A(3, 1) = -1.0; A(3, 2) = -mu_eff;   // -fy - mu_eff*fz <= 0
    A(4, 2) =  1.0;                      //  0 <= fz
    return A;
}

void FrictionPyramid::buildConstraint(const QpLayout& layout)
{
    const double INF = std::numeric_limits<double>::infinity();
    const Eigen::MatrixXd A1 = facets(mu_);

    Eigen::VectorXd l1(5), u1(5);
    l1 << -INF, -INF, -INF, -INF, 0.0;
    u1 <<  0.0,  0.0,  0.0,  0.0, INF;

    for (int k = 0; k < layout.nc; ++k) {
        A_.block(5 * k, layout.force(k), 5, 3) = A1;
        l_.segment(5 * k, 5) = l1;
        u_.segment(5 * k, 5) = u1;
    }
}
