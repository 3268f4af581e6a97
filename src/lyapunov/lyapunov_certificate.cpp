#include "lyapunov/lyapunov_certificate.hpp"
#include "utils/riccati.hpp"
#include <iostream>

namespace {

double minEigenvalue(const Eigen::MatrixXd& A)
{
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(A, Eigen::EigenvaluesOnly);
    return es.eigenvalues().minCoeff();
}

double maxEigenvalue(const Eigen::MatrixXd& A)
{
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(A, Eigen::EigenvaluesOnly);
    return es.eigenvalues().maxCoeff();
}

bool isSymmetricPositiveDefinite(const Eigen::MatrixXd& A)
{
    if (A.rows() != A.cols() || A.rows() == 0) return false;
    if (!A.isApprox(A.transpose(), 1e-9)) return false;
    return minEigenvalue(A) > 0.0;
}

} // namespace

LyapunovCertificate::LyapunovCertificate(int task_dim, double q_weight, double r_weight)
{
    if (task_dim <= 0)
        throw CertificateError("LyapunovCertificate: task dimension must be positive");

    const int n = task_dim;

    // 위치 오차 <- 속도 오차, 속도 오차 <- nu
    F_.setZero(2 * n, 2 * n);
    F_.topRightCorner(n, n).setIdentity();

    G_.setZero(2 * n, n);
    G_.bottomRows(n).setIdentity();

    Q_ = q_weight * Eigen::MatrixXd::Identity(2 * n, 2 * n);
    R_ = r_weight * Eigen::MatrixXd::Identity(n, n);

    solve();
}

LyapunovCertificate::LyapunovCertificate(const Eigen::MatrixXd& F, const Eigen::MatrixXd& G,
                                         const Eigen::MatrixXd& Q, const Eigen::MatrixXd& R)
    : F_(F), G_(G), Q_(Q), R_(R)
{
    if (F_.rows() != F_.cols() || G_.rows() != F_.rows() ||
        Q_.rows() != F_.rows() || R_.rows() != G_.cols())
        throw CertificateError("LyapunovCertificate: inconsistent F/G/Q/R dimensions");

    solve();
}

void LyapunovCertificate::solve()
{
    if (!isSymmetricPositiveDefinite(Q_))
        throw CertificateError("LyapunovCertificate: Q must be symmetric positive-definite");
    if (!isSymmetricPositiveDefinite(R_))
        throw CertificateError("LyapunovCertificate: R must be symmetric positive-definite");

    auto P = quadclf::solveCare(F_, G_, Q_, R_);
    if (!P) {
        std::cerr << "[LyapunovCertificate] CARE failed (dim=" << F_.rows()
                  << "): (F, G) not stabilizable for the chosen weights\n";
        throw CertificateError("LyapunovCertificate: no stabilizing Riccati solution");
    }
    P_ = *P;

    // gamma = lambda_min(Q) / lambda_max(P)
    gamma_ = minEigenvalue(Q_) / maxEigenvalue(P_);
    PG2_   = 2.0 * P_ * G_;
}

double LyapunovCertificate::value(const Eigen::VectorXd& eta) const
{
    return eta.dot(P_ * eta);
}

// V_dot = 2 eta' P (F eta + G nu)
double LyapunovCertificate::rate(const Eigen::VectorXd& eta, const Eigen::VectorXd& nu) const
{
    return 2.0 * eta.dot(P_ * (F_ * eta + G_ * nu));
}
