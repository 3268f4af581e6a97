#include "utils/riccati.hpp"
#include <cmath>
#include <algorithm>

namespace quadclf {

namespace {
constexpr int    kSignMaxIter = 100;
constexpr double kSignTol     = 1e-12;
constexpr double kResidualTol = 1e-6;
}

std::optional<Eigen::MatrixXd> solveCare(const Eigen::MatrixXd& F,
                                         const Eigen::MatrixXd& G,
                                         const Eigen::MatrixXd& Q,
                                         const Eigen::MatrixXd& R)
{
    const int n = static_cast<int>(F.rows());
    const int m = static_cast<int>(G.cols());
    if (n == 0 || F.cols() != n || G.rows() != n ||
        Q.rows() != n || Q.cols() != n || R.rows() != m || R.cols() != m)
        return std::nullopt;

    Eigen::LDLT<Eigen::MatrixXd> R_ldlt(R);
    if (R_ldlt.info() != Eigen::Success || !R_ldlt.isPositive())
        return std::nullopt;

    // G R^{-1} G'
    Eigen::MatrixXd GRG = G * R_ldlt.solve(G.transpose());

    Eigen::MatrixXd Z(2 * n, 2 * n);
    Z << F, -GRG,
         -Q, -F.transpose();

    // ── 부호 함수 Newton 반복 (determinant scaling) ──
    // Z <- (Z/c + c*Z^{-1}) / 2,  c = |det Z|^{1/2n}
    bool converged = false;
    for (int k = 0; k < kSignMaxIter; ++k) {
        Eigen::FullPivLU<Eigen::MatrixXd> lu(Z);
        if (!lu.isInvertible()) return std::nullopt;  // 허수축 고유값

        double log_det = 0.0;
        for (int i = 0; i < 2 * n; ++i)
            log_det += std::log(std::abs(lu.matrixLU()(i, i)));
        double c = std::exp(log_det / (2.0 * n));

        Eigen::MatrixXd Z_next = 0.5 * (Z / c + c * lu.inverse());
        double diff = (Z_next - Z).norm();
        Z = Z_next;
        if (!Z.allFinite()) return std::nullopt;
        if (diff <= kSignTol * Z.norm()) { converged = true; break; }
    }
    if (!converged) return std::nullopt;

    // ── 안정 부분공간 → P ──
    Eigen::MatrixXd I = Eigen::MatrixXd::Identity(n, n);
    Eigen::MatrixXd lhs(2 * n, n), rhs(2 * n, n);
    lhs << Z.topRightCorner(n, n),
           Z.bottomRightCorner(n, n) + I;
    rhs << Z.topLeftCorner(n, n) + I,
           Z.bottomLeftCorner(n, n);

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(lhs);
    if (qr.rank() < n) return std::nullopt;  // 안정 부분공간이 그래프가 아님

    Eigen::MatrixXd P = qr.solve(-rhs);
    P = 0.5 * (P + P.transpose());

    Eigen::LLT<Eigen::MatrixXd> llt(P);
    if (llt.info() != Eigen::Success) return std::nullopt;

    if (careResidual(F, G, Q, R, P) > kResidualTol * std::max(1.0, Q.norm()))
        return std::nullopt;

    return P;
}

double careResidual(const Eigen::MatrixXd& F,
                    const Eigen::MatrixXd& G,
                    const Eigen::MatrixXd& Q,
                    const Eigen::MatrixXd& R,
                    const Eigen::MatrixXd& P)
{
    Eigen::MatrixXd GRG = G * R.ldlt().solve(G.transpose());
    Eigen::MatrixXd res = F.transpose() * P + P * F - P * GRG * P + Q;
    return res.cwiseAbs().maxCoeff();
}

} // namespace quadclf
