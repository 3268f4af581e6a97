#pragma once
#include <Eigen/Dense>
#include <stdexcept>
#include <string>
#include "config.hpp"

// 인증서 생성 실패: 안정성 보장 불가 → 초기화 중단
class CertificateError : public std::runtime_error {
public:
    explicit CertificateError(const std::string& what) : std::runtime_error(what) {}
};

// ============================================================
// Control Lyapunov Function 인증서
//
// 태스크 공간 오차 동역학 (n = 태스크 차원):
//   eta = [x_tilde; xd_tilde]  (2n)
//   eta_dot = F*eta + G*nu,  nu = xdd_tilde
//
//   F = [0  I]    G = [0]
//       [0  0]        [I]
//
// CARE 로 P 계산 후
//   V     = eta' P eta
//   gamma = lambda_min(Q) / lambda_max(P)
//
// 생성 시 한 번만 계산, 이후 불변
// ============================================================

class LyapunovCertificate {
public:
    // 기본 가중치: Q = q_weight*I (2n), R = r_weight*I (n)
    explicit LyapunovCertificate(int task_dim,
                                 double q_weight = CLF_Q_WEIGHT,
                                 double r_weight = CLF_R_WEIGHT);

    // 임의의 오차 동역학 / 가중치
    LyapunovCertificate(const Eigen::MatrixXd& F, const Eigen::MatrixXd& G,
                        const Eigen::MatrixXd& Q, const Eigen::MatrixXd& R);

    double value(const Eigen::VectorXd& eta) const;
    double rate(const Eigen::VectorXd& eta, const Eigen::VectorXd& nu) const;

    int taskDim()  const { return static_cast<int>(G_.cols()); }
    int stateDim() const { return static_cast<int>(F_.rows()); }

    const Eigen::MatrixXd& getF() const { return F_; }
    const Eigen::MatrixXd& getG() const { return G_; }
    const Eigen::MatrixXd& getQ() const { return Q_; }
    const Eigen::MatrixXd& getR() const { return R_; }
    const Eigen::MatrixXd& getP() const { return P_; }
    double getGamma() const { return gamma_; }

    // 2*P*G (CLF 제약 / V_dot 비용에서 반복 사용)
    const Eigen::MatrixXd& getPG2() const { return PG2_; }

private:
    Eigen::MatrixXd F_, G_, Q_, R_;
    Eigen::MatrixXd P_;
    Eigen::MatrixXd PG2_;
    double gamma_;

    void solve();
};
