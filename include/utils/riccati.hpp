#pragma once
#include <Eigen/Dense>
#include <optional>

namespace quadclf {

// 연속 대수 Riccati 방정식 (CARE)
//   F'P + PF - P G R^{-1} G' P + Q = 0
//
// Hamiltonian 행렬 부호 함수(sign function) 방법:
//   H = [ F   -G R^{-1} G' ]
//       [ -Q  -F'          ]
//   W = sign(H),  [W12; W22 + I] P = -[W11 + I; W21]
//
// (F, G) 가 안정화 불가능하거나 해가 대칭 양정치가 아니면 std::nullopt
std::optional<Eigen::MatrixXd> solveCare(const Eigen::MatrixXd& F,
                                         const Eigen::MatrixXd& G,
                                         const Eigen::MatrixXd& Q,
                                         const Eigen::MatrixXd& R);

// ||F'P + PF - P G R^{-1} G' P + Q||_inf
double careResidual(const Eigen::MatrixXd& F,
                    const Eigen::MatrixXd& G,
                    const Eigen::MatrixXd& Q,
                    const Eigen::MatrixXd& R,
                    const Eigen::MatrixXd& P);

} // namespace quadclf
