#pragma once

#include <Eigen/Dense>
#include <pinocchio/multibody/model.hpp>
#include <pinocchio/multibody/data.hpp>
#include <string>

// 매 틱 읽기 전용 스냅샷 (Pinocchio 규약: q = [p, quat(xyzw), joints], v = [v_local, w_local, dq])
struct RobotState {
    Eigen::VectorXd q;
    Eigen::VectorXd v;
};

// M*vd + Cv + tau_g = S'*tau + sum(J_c' f)
struct DynamicsQuantities {
    Eigen::MatrixXd M;      // nv x nv
    Eigen::VectorXd Cv;     // nv
    Eigen::VectorXd tau_g;  // nv
    Eigen::MatrixXd S;      // na x nv
};

// 추적 프레임의 위치/자세, 자코비안, 바이어스 가속도 (Jdot*v)
// 6행 자코비안은 [각속도; 선속도] 순서, LOCAL_WORLD_ALIGNED
struct FrameKinematics {
    Eigen::Matrix3d R;
    Eigen::Vector3d p;
    Eigen::MatrixXd J;      // 6 x nv (body) 또는 3 x nv (point)
    Eigen::VectorXd Jdv;    // 6 또는 3
};

// ============================================================
// Dynamics Provider (Pinocchio)
//
// 인스턴스마다 pinocchio::Model 복사본과 Data 를 하나씩 소유
// 호출 순서: updateKinematics(q, v) → bodyKinematics / pointKinematics
// ============================================================

class RobotDynamics {
public:
    explicit RobotDynamics(const pinocchio::Model& model);

    DynamicsQuantities computeDynamics(const Eigen::VectorXd& q,
                                       const Eigen::VectorXd& v);

    // 순기구학 + 관절 자코비안 + 바이어스 가속도 (a = 0) 갱신
    void updateKinematics(const Eigen::VectorXd& q, const Eigen::VectorXd& v);

    FrameKinematics bodyKinematics(int frame_id);
    FrameKinematics pointKinematics(int frame_id);

    // 없는 프레임이면 std::invalid_argument
    int getFrameId(const std::string& name) const;

    int nq() const { return model_.nq; }
    int nv() const { return model_.nv; }
    int na() const { return model_.nv - 6; }

private:
    pinocchio::Model model_;
    pinocchio::Data data_;
    Eigen::MatrixXd S_;
};
