#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <memory>

#include "whole_body_controller/clf_qp_controller.hpp"
#include "trajectory_planner/swing_trajectory.hpp"
#include "quadruped_fixture.hpp"

using namespace quadclf_test;

// 폐루프: 제어기 vd 를 그대로 적분 (접촉은 no-slip 구속으로만 유지)
class ScenarioTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        model_ = buildQuadruped();
        ctrl_  = std::make_unique<ClfQpController>(model_, "base", footFrames());

        state_.q = nominalConfiguration(model_);
        state_.v = Eigen::VectorXd::Zero(model_.nv);
        stand_   = standingSetpoint(model_, state_.q);
    }

    pinocchio::Model model_;
    std::unique_ptr<ClfQpController> ctrl_;
    RobotState state_;
    TrajectorySetpoint stand_;
};

// 네 발 지지, 목표 자세에서 약간 벗어난 초기 상태 → V 단조 감소
TEST_F(ScenarioTest, StaticStanceConverges)
{
    TrajectorySetpoint sp = stand_;
    sp.p_body.z() += 0.01;
    sp.rpy_body.x() += 0.02;

    const int ticks = static_cast<int>(1.0 / CONTROL_DT);
    double V0 = 0.0, V_prev = 0.0;
    double tau_max_seen = 0.0;

    for (int k = 0; k < ticks; ++k) {
        ClfQpSolution sol = ctrl_->update(state_, sp);

        ASSERT_LE(sol.delta, 1e-6) << "tick " << k;
        ASSERT_LE(sol.Vdot, -sol.gamma * sol.V + sol.delta + 1e-5) << "tick " << k;

        if (k == 0) V0 = sol.V;
        else        ASSERT_LE(sol.V, V_prev + 1e-9) << "tick " << k;
        V_prev = sol.V;
        tau_max_seen = std::max(tau_max_seen, sol.tau.cwiseAbs().maxCoeff());

        stepIdeal(model_, state_, sol.vd, CONTROL_DT);
    }

    EXPECT_GT(V0, 0.0);
    EXPECT_LT(V_prev, 0.5 * V0);

    // 지지 토크: 다리 무게 수준 (수십 Nm 이하)
    EXPECT_LT(tau_max_seen, 50.0);
}

// LF 수직 들어올렸다 내려놓기, 나머지 세 발 지지
TEST_F(ScenarioTest, SingleSwingFootTracksLiftAndPlace)
{
    const int lf = 0;
    SwingTrajectory swing(stand_.p_feet[lf], 0.0, SWING_TIME, SWING_BEZIER_HEIGHT);

    const int ticks = static_cast<int>((SWING_TIME + 0.1) / CONTROL_DT);
    double max_swing_err = 0.0;
    double max_contact_acc = 0.0;
    double peak_z = 0.0;

    for (int k = 0; k < ticks; ++k) {
        const double t = k * CONTROL_DT;

        TrajectorySetpoint sp = stand_;
        if (swing.isSwinging(t)) {
            SwingSample s = swing.sample(t);
            sp.contact[lf]  = false;
            sp.p_feet[lf]   = s.pos;
            sp.pd_feet[lf]  = s.vel;
            sp.pdd_feet[lf] = s.acc;
        }

        TaskSpaceError err = ctrl_->computeTaskError(state_, sp);
        ClfQpSolution sol  = ctrl_->update(state_, sp);

        ASSERT_LE(sol.delta, 1e-6) << "tick " << k;

        if (err.numSwing() == 1) {
            ASSERT_EQ(err.numContact(), 3);
            max_swing_err = std::max(max_swing_err, err.x_tilde.segment<3>(6).norm());
            peak_z = std::max(peak_z, err.x(8));
        }

        // 접촉발 상대 가속도 = 0
        Eigen::VectorXd contact_acc = err.J_c * sol.vd + err.Jdv_c;
        max_contact_acc = std::max(max_contact_acc, contact_acc.cwiseAbs().maxCoeff());

        stepIdeal(model_, state_, sol.vd, CONTROL_DT);
    }

    EXPECT_LT(max_swing_err, 5e-3);
    EXPECT_LT(max_contact_acc, 1e-4);
    EXPECT_NEAR(peak_z, stand_.p_feet[lf].z() + 0.625 * SWING_BEZIER_HEIGHT, 5e-3);

    // 착지 후 LF 는 시작 위치로 복귀, 몸통은 제자리
    TrajectorySetpoint check = stand_;
    check.contact[lf] = false;
    TaskSpaceError final_err = ctrl_->computeTaskError(state_, check);
    EXPECT_LT(final_err.x_tilde.norm(), 5e-3);
}
