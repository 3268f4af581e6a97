#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <memory>

#include "whole_body_controller/clf_qp_controller.hpp"
#include "quadruped_fixture.hpp"

using namespace quadclf_test;

class ClfQpControllerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        model_ = buildQuadruped();
        ctrl_  = std::make_unique<ClfQpController>(model_, "base", footFrames());

        state_.q = nominalConfiguration(model_);
        state_.v = Eigen::VectorXd::Zero(model_.nv);
        stand_   = standingSetpoint(model_, state_.q);
    }

    void expectFrictionSatisfied(const ClfQpSolution& sol, double mu) const
    {
        const double mu_eff = mu / std::sqrt(2.0);
        for (const auto& f : sol.forces) {
            EXPECT_GE(f.z(), -1e-6);
            EXPECT_LE(std::abs(f.x()), mu_eff * f.z() + 1e-5);
            EXPECT_LE(std::abs(f.y()), mu_eff * f.z() + 1e-5);
            EXPECT_LE(f.head<2>().norm(), mu * f.z() + 1e-5);
        }
    }

    pinocchio::Model model_;
    std::unique_ptr<ClfQpController> ctrl_;
    RobotState state_;
    TrajectorySetpoint stand_;
};

TEST_F(ClfQpControllerTest, CertificatePerSwingCount)
{
    ASSERT_EQ(ctrl_->numFeet(), 4);
    for (int ns = 0; ns <= 4; ++ns) {
        EXPECT_EQ(ctrl_->getCertificate(ns).taskDim(), 6 + 3 * ns);
        EXPECT_GT(ctrl_->getCertificate(ns).getGamma(), 0.0);
    }
    EXPECT_THROW(ctrl_->getCertificate(5), std::out_of_range);
}

// eta = 0: V = 0, CLF 제약은 delta >= 0 으로 축소 → delta = 0
TEST_F(ClfQpControllerTest, ZeroErrorStance)
{
    ClfQpSolution sol = ctrl_->update(state_, stand_);

    EXPECT_NEAR(sol.V, 0.0, 1e-12);
    EXPECT_NEAR(sol.delta, 0.0, 1e-6);
    EXPECT_NEAR(sol.tracking_error, 0.0, 1e-12);
    EXPECT_EQ(sol.tau.size(), 12);
    EXPECT_EQ(sol.vd.size(), 18);
    ASSERT_EQ(sol.contact_feet.size(), 4u);
    ASSERT_EQ(sol.forces.size(), 4u);

    // 정지: 수직력 합 = 전체 무게
    double fz = 0.0;
    for (const auto& f : sol.forces) fz += f.z();
    EXPECT_NEAR(fz, totalMass() * GRAVITY, 0.5);
    EXPECT_LT(sol.vd.norm(), 1e-3);

    expectFrictionSatisfied(sol, FRICTION_MU);

    Eigen::VectorXd r = dynamicsResidual(model_, state_, sol.vd, sol.tau, sol.contact_feet, sol.forces);
    EXPECT_LT(r.cwiseAbs().maxCoeff(), 1e-4);
}

TEST_F(ClfQpControllerTest, PerturbedStanceSatisfiesDecreaseCondition)
{
    TrajectorySetpoint sp = stand_;
    sp.p_body.z() += 0.01;
    sp.rpy_body.x() += 0.02;

    ClfQpSolution sol = ctrl_->update(state_, sp);

    EXPECT_GT(sol.V, 0.0);
    EXPECT_LE(sol.delta, 1e-6);
    EXPECT_LE(sol.Vdot, -sol.gamma * sol.V + sol.delta + 1e-5);
    EXPECT_NEAR(sol.tracking_error, std::hypot(0.01, 0.02), 1e-9);

    expectFrictionSatisfied(sol, FRICTION_MU);
    Eigen::VectorXd r = dynamicsResidual(model_, state_, sol.vd, sol.tau, sol.contact_feet, sol.forces);
    EXPECT_LT(r.cwiseAbs().maxCoeff(), 1e-4);
}

// 접촉발 없음: 마찰/no-slip 없음, 기저 6행은 토크 없이 M*vd + h = 0
TEST_F(ClfQpControllerTest, NoContactFreeFall)
{
    TrajectorySetpoint sp = stand_;
    std::fill(sp.contact.begin(), sp.contact.end(), false);

    ClfQpSolution sol = ctrl_->update(state_, sp);

    EXPECT_TRUE(sol.forces.empty());
    EXPECT_TRUE(sol.contact_feet.empty());
    EXPECT_EQ(ctrl_->computeTaskError(state_, sp).taskDim(), 18);

    Eigen::VectorXd r = dynamicsResidual(model_, state_, sol.vd, sol.tau, {}, {});
    EXPECT_LT(r.cwiseAbs().maxCoeff(), 1e-4);

    // 전체 질량 중심은 중력 가속도로 낙하
    RobotDynamics dyn(model_);
    DynamicsQuantities d = dyn.computeDynamics(state_.q, state_.v);
    Eigen::Vector3d momentum_rate = (d.M * sol.vd).head<3>();
    EXPECT_NEAR(momentum_rate.z() / totalMass(), -GRAVITY, 1e-3);
}

TEST_F(ClfQpControllerTest, TorqueLimitsRespected)
{
    Eigen::VectorXd tau_max = Eigen::VectorXd::Constant(12, 30.0);
    ctrl_->setTorqueLimits(tau_max);

    TrajectorySetpoint sp = stand_;
    sp.p_body.z() += 0.01;
    ClfQpSolution sol = ctrl_->update(state_, sp);
    EXPECT_LE(sol.tau.cwiseAbs().maxCoeff(), 30.0 + 1e-5);

    EXPECT_THROW(ctrl_->setTorqueLimits(Eigen::VectorXd::Constant(11, 30.0)), std::invalid_argument);
    EXPECT_THROW(ctrl_->setTorqueLimits(Eigen::VectorXd::Constant(12, -1.0)), std::invalid_argument);
}

// V_dot 비용 가중치 증가 → 최적 V_dot 은 증가하지 않고 나머지 비용은 감소하지 않음
TEST_F(ClfQpControllerTest, LyapunovWeightTradeOff)
{
    TrajectorySetpoint sp = stand_;
    sp.p_body.z() += 0.01;
    sp.rpy_body.y() -= 0.02;

    TaskSpaceError err = ctrl_->computeTaskError(state_, sp);
    auto trackingCost = [&](const ClfQpSolution& sol) {
        return (err.J * sol.vd + err.Jdv - err.xdd_nom).squaredNorm();
    };

    double prev_vdot = 0.0, prev_tracking = 0.0;
    bool first = true;
    for (double w : {0.25, 1.0, 4.0}) {
        ctrl_->setVdotWeight(w);
        ClfQpSolution sol = ctrl_->update(state_, sp);
        const double tracking = trackingCost(sol);

        if (!first) {
            EXPECT_LE(sol.Vdot, prev_vdot + 1e-5) << "w=" << w;
            EXPECT_GE(tracking, prev_tracking - 1e-5) << "w=" << w;
        }
        prev_vdot = sol.Vdot;
        prev_tracking = tracking;
        first = false;
    }
}

// 마찰 0 + 토크 0: 접선력 / 관절 토크 없이 정지 불가 → 풀이 실패는 치명적 오류
TEST_F(ClfQpControllerTest, InfeasibleTickThrows)
{
    ctrl_->setFriction(0.0);
    ctrl_->setTorqueLimits(Eigen::VectorXd::Zero(12));

    EXPECT_THROW(ctrl_->update(state_, stand_), QpSolveError);
}

TEST_F(ClfQpControllerTest, MalformedInputsRejected)
{
    RobotState bad = state_;
    bad.v.conservativeResize(10);
    EXPECT_THROW(ctrl_->update(bad, stand_), std::invalid_argument);

    TrajectorySetpoint sp = stand_;
    sp.contact.pop_back();
    EXPECT_THROW(ctrl_->update(state_, sp), std::invalid_argument);

    EXPECT_THROW(ClfQpController(model_, "no_body", footFrames()), std::invalid_argument);
    EXPECT_THROW(ClfQpController(model_, "base", {}), std::invalid_argument);

    EXPECT_THROW(ctrl_->setFriction(-0.1), std::invalid_argument);
    EXPECT_THROW(ctrl_->setNoSlipDamping(-1.0), std::invalid_argument);
    EXPECT_NO_THROW(ctrl_->setFriction(0.0));
    EXPECT_NO_THROW(ctrl_->setNoSlipDamping(0.0));
}

// 모델 임시 객체로 생성한 제어기도 이후 틱에서 정상 동작
TEST_F(ClfQpControllerTest, ConstructedFromTemporaryModel)
{
    ClfQpController ctrl(buildQuadruped(), "base", footFrames());

    ClfQpSolution sol = ctrl.update(state_, stand_);
    ASSERT_EQ(sol.forces.size(), 4u);

    double fz = 0.0;
    for (const auto& f : sol.forces) fz += f.z();
    EXPECT_NEAR(fz, totalMass() * GRAVITY, 0.5);
}

// V_dot 가중치 고정, 추적 가중치 증가 → 최적 추적 잔차는 증가하지 않음
TEST_F(ClfQpControllerTest, TrackingWeightReducesResidual)
{
    TrajectorySetpoint sp = stand_;
    sp.p_body.x() += 0.01;
    sp.rpy_body.z() += 0.03;

    TaskSpaceError err = ctrl_->computeTaskError(state_, sp);
    auto trackingCost = [&](const ClfQpSolution& sol) {
        return (err.J * sol.vd + err.Jdv - err.xdd_nom).squaredNorm();
    };

    ctrl_->setVdotWeight(1.0);
    double prev = 0.0;
    bool first = true;
    for (double w : {0.25, 1.0, 4.0, 16.0}) {
        ctrl_->setTrackingWeight(w);
        ClfQpSolution sol = ctrl_->update(state_, sp);
        const double tracking = trackingCost(sol);

        if (!first) EXPECT_LE(tracking, prev + 1e-5) << "w=" << w;
        prev = tracking;
        first = false;
    }
}

TEST_F(ClfQpControllerTest, NoSlipDampingChangesContactAcceleration)
{
    state_.v.head<3>() = Eigen::Vector3d(0.05, 0.0, 0.0);
    ctrl_->setNoSlipDamping(10.0);

    ClfQpSolution sol = ctrl_->update(state_, stand_);
    TaskSpaceError err = ctrl_->computeTaskError(state_, stand_);

    Eigen::VectorXd contact_acc = err.J_c * sol.vd + err.Jdv_c;
    Eigen::VectorXd expected    = -10.0 * err.J_c * state_.v;
    EXPECT_LT((contact_acc - expected).cwiseAbs().maxCoeff(), 1e-4);
}
