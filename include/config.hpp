#pragma once

// ============================================================
// 제어 주기 설정
// ============================================================
constexpr double MJ_HZ          = 1000.0;           // MuJoCo 시뮬레이션 주기
constexpr double MJ_TIMESTEP    = 1.0 / MJ_HZ;
constexpr double CONTROL_HZ     = 1000.0;           // CLF-QP 주기
constexpr double CONTROL_DT     = 1.0 / CONTROL_HZ;

// ============================================================
// 로봇 구성
// ============================================================
constexpr int    NUM_FEET       = 4;                // LF, RF, LH, RH
constexpr int    BODY_TASK_DIM  = 6;                // [rpy; p_body]
constexpr int    FOOT_TASK_DIM  = 3;                // 스윙발 위치 [x, y, z]
constexpr double GRAVITY        = 9.81;

// ============================================================
// CLF (Lyapunov 인증서)
// ============================================================
// Q = CLF_Q_WEIGHT * I, R = CLF_R_WEIGHT * I
constexpr double CLF_Q_WEIGHT   = 100.0;
constexpr double CLF_R_WEIGHT   = 1.0;

// ============================================================
// QP 가중치
// ============================================================
constexpr double TRACKING_WEIGHT = 1.0;             // ||J*vd + Jdv - xdd_nom||^2
constexpr double VDOT_WEIGHT     = 1.0;             // 2*eta'PGJ*vd

// 정규화 (Hessian 양정치 보장용)
constexpr double REG_VD         = 1e-6;
constexpr double REG_TAU        = 1e-6;
constexpr double REG_FORCE      = 1e-6;
constexpr double REG_DELTA      = 1e-4;

// ============================================================
// 접촉
// ============================================================
// 마찰 계수 (지면 static friction)
constexpr double FRICTION_MU    = 0.7;

// no-slip 감쇠: J_c*vd + Jdv_c = -NO_SLIP_DAMPING * J_c*v
// 0이면 순수 가속도 구속
constexpr double NO_SLIP_DAMPING = 0.0;

// ============================================================
// ProxQP 설정
// ============================================================
constexpr double QP_EPS_ABS     = 1e-6;
constexpr double QP_EPS_REL     = 0.0;
constexpr int    QP_MAX_ITER    = 1000;
constexpr double QP_INF         = 1e20;             // proxsuite infinite bound

// ============================================================
// 스윙 궤적 (데모 / 시나리오용)
// ============================================================
constexpr double SWING_BEZIER_HEIGHT = 0.05;      // Bezier 중간 제어점 높이, 실제 최고점 = 0.625 * h
constexpr double SWING_TIME     = 0.5;
