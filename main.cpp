// C++ API 기반 Mujoco + Pinocchio 공통
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#define COAL_DISABLE_HPP_FCL_WARNINGS
#include <pinocchio/parsers/urdf.hpp>
#include <pinocchio/multibody/model.hpp>
#include <pinocchio/algorithm/center-of-mass.hpp>
#include <pinocchio/algorithm/kinematics.hpp>
#include <pinocchio/algorithm/frames.hpp>

#include <Eigen/Dense>
#include "mujoco/mujoco.h"
#include "GLFW/glfw3.h"

#include "config.hpp"
#include "utils/math_utils.hpp"
#include "whole_body_controller/clf_qp_controller.hpp"
#include "trajectory_planner/trajectory_setpoint.hpp"
#include "trajectory_planner/swing_trajectory.hpp"

// ── 프레임 이름 (ANYmal 계열 URDF) ─────────────────────────────
static const char* BODY_FRAME = "base";
static const std::vector<std::string> FOOT_FRAMES = {"LF_FOOT", "RF_FOOT", "LH_FOOT", "RH_FOOT"};
static const std::vector<std::string> LEGS        = {"LF", "RF", "LH", "RH"};

// ── 데모 계획 ─────────────────────────────────────────────────
constexpr double STAND_TIME   = 1.0;     // 이 시각까지 네 발 지지
constexpr int    SWING_FOOT   = 0;       // LF
constexpr double INIT_BASE_Z  = 0.7;

// ── GLFW 전역 ─────────────────────────────────────────────────
static mjModel* g_m = nullptr;
static mjData*  g_d = nullptr;
static mjvCamera cam; static mjvOption opt;
static mjvScene scn;  static mjrContext con;
static bool btn_l = false, btn_r = false;
static double lastx = 0, lasty = 0;
static bool reset_requested = false;   // Backspace: 초기 자세 + 데모 계획 처음부터

void keyboard(GLFWwindow*, int key, int, int act, int) {
    if (act == GLFW_PRESS && key == GLFW_KEY_BACKSPACE)
        reset_requested = true;
}
void mouse_button(GLFWwindow* w, int, int, int) {
    btn_l = (glfwGetMouseButton(w, GLFW_MOUSE_BUTTON_LEFT)  == GLFW_PRESS);
    btn_r = (glfwGetMouseButton(w, GLFW_MOUSE_BUTTON_RIGHT) == GLFW_PRESS);
    glfwGetCursorPos(w, &lastx, &lasty);
}
void mouse_move(GLFWwindow* w, double xpos, double ypos) {
    if (!btn_l && !btn_r) return;
    double dx = xpos - lastx, dy = ypos - lasty;
    lastx = xpos; lasty = ypos;
    int W, H; glfwGetWindowSize(w, &W, &H);
    bool shift = (glfwGetKey(w, GLFW_KEY_LEFT_SHIFT) == GLFW_PRESS);
    mjtMouse action = btn_r ? (shift ? mjMOUSE_MOVE_H : mjMOUSE_MOVE_V)
                             : (shift ? mjMOUSE_ROTATE_H : mjMOUSE_ROTATE_V);
    mjv_moveCamera(g_m, action, dx/H, dy/H, &scn, &cam);
}
void scroll(GLFWwindow*, double, double dy) {
    mjv_moveCamera(g_m, mjMOUSE_ZOOM, 0, -0.05*dy, &scn, &cam);
}

// ── MuJoCo ↔ Pinocchio 관절 대응 (이름 기준) ───────────────────
// Pinocchio 관절 j (>= 2) → MuJoCo qpos / qvel 주소, 액추에이터 id
struct JointMap {
    std::vector<int> qpos_adr;   // pin q 인덱스 7.. 순서
    std::vector<int> dof_adr;    // pin v 인덱스 6.. 순서
    std::vector<int> actuator;   // pin 액추에이터 순서
};

static JointMap buildJointMap(const mjModel* m, const pinocchio::Model& model)
{
    JointMap map;
    for (pinocchio::JointIndex j = 2; j < model.joints.size(); ++j) {
        const std::string& name = model.names[j];
        int jid = mj_name2id(m, mjOBJ_JOINT, name.c_str());
        if (jid < 0)
            throw std::invalid_argument("MuJoCo joint not found: " + name);

        int aid = -1;
        for (int a = 0; a < m->nu; ++a)
            if (m->actuator_trntype[a] == mjTRN_JOINT && m->actuator_trnid[2 * a] == jid) aid = a;
        if (aid < 0)
            throw std::invalid_argument("MuJoCo actuator not found for joint: " + name);

        map.qpos_adr.push_back(m->jnt_qposadr[jid]);
        map.dof_adr.push_back(m->jnt_dofadr[jid]);
        map.actuator.push_back(aid);
    }
    return map;
}

// MJ free joint: [p, quat(wxyz)], [v_world, w_local]
// Pin free-flyer: [p, quat(xyzw)], [v_local, w_local]
static RobotState mj2pin(const mjData* d, const JointMap& map, const pinocchio::Model& model)
{
    RobotState s;
    s.q.resize(model.nq);
    s.v.resize(model.nv);

    s.q[0]=d->qpos[0]; s.q[1]=d->qpos[1]; s.q[2]=d->qpos[2];
    s.q[3]=d->qpos[4]; s.q[4]=d->qpos[5]; s.q[5]=d->qpos[6]; s.q[6]=d->qpos[3];

    Eigen::Quaterniond quat(d->qpos[3], d->qpos[4], d->qpos[5], d->qpos[6]);
    Eigen::Vector3d v_world(d->qvel[0], d->qvel[1], d->qvel[2]);
    s.v.head<3>()     = quat.toRotationMatrix().transpose() * v_world;
    s.v.segment<3>(3) = Eigen::Vector3d(d->qvel[3], d->qvel[4], d->qvel[5]);

    for (size_t i = 0; i < map.qpos_adr.size(); ++i) {
        s.q[7 + i] = d->qpos[map.qpos_adr[i]];
        s.v[6 + i] = d->qvel[map.dof_adr[i]];
    }
    return s;
}

// 초기 자세: HAA 0, 앞다리 HFE 0.5 / KFE -0.8, 뒷다리 HFE -0.5 / KFE 0.8
static void setInitialPosture(mjModel* m, mjData* d)
{
    mj_resetData(m, d);
    d->qpos[0]=0.0; d->qpos[1]=0.0; d->qpos[2]=INIT_BASE_Z;
    d->qpos[3]=1.0; d->qpos[4]=0.0; d->qpos[5]=0.0; d->qpos[6]=0.0;

    for (const auto& leg : LEGS) {
        const bool front = (leg[1] == 'F');
        const double hfe = front ?  0.5 : -0.5;
        const double kfe = front ? -0.8 :  0.8;
        int haa_id = mj_name2id(m, mjOBJ_JOINT, (leg + "_HAA").c_str());
        int hfe_id = mj_name2id(m, mjOBJ_JOINT, (leg + "_HFE").c_str());
        int kfe_id = mj_name2id(m, mjOBJ_JOINT, (leg + "_KFE").c_str());
        if (haa_id >= 0) d->qpos[m->jnt_qposadr[haa_id]] = 0.0;
        if (hfe_id >= 0) d->qpos[m->jnt_qposadr[hfe_id]] = hfe;
        if (kfe_id >= 0) d->qpos[m->jnt_qposadr[kfe_id]] = kfe;
    }
    mj_forward(m, d);
}

// ── 디버그 시각화 헬퍼 ────────────────────────────────────────
static void drawSphere(mjvScene* scn, const Eigen::Vector3d& pos,
                        float radius, float r, float g, float b, float a = 0.9f)
{
    if (scn->ngeom >= scn->maxgeom) return;
    mjvGeom* geom = &scn->geoms[scn->ngeom++];
    mjv_initGeom(geom, mjGEOM_SPHERE, nullptr, nullptr, nullptr, nullptr);
    geom->size[0] = radius;
    geom->pos[0] = pos.x(); geom->pos[1] = pos.y(); geom->pos[2] = pos.z();
    geom->rgba[0] = r; geom->rgba[1] = g; geom->rgba[2] = b; geom->rgba[3] = a;
}

static void drawArrow(mjvScene* scn, const Eigen::Vector3d& from,
                       const Eigen::Vector3d& force, float width,
                       float r, float g, float b, float a = 0.8f)
{
    if (scn->ngeom >= scn->maxgeom) return;
    constexpr double SCALE = 0.002;
    Eigen::Vector3d to = from + force * SCALE;
    mjtNum f[3] = {from.x(), from.y(), from.z()};
    mjtNum t[3] = {to.x(),   to.y(),   to.z()};
    mjvGeom* geom = &scn->geoms[scn->ngeom++];
    mjv_initGeom(geom, mjGEOM_ARROW, nullptr, nullptr, nullptr, nullptr);
    mjv_connector(geom, mjGEOM_ARROW, width, f, t);
    geom->rgba[0] = r; geom->rgba[1] = g; geom->rgba[2] = b; geom->rgba[3] = a;
}

// ── 메인 ──────────────────────────────────────────────────────
int main(int argc, char** argv)
{
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <scene.xml> <robot.urdf>\n";
        return 2;
    }
    const char* mj_xml   = argv[1];
    const char* pin_urdf = argv[2];

    // MuJoCo 로드
    char err[1000] = {};
    g_m = mj_loadXML(mj_xml, nullptr, err, sizeof(err));
    if (!g_m) { std::cerr << "MuJoCo load failed: " << err << "\n"; return 1; }
    g_m->opt.timestep = MJ_TIMESTEP;
    g_d = mj_makeData(g_m);

    std::cout << "=== MuJoCo Model ===\n";
    std::cout << "  nq=" << g_m->nq << "  nv=" << g_m->nv << "  nu=" << g_m->nu << "\n";

    setInitialPosture(g_m, g_d);

    // Pinocchio 로드
    pinocchio::Model pin_model;
    try {
        pinocchio::urdf::buildModel(pin_urdf, pinocchio::JointModelFreeFlyer(), pin_model);
    } catch (const std::exception& e) {
        std::cerr << "[Pinocchio] 로드 실패: " << e.what() << "\n"; return 1;
    }

    std::cout << "=== Pinocchio Model ===\n";
    std::cout << "  nq=" << pin_model.nq << "  nv=" << pin_model.nv
              << "  na=" << (pin_model.nv - 6) << "\n";
    std::cout << "  총 질량: " << pinocchio::computeTotalMass(pin_model) << " kg\n";

    JointMap jmap;
    try {
        jmap = buildJointMap(g_m, pin_model);
    } catch (const std::exception& e) {
        std::cerr << "[JointMap] " << e.what() << "\n"; return 1;
    }

    // 컨트롤러 (인증서 계산 실패 / 프레임 없음 → 종료)
    std::unique_ptr<ClfQpController> ctrl;
    try {
        ctrl = std::make_unique<ClfQpController>(pin_model, BODY_FRAME, FOOT_FRAMES);
    } catch (const std::exception& e) {
        std::cerr << "[ClfQpController] 초기화 실패: " << e.what() << "\n"; return 1;
    }

    std::cout << "=== CLF-QP 초기화 완료 ===\n";
    for (int ns = 0; ns <= ctrl->numFeet(); ++ns)
        std::cout << "  swing=" << ns << "  gamma=" << ctrl->getCertificate(ns).getGamma() << "\n";

    // 기준 setpoint: FK 기반 초기 몸통 자세/위치, 초기 발 위치
    RobotState s0 = mj2pin(g_d, jmap, pin_model);
    pinocchio::Data pin_data(pin_model);
    pinocchio::forwardKinematics(pin_model, pin_data, s0.q);
    pinocchio::updateFramePlacements(pin_model, pin_data);

    const auto& oMb = pin_data.oMf[pin_model.getFrameId(BODY_FRAME)];
    Eigen::Vector3d rpy0 = quadclf::rpyFromRotation(oMb.rotation());
    Eigen::Vector3d p0   = oMb.translation();
    std::vector<Eigen::Vector3d> feet0;
    for (const auto& name : FOOT_FRAMES)
        feet0.push_back(pin_data.oMf[pin_model.getFrameId(name)].translation());

    std::cout << "  초기 몸통 : " << p0.transpose() << "\n";

    SwingTrajectory swing(feet0[SWING_FOOT], STAND_TIME);

    // GLFW 뷰어
    if (!glfwInit()) { std::cerr << "GLFW init failed\n"; return 1; }
    GLFWwindow* window = glfwCreateWindow(1200, 900, "QuadCLF - CLF-QP", nullptr, nullptr);
    if (!window) {
        std::cerr << "GLFW window creation failed\n";
        glfwTerminate();
        mj_deleteData(g_d); mj_deleteModel(g_m);
        return 1;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(0);
    glfwSetKeyCallback(window, keyboard);
    glfwSetMouseButtonCallback(window, mouse_button);
    glfwSetCursorPosCallback(window, mouse_move);
    glfwSetScrollCallback(window, scroll);

    mjv_defaultCamera(&cam); mjv_defaultOption(&opt);
    mjv_defaultScene(&scn);  mjr_defaultContext(&con);
    mjv_makeScene(g_m, &scn, 5000);
    mjr_makeContext(g_m, &con, mjFONTSCALE_150);
    cam.distance = 2.5; cam.elevation = -20; cam.azimuth = 140;

    opt.flags[mjVIS_CONTACTFORCE] = 1;
    opt.flags[mjVIS_CONTACTPOINT] = 1;

    // ── 메인 루프 ──
    int exit_code = 0;
    int print_cnt = 0;
    double sim_time = 0.0;
    ClfQpSolution sol;

    while (!glfwWindowShouldClose(window))
    {
        if (reset_requested) {
            setInitialPosture(g_m, g_d);
            sim_time = 0.0;
            reset_requested = false;
        }

        // ① 상태 읽기
        RobotState state = mj2pin(g_d, jmap, pin_model);

        // ② setpoint: 정지 → LF 들어올렸다 내려놓기 → 정지
        TrajectorySetpoint sp = TrajectorySetpoint::standing(rpy0, p0, feet0);
        if (swing.isSwinging(sim_time)) {
            SwingSample s = swing.sample(sim_time);
            sp.contact[SWING_FOOT]  = false;
            sp.p_feet[SWING_FOOT]   = s.pos;
            sp.pd_feet[SWING_FOOT]  = s.vel;
            sp.pdd_feet[SWING_FOOT] = s.acc;
        }

        // ③ CLF-QP 1kHz, 실패 시 즉시 중단
        try {
            sol = ctrl->update(state, sp);
        } catch (const QpSolveError& e) {
            std::cerr << "[main] t=" << sim_time << " " << e.what() << "\n";
            exit_code = 3;
            break;
        }

        for (size_t i = 0; i < jmap.actuator.size(); ++i)
            g_d->ctrl[jmap.actuator[i]] = sol.tau(i);

        // ④ 시뮬 전진
        mj_step(g_m, g_d);
        sim_time += MJ_TIMESTEP;

        // 출력 (500 스텝마다)
        if (++print_cnt % 500 == 0) {
            std::cout << "\n[t=" << sim_time << "]\n";
            std::cout << "  V=" << sol.V << "  Vdot=" << sol.Vdot
                      << "  delta=" << sol.delta << "  |x~|=" << sol.tracking_error << "\n";
            std::cout << "  [timing] QP=" << sol.solve_us << "us"
                      << (sol.deadline_missed ? "  (deadline miss)" : "") << "\n";
        }

        mjrRect vp = {0,0,0,0};
        glfwGetFramebufferSize(window, &vp.width, &vp.height);
        mjv_updateScene(g_m, g_d, &opt, nullptr, &cam, mjCAT_ALL, &scn);

        // ── 커스텀 시각화 ──
        // 스윙발 목표 위치
        if (!sp.contact[SWING_FOOT])
            drawSphere(&scn, sp.p_feet[SWING_FOOT], 0.02f, 1.0f, 0.3f, 0.0f);

        // QP 접촉력 (접촉발 목표 위치 기준)
        for (size_t k = 0; k < sol.contact_feet.size(); ++k)
            drawArrow(&scn, sp.p_feet[sol.contact_feet[k]], sol.forces[k], 0.01f, 0.0f, 1.0f, 1.0f);

        mjr_render(vp, &scn, &con);
        glfwSwapBuffers(window);
        glfwPollEvents();
    }

    mjv_freeScene(&scn); mjr_freeContext(&con);
    mj_deleteData(g_d);  mj_deleteModel(g_m);
    glfwTerminate();
    return exit_code;
}
