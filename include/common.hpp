#pragma once

#include <Eigen/Dense>

namespace dc_motor {
    // 状态: [I(电枢电流), omega(转子角速度)]
    constexpr int STATE_DIM = 2;
    // 输入: [V(端电压), tau_load(负载力矩)]
    constexpr int INPUT_DIM = 2;

    // characteristicCurve() 的列
    constexpr int CURVE_CURRENT = 0;
    constexpr int CURVE_SPEED = 1;
    constexpr int CURVE_TORQUE = 2;
    constexpr int CURVE_POWER_OUT = 3;
    constexpr int CURVE_EFFICIENCY = 4;
    constexpr int CURVE_COLS = 5;

    // 铭牌参数 (默认值: 12V 小型有刷电机)
    struct MotorParameters {
        double V_nom = 12.0;   // 额定电压 [V]
        double P = 20.0;       // 额定功率 [W]
        double R = 2.0;        // 端电阻 [Ohm]
        double L = 1.0e-3;     // 端电感 [H]
        double I_0 = 0.2;      // 空载电流 [A]
        double w_0 = 300.0;    // 空载角速度 [rad/s]
        double J = 1.0e-5;     // 转子惯量 [kg*m^2]
    };

    struct DerivedConstants {
        double k_t = 0.0;        // 力矩常数 [N*m/A] (= k_e [V*s/rad])
        double I_stall = 0.0;    // 堵转电流 [A]
        double tau_stall = 0.0;  // 堵转力矩 [N*m]
        double tau_e = 0.0;      // 电气时间常数 [s]
        double tau_m = 0.0;      // 机械时间常数 [s]
    };

    // value 不做截断, 超出 [0,1] 时 within_bounds = false
    struct Efficiency {
        double value = 0.0;
        bool within_bounds = true;
    };

    struct OperatingPoint {
        double current = 0.0;       // A
        double voltage = 0.0;       // V
        double speed = 0.0;         // rad/s
        double torque = 0.0;        // N*m
        double power_input = 0.0;   // W
        double power_output = 0.0;  // W
        Efficiency efficiency;
    };
}
