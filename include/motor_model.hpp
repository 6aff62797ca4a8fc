#pragma once
#include <Eigen/Dense>
#include "common.hpp"
#include "motor_errors.hpp"

namespace dc_motor {

class MotorModel {
public:
    // 参数非法时抛出 InvalidParameterError
    explicit MotorModel(const MotorParameters& params);

    const MotorParameters& parameters() const { return params_; }
    const DerivedConstants& derived() const { return derived_; }

    double torqueConstant() const { return derived_.k_t; }
    double stallCurrent() const { return derived_.I_stall; }
    double stallTorque() const { return derived_.tau_stall; }
    double electricalTimeConstant() const { return derived_.tau_e; }
    double mechanicalTimeConstant() const { return derived_.tau_m; }

    // 稳态工作点: tau = k_t*(I - I_0), V = I*R + k_t*omega
    double torque(double current) const;
    double speed(double current, double voltage) const;
    double currentForTorque(double torque) const;
    double voltageForOperatingPoint(double current, double speed) const;
    double powerOutput(double torque, double speed) const;
    double powerInput(double voltage, double current) const;
    Efficiency efficiency(double voltage, double current, double speed) const;

    // 其他特性 (均以 k_t 表示, 保持与上面的工作点一致)
    double backEmfConstant() const { return derived_.k_t; }
    double speedConstant() const;
    double motorConstant() const;
    double maxContinuousCurrent() const;
    double maxContinuousTorque() const;
    double shortCircuitDamping() const;
    double maxMechanicalPower() const;
    double maxEfficiency() const;
    double maxEfficiencyCurrent() const;

    OperatingPoint evaluate(double current, double voltage) const;
    OperatingPoint evaluate(double current) const { return evaluate(current, params_.V_nom); }

    // 从 I_0 到 V/R 均匀采样 n 个电流, 列见 common.hpp 中的 CURVE_*
    Eigen::MatrixXd characteristicCurve(double voltage, int n) const;
    Eigen::MatrixXd characteristicCurve(int n) const { return characteristicCurve(params_.V_nom, n); }

    // 线性状态空间: dx/dt = A*x + B*u + d, x = [I, omega], u = [V, tau_load]
    // L == 0 时抛出 DegenerateModelError
    Eigen::Matrix2d stateMatrix() const;
    Eigen::Matrix2d inputMatrix() const;
    Eigen::Vector2d frictionOffset() const;
    Eigen::Vector2cd poles() const;

    // 静态方程求解 [I, omega], 不依赖 L
    Eigen::Vector2d steadyState(double voltage, double load_torque) const;

private:
    void validate() const;
    void computeDerived();
    void requireTorqueConstant(const char* op) const;
    void requireInductance(const char* op) const;

    MotorParameters params_;
    DerivedConstants derived_;
};

}
