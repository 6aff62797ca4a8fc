#include "motor_model.hpp"
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace dc_motor {

namespace {

void requireFinite(const char* name, double value) {
    if (!std::isfinite(value)) {
        std::ostringstream oss;
        oss << "Invalid motor parameter " << name << " = " << value << ": must be finite";
        throw InvalidParameterError(oss.str());
    }
}

void requirePositive(const char* name, double value) {
    requireFinite(name, value);
    if (value <= 0.0) {
        std::ostringstream oss;
        oss << "Invalid motor parameter " << name << " = " << value << ": must be > 0";
        throw InvalidParameterError(oss.str());
    }
}

void requireNonNegative(const char* name, double value) {
    requireFinite(name, value);
    if (value < 0.0) {
        std::ostringstream oss;
        oss << "Invalid motor parameter " << name << " = " << value << ": must be >= 0";
        throw InvalidParameterError(oss.str());
    }
}

}

MotorModel::MotorModel(const MotorParameters& params)
    : params_(params) {
    validate();
    computeDerived();
}

void MotorModel::validate() const {
    requirePositive("V_nom", params_.V_nom);
    requirePositive("P", params_.P);
    requirePositive("R", params_.R);
    requireNonNegative("L", params_.L);
    requireNonNegative("I_0", params_.I_0);
    requirePositive("w_0", params_.w_0);
    requirePositive("J", params_.J);

    // I_0 < V/R 且 V - I_0*R > 0 (两者在舍入下不等价)
    double I_stall = params_.V_nom / params_.R;
    double back_emf = params_.V_nom - params_.I_0 * params_.R;
    if (params_.I_0 >= I_stall || !(back_emf > 0.0) || !(back_emf / params_.w_0 > 0.0)) {
        std::ostringstream oss;
        oss.precision(17);
        oss << "Invalid motor parameter I_0 = " << params_.I_0
            << ": must be below the stall current V_nom/R = " << I_stall;
        throw InvalidParameterError(oss.str());
    }
}

void MotorModel::computeDerived() {
    const MotorParameters& p = params_;
    derived_.I_stall = p.V_nom / p.R;
    derived_.k_t = (p.V_nom - p.I_0 * p.R) / p.w_0;
    derived_.tau_stall = derived_.k_t * derived_.I_stall;
    derived_.tau_e = p.L / p.R;
    derived_.tau_m = (p.R * p.J) / (derived_.k_t * derived_.k_t);
}

void MotorModel::requireTorqueConstant(const char* op) const {
    if (derived_.k_t == 0.0) {
        throw DegenerateModelError(std::string(op) + ": torque constant k_t is zero");
    }
}

void MotorModel::requireInductance(const char* op) const {
    if (params_.L == 0.0) {
        throw DegenerateModelError(std::string(op) + ": terminal inductance L is zero, electrical dynamics undefined");
    }
}

double MotorModel::torque(double current) const {
    return derived_.k_t * (current - params_.I_0);
}

double MotorModel::speed(double current, double voltage) const {
    requireTorqueConstant("speed");
    return (voltage - current * params_.R) / derived_.k_t;
}

double MotorModel::currentForTorque(double torque) const {
    requireTorqueConstant("currentForTorque");
    return torque / derived_.k_t + params_.I_0;
}

double MotorModel::voltageForOperatingPoint(double current, double speed) const {
    return current * params_.R + derived_.k_t * speed;
}

double MotorModel::powerOutput(double torque, double speed) const {
    return torque * speed;
}

double MotorModel::powerInput(double voltage, double current) const {
    return voltage * current;
}

Efficiency MotorModel::efficiency(double voltage, double current, double speed) const {
    double p_in = powerInput(voltage, current);
    if (p_in == 0.0) {
        std::ostringstream oss;
        oss << "efficiency: input power V*I is zero (V = " << voltage << ", I = " << current << ")";
        throw DegenerateModelError(oss.str());
    }
    Efficiency eta;
    eta.value = powerOutput(torque(current), speed) / p_in;
    eta.within_bounds = (eta.value >= 0.0 && eta.value <= 1.0);
    return eta;
}

double MotorModel::speedConstant() const {
    requireTorqueConstant("speedConstant");
    return 1.0 / derived_.k_t;
}

double MotorModel::motorConstant() const {
    return derived_.k_t / std::sqrt(params_.R);
}

double MotorModel::maxContinuousCurrent() const {
    return std::sqrt(params_.P / params_.R);
}

double MotorModel::maxContinuousTorque() const {
    return torque(maxContinuousCurrent());
}

double MotorModel::shortCircuitDamping() const {
    return derived_.k_t * derived_.k_t / params_.R;
}

double MotorModel::maxMechanicalPower() const {
    // P_out(I) = (I - I_0)(V - I*R), 极值在 I = (I_stall + I_0)/2
    double half_span = (derived_.I_stall - params_.I_0) / 2.0;
    return params_.R * half_span * half_span;
}

double MotorModel::maxEfficiency() const {
    double root = std::sqrt(params_.I_0 / derived_.I_stall);
    return (1.0 - root) * (1.0 - root);
}

double MotorModel::maxEfficiencyCurrent() const {
    return std::sqrt(params_.I_0 * derived_.I_stall);
}

OperatingPoint MotorModel::evaluate(double current, double voltage) const {
    OperatingPoint op;
    op.current = current;
    op.voltage = voltage;
    op.speed = speed(current, voltage);
    op.torque = torque(current);
    op.power_input = powerInput(voltage, current);
    op.power_output = powerOutput(op.torque, op.speed);
    op.efficiency = efficiency(voltage, current, op.speed);
    return op;
}

Eigen::MatrixXd MotorModel::characteristicCurve(double voltage, int n) const {
    if (n < 2) {
        throw std::invalid_argument("characteristicCurve: need at least 2 sample points, got " + std::to_string(n));
    }
    if (!(voltage > 0.0) || !std::isfinite(voltage)) {
        throw std::invalid_argument("characteristicCurve: voltage must be positive and finite");
    }
    requireTorqueConstant("characteristicCurve");

    const double i_begin = params_.I_0;
    const double i_end = voltage / params_.R;
    if (i_end <= i_begin) {
        std::ostringstream oss;
        oss << "characteristicCurve: stall current at " << voltage
            << " V (" << i_end << " A) does not exceed the no-load current";
        throw std::invalid_argument(oss.str());
    }

    const double k_t = derived_.k_t;
    const double R = params_.R;
    const double I_0 = params_.I_0;
    const double step = (i_end - i_begin) / (n - 1);

    Eigen::MatrixXd curve(n, CURVE_COLS);

    // 各行互相独立
    #pragma omp parallel for if(n > 256)
    for (int i = 0; i < n; ++i) {
        double I = (i == n - 1) ? i_end : i_begin + step * i;
        double w = (voltage - I * R) / k_t;
        double tau = k_t * (I - I_0);
        double p_out = tau * w;
        double p_in = voltage * I;
        curve(i, CURVE_CURRENT) = I;
        curve(i, CURVE_SPEED) = w;
        curve(i, CURVE_TORQUE) = tau;
        curve(i, CURVE_POWER_OUT) = p_out;
        // I = 0 处效率无定义, 记为 NaN
        curve(i, CURVE_EFFICIENCY) = (p_in == 0.0) ? std::numeric_limits<double>::quiet_NaN() : p_out / p_in;
    }
    return curve;
}

Eigen::Matrix2d MotorModel::stateMatrix() const {
    requireInductance("stateMatrix");
    const double k_t = derived_.k_t;
    Eigen::Matrix2d A;
    A << -params_.R / params_.L, -k_t / params_.L,
         k_t / params_.J,        0.0;
    return A;
}

Eigen::Matrix2d MotorModel::inputMatrix() const {
    requireInductance("inputMatrix");
    Eigen::Matrix2d B;
    B << 1.0 / params_.L, 0.0,
         0.0,             -1.0 / params_.J;
    return B;
}

Eigen::Vector2d MotorModel::frictionOffset() const {
    requireInductance("frictionOffset");
    return Eigen::Vector2d(0.0, -derived_.k_t * params_.I_0 / params_.J);
}

Eigen::Vector2cd MotorModel::poles() const {
    Eigen::EigenSolver<Eigen::Matrix2d> solver(stateMatrix());
    return solver.eigenvalues();
}

Eigen::Vector2d MotorModel::steadyState(double voltage, double load_torque) const {
    requireTorqueConstant("steadyState");
    const double k_t = derived_.k_t;

    // R*I + k_t*omega = V
    // k_t*I           = tau_load + k_t*I_0
    Eigen::Matrix2d M;
    M << params_.R, k_t,
         k_t,       0.0;
    Eigen::Vector2d rhs(voltage, load_torque + k_t * params_.I_0);
    return M.partialPivLu().solve(rhs);
}

}
