// MotorModel 构造, 参数校验与导出常数

#include "motor_model.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

namespace {

int failures = 0;

void expectNear(const std::string& label, double actual, double expected, double tol) {
    if (std::abs(actual - expected) > tol) {
        std::cerr << "FAIL: " << label << " = " << actual << ", expected " << expected << std::endl;
        failures++;
    }
}

dc_motor::MotorParameters referenceMotor() {
    dc_motor::MotorParameters p;
    p.V_nom = 12.0;
    p.P = 20.0;
    p.R = 2.0;
    p.L = 1.0e-3;
    p.I_0 = 0.2;
    p.w_0 = 300.0;
    p.J = 1.0e-5;
    return p;
}

// 构造应当抛出 InvalidParameterError, 且信息中包含参数名
void expectInvalid(const std::string& label, const dc_motor::MotorParameters& p, const std::string& name) {
    try {
        dc_motor::MotorModel motor(p);
        std::cerr << "FAIL: " << label << " constructed without error" << std::endl;
        failures++;
    } catch (const dc_motor::InvalidParameterError& e) {
        if (std::string(e.what()).find(name) == std::string::npos) {
            std::cerr << "FAIL: " << label << " message does not name " << name << ": " << e.what() << std::endl;
            failures++;
        }
    }
}

}

int main() {
    std::cout << "=== MotorModel Construction Test ===" << std::endl;

    // Test 1: Reference motor derived constants
    std::cout << "\nTest 1: Derived constants of the 12 V reference motor..." << std::endl;
    dc_motor::MotorModel motor(referenceMotor());
    const dc_motor::DerivedConstants& d = motor.derived();

    const double k_t = (12.0 - 0.2 * 2.0) / 300.0;
    expectNear("I_stall", d.I_stall, 6.0, 1e-12);
    expectNear("k_t", d.k_t, k_t, 1e-12);
    expectNear("k_t (rounded)", d.k_t, 0.03867, 1e-5);
    expectNear("tau_stall", d.tau_stall, 0.232, 1e-9);
    expectNear("tau_e", d.tau_e, 0.0005, 1e-12);
    expectNear("tau_m", d.tau_m, 2.0 * 1.0e-5 / (k_t * k_t), 1e-12);
    expectNear("accessor k_t", motor.torqueConstant(), d.k_t, 0.0);
    expectNear("accessor I_stall", motor.stallCurrent(), d.I_stall, 0.0);
    expectNear("accessor tau_stall", motor.stallTorque(), d.tau_stall, 0.0);
    expectNear("accessor tau_e", motor.electricalTimeConstant(), d.tau_e, 0.0);
    expectNear("accessor tau_m", motor.mechanicalTimeConstant(), d.tau_m, 0.0);
    expectNear("k_e", motor.backEmfConstant(), d.k_t, 0.0);

    if (!(d.I_stall > motor.parameters().I_0) || !(d.tau_stall > 0.0)) {
        std::cerr << "FAIL: stall values not above no-load values" << std::endl;
        failures++;
    }
    std::cout << "k_t = " << d.k_t << " N*m/A, tau_stall = " << d.tau_stall << " N*m" << std::endl;

    // Test 2: Same inputs give the same derived constants
    std::cout << "\nTest 2: Derived constants are reproducible..." << std::endl;
    dc_motor::MotorModel again(referenceMotor());
    expectNear("repeat k_t", again.derived().k_t, d.k_t, 0.0);
    expectNear("repeat tau_m", again.derived().tau_m, d.tau_m, 0.0);

    // Test 3: Edge cases that are still valid
    std::cout << "\nTest 3: Zero inductance and zero no-load current..." << std::endl;
    dc_motor::MotorParameters ideal = referenceMotor();
    ideal.L = 0.0;
    ideal.I_0 = 0.0;
    dc_motor::MotorModel ideal_motor(ideal);
    expectNear("ideal k_t", ideal_motor.torqueConstant(), 12.0 / 300.0, 1e-12);
    expectNear("ideal tau_e", ideal_motor.electricalTimeConstant(), 0.0, 0.0);

    // Test 4: Constraint violations
    std::cout << "\nTest 4: Invalid parameters are rejected..." << std::endl;
    dc_motor::MotorParameters p;

    p = referenceMotor(); p.R = 0.0;
    expectInvalid("R = 0", p, "R");
    p = referenceMotor(); p.V_nom = -12.0;
    expectInvalid("V_nom < 0", p, "V_nom");
    p = referenceMotor(); p.P = 0.0;
    expectInvalid("P = 0", p, "P");
    p = referenceMotor(); p.L = -1.0e-3;
    expectInvalid("L < 0", p, "L");
    p = referenceMotor(); p.I_0 = -0.1;
    expectInvalid("I_0 < 0", p, "I_0");
    p = referenceMotor(); p.w_0 = 0.0;
    expectInvalid("w_0 = 0", p, "w_0");
    p = referenceMotor(); p.J = 0.0;
    expectInvalid("J = 0", p, "J");
    p = referenceMotor(); p.I_0 = 7.0;
    expectInvalid("I_0 above stall", p, "I_0");
    p = referenceMotor(); p.I_0 = 6.0;
    expectInvalid("I_0 at stall", p, "I_0");
    p = referenceMotor(); p.V_nom = 5.0; p.R = 3.0; p.I_0 = std::nextafter(5.0 / 3.0, 0.0);
    expectInvalid("I_0 one ulp below stall", p, "I_0");
    p = referenceMotor(); p.V_nom = std::numeric_limits<double>::quiet_NaN();
    expectInvalid("V_nom NaN", p, "V_nom");
    p = referenceMotor(); p.J = std::numeric_limits<double>::infinity();
    expectInvalid("J inf", p, "J");

    // Test 5: I_0 just below V/R never yields a degenerate model
    std::cout << "\nTest 5: No-load current one ulp below stall..." << std::endl;
    const double voltages[] = {1.0, 3.0, 5.0, 7.0, 12.0, 24.0};
    const double resistances[] = {3.0, 7.0, 0.3, 1.1, 2.9};
    for (double v : voltages) {
        for (double r : resistances) {
            dc_motor::MotorParameters edge = referenceMotor();
            edge.V_nom = v;
            edge.R = r;
            edge.I_0 = std::nextafter(v / r, 0.0);
            try {
                dc_motor::MotorModel edge_motor(edge);
                if (!(edge_motor.torqueConstant() > 0.0) || !(edge_motor.stallTorque() > 0.0) ||
                    !std::isfinite(edge_motor.mechanicalTimeConstant())) {
                    std::cerr << "FAIL: degenerate model accepted for V = " << v << ", R = " << r << std::endl;
                    failures++;
                }
            } catch (const dc_motor::InvalidParameterError&) {
            }
        }
    }

    if (failures > 0) {
        std::cerr << "\n=== " << failures << " check(s) failed ===" << std::endl;
        return 1;
    }
    std::cout << "\n=== All Tests Passed! ===" << std::endl;
    return 0;
}
