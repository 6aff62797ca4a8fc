#include "motor_model.hpp"
#include "motor_config.hpp"
#include "common.hpp"
#include <iostream>
#include <iomanip>
#include <string>

int main(int argc, char* argv[]) {
    if (argc > 3) {
        std::cerr << "Usage: " << argv[0] << " [parameter_file] [curve_points]" << std::endl;
        std::cerr << "Example: " << argv[0] << " config/example_motor.csv 11" << std::endl;
        return 1;
    }

    dc_motor::MotorParameters params; // 不给文件时使用默认铭牌参数
    int n_points = 11;

    if (argc >= 2) {
        dc_motor::MotorConfigParser parser;
        if (!parser.parseFile(argv[1])) {
            std::cerr << "Failed to load motor parameters from " << argv[1] << std::endl;
            return 1;
        }
        parser.printSummary();
        params = parser.getParameters();
    }
    if (argc == 3) {
        try {
            n_points = std::stoi(argv[2]);
        } catch (const std::exception& e) {
            std::cerr << "Invalid curve point count '" << argv[2] << "': " << e.what() << std::endl;
            return 1;
        }
    }

    try {
        dc_motor::MotorModel motor(params);
        const dc_motor::DerivedConstants& d = motor.derived();

        std::cout << std::setprecision(6);
        std::cout << "\n=== Derived Constants ===" << std::endl;
        std::cout << "  k_t (= k_e):   " << d.k_t << " N*m/A" << std::endl;
        std::cout << "  k_s:           " << motor.speedConstant() << " rad/(V*s)" << std::endl;
        std::cout << "  k_m:           " << motor.motorConstant() << " N*m/sqrt(W)" << std::endl;
        std::cout << "  I_stall:       " << d.I_stall << " A" << std::endl;
        std::cout << "  tau_stall:     " << d.tau_stall << " N*m" << std::endl;
        std::cout << "  tau_e:         " << d.tau_e << " s" << std::endl;
        std::cout << "  tau_m:         " << d.tau_m << " s" << std::endl;
        std::cout << "  I_cont:        " << motor.maxContinuousCurrent() << " A" << std::endl;
        std::cout << "  tau_cont:      " << motor.maxContinuousTorque() << " N*m" << std::endl;
        std::cout << "  B (short):     " << motor.shortCircuitDamping() << " N*m*s/rad" << std::endl;
        std::cout << "  P_max:         " << motor.maxMechanicalPower() << " W" << std::endl;
        std::cout << "  eta_max:       " << motor.maxEfficiency()
                  << " @ " << motor.maxEfficiencyCurrent() << " A" << std::endl;

        if (params.L > 0.0) {
            std::cout << "  poles:         " << motor.poles().transpose() << " 1/s" << std::endl;
        } else {
            std::cout << "  poles:         (L = 0, electrical dynamics not modeled)" << std::endl;
        }

        Eigen::MatrixXd curve = motor.characteristicCurve(n_points);

        std::cout << "\n=== Characteristic Curve @ " << params.V_nom << " V ===" << std::endl;
        std::cout << "I[A]\tw[rad/s]\ttau[N*m]\tP_out[W]\teta" << std::endl;
        for (int i = 0; i < curve.rows(); ++i) {
            std::cout << curve(i, dc_motor::CURVE_CURRENT) << "\t"
                      << curve(i, dc_motor::CURVE_SPEED) << "\t"
                      << curve(i, dc_motor::CURVE_TORQUE) << "\t"
                      << curve(i, dc_motor::CURVE_POWER_OUT) << "\t"
                      << curve(i, dc_motor::CURVE_EFFICIENCY) << std::endl;
        }
    } catch (const dc_motor::InvalidParameterError& e) {
        std::cerr << "Invalid motor parameters: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
