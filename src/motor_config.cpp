/**
 * @file motor_config.cpp
 * @brief Implementation of MotorConfigParser
 */

#include "motor_config.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

namespace dc_motor {

namespace {

const double PI = 3.14159265358979323846;
const double RPM_TO_RAD_PER_SEC = 2.0 * PI / 60.0;

const char* const KEY_V_NOM = "V_NOM";
const char* const KEY_POWER = "POWER";
const char* const KEY_RESISTANCE = "RESISTANCE";
const char* const KEY_INDUCTANCE = "INDUCTANCE";
const char* const KEY_NO_LOAD_CURRENT = "NO_LOAD_CURRENT";
const char* const KEY_NO_LOAD_SPEED = "NO_LOAD_SPEED";
const char* const KEY_NO_LOAD_SPEED_RPM = "NO_LOAD_SPEED_RPM";
const char* const KEY_ROTOR_INERTIA = "ROTOR_INERTIA";

bool isKnownKey(const std::string& key) {
    static const char* const known[] = {
        KEY_V_NOM, KEY_POWER, KEY_RESISTANCE, KEY_INDUCTANCE,
        KEY_NO_LOAD_CURRENT, KEY_NO_LOAD_SPEED, KEY_NO_LOAD_SPEED_RPM, KEY_ROTOR_INERTIA
    };
    for (const char* k : known) {
        if (key == k) return true;
    }
    return false;
}

}

MotorConfigParser::MotorConfigParser() : loaded_(false) {
}

MotorConfigParser::~MotorConfigParser() {
}

void MotorConfigParser::clear() {
    params_ = MotorParameters();
    values_.clear();
    errors_.clear();
    source_.clear();
    loaded_ = false;
}

bool MotorConfigParser::parseFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        clear();
        source_ = filename;
        addError("Failed to open configuration file: " + filename);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseString(buffer.str(), filename);
}

bool MotorConfigParser::parseString(const std::string& content, const std::string& source) {
    clear();
    source_ = source;

    std::cout << "Parsing motor parameters: " << source_ << std::endl;

    std::istringstream stream(content);
    std::string line;
    size_t line_number = 0;

    while (std::getline(stream, line)) {
        line_number++;

        // Skip empty lines and comments
        std::string trimmed_line = trim(line);
        if (trimmed_line.empty() || trimmed_line[0] == '#') {
            continue;
        }

        parseLine(trimmed_line, line_number);
    }

    if (!validateKeys()) {
        return false;
    }

    params_.V_nom = values_[KEY_V_NOM];
    params_.P = values_[KEY_POWER];
    params_.R = values_[KEY_RESISTANCE];
    params_.L = values_[KEY_INDUCTANCE];
    params_.I_0 = values_[KEY_NO_LOAD_CURRENT];
    params_.J = values_[KEY_ROTOR_INERTIA];
    if (values_.count(KEY_NO_LOAD_SPEED_RPM)) {
        params_.w_0 = values_[KEY_NO_LOAD_SPEED_RPM] * RPM_TO_RAD_PER_SEC;
    } else {
        params_.w_0 = values_[KEY_NO_LOAD_SPEED];
    }

    loaded_ = true;
    std::cout << "Parsed " << values_.size() << " parameters from " << source_ << std::endl;
    return true;
}

bool MotorConfigParser::parseLine(const std::string& line, size_t line_number) {
    std::stringstream ss(line);
    std::string key_str, value_str;

    // KEY, VALUE
    if (!std::getline(ss, key_str, ',') || !std::getline(ss, value_str)) {
        addError("Line " + std::to_string(line_number) + ": Invalid format, expected KEY, VALUE");
        return false;
    }

    std::string key = toUpper(trim(key_str));
    std::string value_text = trim(value_str);

    if (!isKnownKey(key)) {
        addError("Line " + std::to_string(line_number) + ": Unknown parameter '" + key + "'");
        return false;
    }
    if (values_.count(key)) {
        addError("Line " + std::to_string(line_number) + ": Duplicate parameter '" + key + "'");
        return false;
    }

    double value = 0.0;
    try {
        size_t consumed = 0;
        value = std::stod(value_text, &consumed);
        if (consumed != value_text.size()) {
            addError("Line " + std::to_string(line_number) + ": Trailing characters in value '" + value_text + "'");
            return false;
        }
    } catch (const std::exception& e) {
        addError("Line " + std::to_string(line_number) + ": Parsing error for '" + key + "' - " + e.what());
        return false;
    }

    if (!std::isfinite(value)) {
        addError("Line " + std::to_string(line_number) + ": Value of '" + key + "' is not finite");
        return false;
    }

    values_[key] = value;
    return true;
}

bool MotorConfigParser::validateKeys() {
    static const char* const required[] = {
        KEY_V_NOM, KEY_POWER, KEY_RESISTANCE, KEY_INDUCTANCE,
        KEY_NO_LOAD_CURRENT, KEY_ROTOR_INERTIA
    };
    for (const char* key : required) {
        if (!values_.count(key)) {
            addError(std::string("Missing required parameter: ") + key);
        }
    }

    bool has_speed = values_.count(KEY_NO_LOAD_SPEED) > 0;
    bool has_speed_rpm = values_.count(KEY_NO_LOAD_SPEED_RPM) > 0;
    if (has_speed && has_speed_rpm) {
        addError("Conflicting parameters: give either NO_LOAD_SPEED or NO_LOAD_SPEED_RPM, not both");
    } else if (!has_speed && !has_speed_rpm) {
        addError("Missing required parameter: NO_LOAD_SPEED");
    }

    return errors_.empty();
}

void MotorConfigParser::printSummary() const {
    std::cout << "\n=== Motor Parameters (" << source_ << ") ===" << std::endl;
    std::streamsize old_precision = std::cout.precision(6);
    std::cout << "  V_nom: " << params_.V_nom << " V" << std::endl;
    std::cout << "  P:     " << params_.P << " W" << std::endl;
    std::cout << "  R:     " << params_.R << " Ohm" << std::endl;
    std::cout << "  L:     " << params_.L << " H" << std::endl;
    std::cout << "  I_0:   " << params_.I_0 << " A" << std::endl;
    std::cout << "  w_0:   " << params_.w_0 << " rad/s" << std::endl;
    std::cout << "  J:     " << params_.J << " kg*m^2" << std::endl;
    std::cout.precision(old_precision);
}

void MotorConfigParser::addError(const std::string& error) {
    errors_.push_back(error);
    std::cerr << "Config Error: " << error << std::endl;
}

std::string MotorConfigParser::trim(const std::string& str) {
    auto begin = std::find_if(str.begin(), str.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

std::string MotorConfigParser::toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return result;
}

}
