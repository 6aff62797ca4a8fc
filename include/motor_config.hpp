/**
 * @file motor_config.hpp
 * @brief Nameplate parameter file parser
 *
 * Reads a motor parameter file of the form
 *
 *     # comment
 *     V_NOM, 12.0
 *     RESISTANCE, 2.0
 *     ...
 *
 * into a MotorParameters value. Keys are case-insensitive. Errors are
 * accumulated with line numbers and can be retrieved with getErrors().
 */

#pragma once
#include <map>
#include <string>
#include <vector>
#include "common.hpp"

namespace dc_motor {

class MotorConfigParser {
public:
    MotorConfigParser();
    ~MotorConfigParser();

    /**
     * @brief Parse a parameter file
     * @param filename Path to the file
     * @return true if every required key was found and all lines were valid
     */
    bool parseFile(const std::string& filename);

    /**
     * @brief Parse parameter text already held in memory
     * @param content File contents
     * @param source Name used in log output
     */
    bool parseString(const std::string& content, const std::string& source = "<string>");

    bool isLoaded() const { return loaded_; }

    /**
     * @brief Loaded parameters
     * @note Only meaningful when isLoaded() is true. Physical constraints are
     *       checked by the MotorModel constructor, not here.
     */
    const MotorParameters& getParameters() const { return params_; }

    const std::vector<std::string>& getErrors() const { return errors_; }

    void printSummary() const;

    void clear();

private:
    bool parseLine(const std::string& line, size_t line_number);
    bool validateKeys();
    void addError(const std::string& error);

    static std::string trim(const std::string& str);
    static std::string toUpper(const std::string& str);

    MotorParameters params_;
    std::map<std::string, double> values_;   // key (upper case) -> value
    std::vector<std::string> errors_;
    std::string source_;
    bool loaded_;
};

}
