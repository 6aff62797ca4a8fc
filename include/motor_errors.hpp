#pragma once
#include <stdexcept>
#include <string>

namespace dc_motor {

// 构造时参数不满足物理约束
class InvalidParameterError : public std::invalid_argument {
public:
    explicit InvalidParameterError(const std::string& what)
        : std::invalid_argument(what) {}
};

// 查询所需的量为零, 公式无定义
class DegenerateModelError : public std::domain_error {
public:
    explicit DegenerateModelError(const std::string& what)
        : std::domain_error(what) {}
};

}
