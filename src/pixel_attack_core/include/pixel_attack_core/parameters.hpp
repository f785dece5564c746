#ifndef PIXEL_ATTACK_CORE__PARAMETERS_HPP_
#define PIXEL_ATTACK_CORE__PARAMETERS_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

// ROS 2 整数参数是 int64, 转成 size_t 之前先检查下界
// value < min_value 时抛 std::invalid_argument (消息里带参数名)
std::size_t checked_size(const std::string& name, int64_t value, int64_t min_value);

#endif
