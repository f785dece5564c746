#ifndef PIXEL_ATTACK_CORE__ERRORS_HPP_
#define PIXEL_ATTACK_CORE__ERRORS_HPP_

#include <stdexcept>
#include <string>

// 形状不一致 (坐标/颜色数量不匹配, 父代/子代批次大小不同)
class ShapeMismatch : public std::invalid_argument {
public:
    explicit ShapeMismatch(const std::string& what) : std::invalid_argument(what) {}
};

// 像素坐标超出 [-size, size) 时写入图像
class CoordinateOutOfRange : public std::out_of_range {
public:
    explicit CoordinateOutOfRange(const std::string& what) : std::out_of_range(what) {}
};

#endif
