#ifndef PIXEL_ATTACK_CORE__BOUNDARY_HPP_
#define PIXEL_ATTACK_CORE__BOUNDARY_HPP_

#include "pixel_attack_core/types.hpp"
#include <cstddef>

// 单步反射修复, 先处理负数, 再处理上溢:
//   v < 0        -> -v
//   v > size - 1 -> size - 1 - v
// 只反射一次, 远超边界的值仍可能落在 [0, size-1] 之外
// INT_MIN 无法取反 -> CoordinateOutOfRange
int reflect_coordinate(int v, std::size_t size);

//   v < 0 -> -v
//   v > 1 -> 1 - v
double reflect_color(double v);

// x 以 height 为界, y 以 width 为界
void repair_coords(CoordArray& coords, std::size_t height, std::size_t width);
void repair_colors(ColorArray& colors);

#endif
