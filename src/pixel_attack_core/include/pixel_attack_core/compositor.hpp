#ifndef PIXEL_ATTACK_CORE__COMPOSITOR_HPP_
#define PIXEL_ATTACK_CORE__COMPOSITOR_HPP_

#include "pixel_attack_core/types.hpp"

// 为每个 agent 复制一份原图, 并用它的颜色覆盖对应像素的所有通道
// 原图不会被修改
// coords 与 colors 的 (agents, units) 不一致 -> ShapeMismatch
// 负坐标从另一端计数 (v + size), 超出 [-size, size) -> CoordinateOutOfRange
ImageBatch generate_image_variants(const Image& img, const CoordArray& coords,
                                   const ColorArray& colors);

#endif
