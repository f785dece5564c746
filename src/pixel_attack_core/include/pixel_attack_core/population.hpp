#ifndef PIXEL_ATTACK_CORE__POPULATION_HPP_
#define PIXEL_ATTACK_CORE__POPULATION_HPP_

#include "pixel_attack_core/types.hpp"
#include <cstddef>
#include <random>

// 随机初始化种群 (供可执行程序使用, 核心算法不负责初始化)
// 坐标: x in [0, height), y in [0, width); 颜色: [0, 1)
Population random_population(std::size_t pop_size, std::size_t num_pixels,
                             std::size_t channels, std::size_t height, std::size_t width,
                             std::mt19937& rng);

#endif
