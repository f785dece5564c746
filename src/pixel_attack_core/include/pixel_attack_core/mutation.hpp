#ifndef PIXEL_ATTACK_CORE__MUTATION_HPP_
#define PIXEL_ATTACK_CORE__MUTATION_HPP_

#include "pixel_attack_core/types.hpp"
#include <array>
#include <cstddef>
#include <random>
#include <vector>

// 为第 self 个子代抽取三个父代 a, b, c
// 候选池 = 除 self 外的所有 agent, 有放回抽样 (b == c 是允许的)
std::array<std::size_t, 3> sample_donors(std::size_t self, std::size_t pop_size,
                                         std::mt19937& rng);

// 交叉掩码: 每个像素单元一次抽样, 该单元的所有维度一起更新
std::vector<bool> crossover_mask(std::size_t units, double cr, std::mt19937& rng);

// 差分变异 + 交叉, 生成与父代形状相同的子代
// proposal = parent[a] + F * (parent[b] - parent[c])
// round: 坐标需要取整 (四舍六入五成双)
// 整数坐标的 proposal 超出 int 范围 -> CoordinateOutOfRange
template <typename T>
UnitArray<T> generate_children(const UnitArray<T>& parents, double cr, double F,
                               bool round, std::mt19937& rng);

#endif
