#include "pixel_attack_core/mutation.hpp"
#include "pixel_attack_core/errors.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

std::array<std::size_t, 3> sample_donors(std::size_t self, std::size_t pop_size,
                                         std::mt19937& rng)
{
    if (pop_size < 2) {
        throw std::invalid_argument("sample_donors: need at least 2 agents");
    }
    // 在 [0, N-2] 中抽样, 再跳过 self
    std::uniform_int_distribution<std::size_t> idx_dist(0, pop_size - 2);
    std::array<std::size_t, 3> donors{};
    for (auto& d : donors) {
        std::size_t r = idx_dist(rng);
        d = (r >= self) ? r + 1 : r;
    }
    return donors;
}

std::vector<bool> crossover_mask(std::size_t units, double cr, std::mt19937& rng) {
    std::uniform_real_distribution<double> rand_01(0.0, 1.0);
    std::vector<bool> mask(units);
    for (std::size_t j = 0; j < units; ++j) {
        mask[j] = rand_01(rng) < cr;
    }
    return mask;
}

template <typename T>
UnitArray<T> generate_children(const UnitArray<T>& parents, double cr, double F,
                               bool round, std::mt19937& rng)
{
    const std::size_t pop_size = parents.agents();
    const std::size_t units = parents.units();
    const std::size_t dims = parents.dims();

    UnitArray<T> children = parents;

    for (std::size_t i = 0; i < pop_size; ++i) {
        // 1. 抽取 a, b, c (不含自身)
        const auto donors = sample_donors(i, pop_size, rng);
        const std::size_t a = donors[0];
        const std::size_t b = donors[1];
        const std::size_t c = donors[2];

        // 2. 交叉掩码
        const std::vector<bool> mask = crossover_mask(units, cr, rng);

        // 3. 变异: 掩码为 true 的单元取 proposal, 否则保留父代
        for (std::size_t j = 0; j < units; ++j) {
            if (!mask[j]) continue;
            for (std::size_t k = 0; k < dims; ++k) {
                double diff = static_cast<double>(parents.at(b, j, k)) -
                              static_cast<double>(parents.at(c, j, k));
                double proposal = static_cast<double>(parents.at(a, j, k)) + F * diff;
                if (round) proposal = std::nearbyint(proposal);
                if constexpr (std::is_integral<T>::value) {
                    // 超出整数范围的坐标无法表示 (F 过大)
                    constexpr double lo = static_cast<double>(std::numeric_limits<T>::min()) + 1.0;
                    constexpr double hi = static_cast<double>(std::numeric_limits<T>::max());
                    if (!(proposal >= lo && proposal <= hi)) {
                        throw CoordinateOutOfRange("generate_children: proposal " +
                                                   std::to_string(proposal) +
                                                   " does not fit in an integer coordinate");
                    }
                }
                children.at(i, j, k) = static_cast<T>(proposal);
            }
        }
    }
    return children;
}

template UnitArray<int> generate_children<int>(const UnitArray<int>&, double, double,
                                               bool, std::mt19937&);
template UnitArray<double> generate_children<double>(const UnitArray<double>&, double, double,
                                                     bool, std::mt19937&);
