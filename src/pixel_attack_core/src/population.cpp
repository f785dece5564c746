#include "pixel_attack_core/population.hpp"
#include "pixel_attack_core/errors.hpp"
#include <stdexcept>
#include <string>

void Population::validate() const {
    if (coords.dims() != 2) {
        throw ShapeMismatch("coords must have 2 dims, got " + std::to_string(coords.dims()));
    }
    if (coords.agents() != colors.agents() || coords.units() != colors.units()) {
        throw ShapeMismatch("coords (" + std::to_string(coords.agents()) + ", " +
                            std::to_string(coords.units()) + ") vs colors (" +
                            std::to_string(colors.agents()) + ", " +
                            std::to_string(colors.units()) + ")");
    }
}

Population random_population(std::size_t pop_size, std::size_t num_pixels,
                             std::size_t channels, std::size_t height, std::size_t width,
                             std::mt19937& rng)
{
    if (height == 0 || width == 0) {
        throw std::invalid_argument("random_population: empty image");
    }

    Population pop;
    pop.coords = CoordArray(pop_size, num_pixels, 2);
    pop.colors = ColorArray(pop_size, num_pixels, channels);

    std::uniform_int_distribution<int> row_dist(0, static_cast<int>(height) - 1);
    std::uniform_int_distribution<int> col_dist(0, static_cast<int>(width) - 1);
    std::uniform_real_distribution<double> color_dist(0.0, 1.0);

    for (std::size_t i = 0; i < pop_size; ++i) {
        for (std::size_t j = 0; j < num_pixels; ++j) {
            pop.coords.at(i, j, 0) = row_dist(rng);
            pop.coords.at(i, j, 1) = col_dist(rng);
            for (std::size_t c = 0; c < channels; ++c) {
                pop.colors.at(i, j, c) = color_dist(rng);
            }
        }
    }
    return pop;
}
