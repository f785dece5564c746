#include "pixel_attack_core/compositor.hpp"
#include "pixel_attack_core/errors.hpp"
#include <string>

namespace {

std::size_t resolve_index(int v, std::size_t size) {
    const int n = static_cast<int>(size);
    if (v < -n || v >= n) {
        throw CoordinateOutOfRange("pixel coordinate " + std::to_string(v) +
                                   " outside [-" + std::to_string(n) + ", " +
                                   std::to_string(n) + ")");
    }
    return static_cast<std::size_t>(v < 0 ? v + n : v);
}

}  // namespace

ImageBatch generate_image_variants(const Image& img, const CoordArray& coords,
                                   const ColorArray& colors)
{
    // 前两个维度 (agents, units) 必须一致
    if (coords.agents() != colors.agents() || coords.units() != colors.units()) {
        throw ShapeMismatch("coords (" + std::to_string(coords.agents()) + ", " +
                            std::to_string(coords.units()) + ") vs colors (" +
                            std::to_string(colors.agents()) + ", " +
                            std::to_string(colors.units()) + ")");
    }
    if (coords.dims() != 2) {
        throw ShapeMismatch("coords must have 2 dims, got " + std::to_string(coords.dims()));
    }
    if (colors.dims() != img.channels()) {
        throw ShapeMismatch("color dims " + std::to_string(colors.dims()) +
                            " != image channels " + std::to_string(img.channels()));
    }

    ImageBatch variants(coords.agents(), img);

    for (std::size_t i = 0; i < coords.agents(); ++i) {
        Image& out = variants[i];
        for (std::size_t j = 0; j < coords.units(); ++j) {
            const std::size_t row = resolve_index(coords.at(i, j, 0), img.height());
            const std::size_t col = resolve_index(coords.at(i, j, 1), img.width());
            for (std::size_t c = 0; c < img.channels(); ++c) {
                out.at(c, row, col) = colors.at(i, j, c);
            }
        }
    }
    return variants;
}
