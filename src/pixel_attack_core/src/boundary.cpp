#include "pixel_attack_core/boundary.hpp"
#include "pixel_attack_core/errors.hpp"
#include <limits>
#include <string>

int reflect_coordinate(int v, std::size_t size) {
    const int upper = static_cast<int>(size) - 1;
    if (v == std::numeric_limits<int>::min()) {
        throw CoordinateOutOfRange("reflect_coordinate: cannot mirror " + std::to_string(v));
    }
    if (v < 0) v = -v;
    if (v > upper) v = upper - v;
    return v;
}

double reflect_color(double v) {
    if (v < 0.0) v = -v;
    if (v > 1.0) v = 1.0 - v;
    return v;
}

void repair_coords(CoordArray& coords, std::size_t height, std::size_t width) {
    if (coords.dims() != 2) {
        throw ShapeMismatch("repair_coords: expected 2 dims, got " + std::to_string(coords.dims()));
    }
    for (std::size_t i = 0; i < coords.agents(); ++i) {
        for (std::size_t j = 0; j < coords.units(); ++j) {
            coords.at(i, j, 0) = reflect_coordinate(coords.at(i, j, 0), height);
            coords.at(i, j, 1) = reflect_coordinate(coords.at(i, j, 1), width);
        }
    }
}

void repair_colors(ColorArray& colors) {
    for (auto& v : colors.values()) {
        v = reflect_color(v);
    }
}
