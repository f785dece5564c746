#ifndef PIXEL_ATTACK_CORE__TYPES_HPP_
#define PIXEL_ATTACK_CORE__TYPES_HPP_

#include <cstddef>
#include <vector>

// 种群数组: (agents, units, dims)
// 坐标: dims = 2, (x, y) -> x 是行, y 是列
// 颜色: dims = 通道数, 取值 [0, 1]
template <typename T>
class UnitArray {
public:
    UnitArray() = default;
    UnitArray(std::size_t agents, std::size_t units, std::size_t dims, T fill = T())
    : agents_(agents), units_(units), dims_(dims), data_(agents * units * dims, fill) {}

    std::size_t agents() const { return agents_; }
    std::size_t units() const { return units_; }
    std::size_t dims() const { return dims_; }

    T& at(std::size_t agent, std::size_t unit, std::size_t dim) {
        return data_[(agent * units_ + unit) * dims_ + dim];
    }
    const T& at(std::size_t agent, std::size_t unit, std::size_t dim) const {
        return data_[(agent * units_ + unit) * dims_ + dim];
    }

    bool same_shape(const UnitArray& other) const {
        return agents_ == other.agents_ && units_ == other.units_ && dims_ == other.dims_;
    }

    std::vector<T>& values() { return data_; }
    const std::vector<T>& values() const { return data_; }

    bool operator==(const UnitArray& other) const {
        return same_shape(other) && data_ == other.data_;
    }
    bool operator!=(const UnitArray& other) const { return !(*this == other); }

private:
    std::size_t agents_ = 0;
    std::size_t units_ = 0;
    std::size_t dims_ = 0;
    std::vector<T> data_;
};

using CoordArray = UnitArray<int>;
using ColorArray = UnitArray<double>;

// 每个 agent 拥有 P 个 (坐标, 颜色) 对
struct Population {
    CoordArray coords;
    ColorArray colors;

    std::size_t size() const { return coords.agents(); }
    std::size_t num_pixels() const { return coords.units(); }

    // 坐标与颜色的 (agents, units) 必须一致, 否则抛 ShapeMismatch
    void validate() const;
};

// 图像张量 (channels, height, width), 每个通道按行存储
class Image {
public:
    Image() = default;
    Image(std::size_t channels, std::size_t height, std::size_t width, double fill = 0.0)
    : channels_(channels), height_(height), width_(width),
      data_(channels * height * width, fill) {}

    std::size_t channels() const { return channels_; }
    std::size_t height() const { return height_; }
    std::size_t width() const { return width_; }

    double& at(std::size_t channel, std::size_t row, std::size_t col) {
        return data_[(channel * height_ + row) * width_ + col];
    }
    double at(std::size_t channel, std::size_t row, std::size_t col) const {
        return data_[(channel * height_ + row) * width_ + col];
    }

    bool operator==(const Image& other) const {
        return channels_ == other.channels_ && height_ == other.height_ &&
               width_ == other.width_ && data_ == other.data_;
    }
    bool operator!=(const Image& other) const { return !(*this == other); }

private:
    std::size_t channels_ = 0;
    std::size_t height_ = 0;
    std::size_t width_ = 0;
    std::vector<double> data_;
};

using ImageBatch = std::vector<Image>;
// (batch, num_classes)
using ScoreBatch = std::vector<std::vector<double>>;

#endif
