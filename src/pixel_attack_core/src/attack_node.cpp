#include "pixel_attack_core/attack_node.hpp"
#include "pixel_attack_core/errors.hpp"
#include "pixel_attack_core/parameters.hpp"
#include "pixel_attack_core/population.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <filesystem> // C++17 目录操作
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

AttackNode::AttackNode()
: Node("pixel_attack_node"), is_finished_(false)
{
  // 1. 参数声明
  this->declare_parameter("image_height", 32);
  this->declare_parameter("image_width", 32);
  this->declare_parameter("channels", 3);
  this->declare_parameter("base_intensity", 0.0);
  this->declare_parameter("num_pixels", 4);
  this->declare_parameter("pop_size", 50);
  this->declare_parameter("max_generations", 100);
  this->declare_parameter("generations_per_tick", 1);
  this->declare_parameter("timer_period_ms", 10);
  this->declare_parameter("seed", -1);  // < 0: 使用 random_device
  this->declare_parameter("enable_csv_log", false);
  this->declare_parameter("log_dir", "./attack_logs");

  // DE 参数
  this->declare_parameter("de_F", 0.5);
  this->declare_parameter("de_CR", 0.9);
  // 攻击目标
  this->declare_parameter("num_classes", 10);
  this->declare_parameter("target_class", 1);
  this->declare_parameter("actual_class", 0);
  // 分类器参数
  this->declare_parameter("classifier_type", "channel_threshold");
  this->declare_parameter("threshold_channel", 0);
  this->declare_parameter("threshold", 0.5);
  this->declare_parameter("actual_bias", 3.5);

  // 2. 参数读取
  generations_per_tick_ = std::max<int>(1, this->get_parameter("generations_per_tick").as_int());
  enable_csv_log_ = this->get_parameter("enable_csv_log").as_bool();
  log_dir_ = this->get_parameter("log_dir").as_string();

  // 3. 本地日志初始化
  if (enable_csv_log_) {
      std::filesystem::create_directories(log_dir_);
      std::string file_path = log_dir_ + "/attack.csv";
      csv_out_.open(file_path, std::ios::out);
      if (csv_out_.is_open()) {
          csv_out_ << "Generation,Best_Divergence,Converged\n";
      } else {
          RCLCPP_WARN(this->get_logger(), "Cannot open %s, CSV log disabled", file_path.c_str());
      }
  }

  init_attack();

  const auto timer_ms = static_cast<int64_t>(size_param("timer_period_ms", 1));
  timer_ = this->create_wall_timer(std::chrono::milliseconds(timer_ms), std::bind(&AttackNode::tick_callback, this));
}

AttackNode::~AttackNode() {
    if (csv_out_.is_open()) csv_out_.close();
}

void AttackNode::tick_callback() {
    if (!attack_ || is_finished_) return;

    const int max_generations = attack_->config().max_generations;
    for (int k = 0; k < generations_per_tick_; ++k) {
        if (attack_->current_generation >= max_generations) {
            RCLCPP_INFO(this->get_logger(),
            "🏁 Reached max_generations=%d without success. Best divergence %.4f",
            max_generations,
            attack_->current_generation > 0 ? attack_->best_divergence() : 0.0);
            finish();
            return;
        }

        try {
            attack_->step();
        } catch (const std::exception& e) {
            RCLCPP_ERROR(this->get_logger(), "Generation %d failed: %s",
                         attack_->current_generation + 1, e.what());
            finish();
            return;
        }
        record_local_log();

        if (attack_->converged()) {
            const std::size_t best = attack_->get_best_agent();
            RCLCPP_INFO(this->get_logger(),
            "🏁 Converged at generation %d: %zu successful agent(s), best agent %zu (divergence %.4f)",
            attack_->current_generation,
            attack_->best_agents().size(),
            best,
            attack_->best_divergence());

            const Population& pop = attack_->population();
            for (std::size_t j = 0; j < pop.num_pixels(); ++j) {
                RCLCPP_INFO(this->get_logger(), "  pixel %zu -> (%d, %d)",
                            j, pop.coords.at(best, j, 0), pop.coords.at(best, j, 1));
            }
            finish();
            return;
        }
    }
}

std::size_t AttackNode::size_param(const std::string& name, int64_t min_value) {
    return checked_size(name, this->get_parameter(name).as_int(), min_value);
}

void AttackNode::finish() {
    is_finished_ = true;
    if (timer_) timer_->cancel();
    if (csv_out_.is_open()) {
        // 把剩余数据刷入硬盘
        csv_out_.close();
    }
}

void AttackNode::record_local_log() {
    if (enable_csv_log_ && csv_out_.is_open()) {
        csv_out_ << attack_->current_generation << "," << attack_->best_divergence() << ","
                 << (attack_->converged() ? 1 : 0) << "\n";
    }
}

std::unique_ptr<Classifier> AttackNode::make_classifier(std::size_t channels) {
    auto normalize = [](std::string s) {
        std::string out;
        for (unsigned char ch : s) if (std::isalnum(ch)) out.push_back(static_cast<char>(std::tolower(ch)));
        return out;
    };
    const std::string key = normalize(this->get_parameter("classifier_type").as_string());
    const std::size_t num_classes = size_param("num_classes", 1);
    const std::size_t target = size_param("target_class", 0);
    const std::size_t actual = size_param("actual_class", 0);
    const double bias = this->get_parameter("actual_bias").as_double();

    FunctionClassifier::ScoreFunction func;

    if (key == "channelmean") {
        // 类别 k 的得分 = 第 (k % C) 个通道的平均亮度, 真实类额外加 bias
        func = [num_classes, actual, bias](const Image& img) {
            if (img.channels() == 0) throw ShapeMismatch("channel_mean: image has no channels");
            std::vector<double> scores(num_classes, 0.0);
            const double pixels = static_cast<double>(img.height() * img.width());
            for (std::size_t k = 0; k < num_classes; ++k) {
                const std::size_t c = k % img.channels();
                double s = 0.0;
                for (std::size_t r = 0; r < img.height(); ++r)
                    for (std::size_t col = 0; col < img.width(); ++col) s += img.at(c, r, col);
                scores[k] = s / pixels;
            }
            scores[actual] += bias;
            return scores;
        };
    } else {
        // channel_threshold: 目标类得分 = 指定通道超过阈值的像素数
        const std::size_t channel = size_param("threshold_channel", 0);
        const double threshold = this->get_parameter("threshold").as_double();
        if (channel >= channels) {
            throw std::invalid_argument("threshold_channel out of range");
        }
        func = [num_classes, target, actual, bias, channel, threshold](const Image& img) {
            std::vector<double> scores(num_classes, 0.0);
            double count = 0.0;
            for (std::size_t r = 0; r < img.height(); ++r)
                for (std::size_t col = 0; col < img.width(); ++col)
                    if (img.at(channel, r, col) > threshold) count += 1.0;
            scores[target] = count;
            scores[actual] = bias;
            return scores;
        };
    }
    return std::make_unique<FunctionClassifier>(func);
}

void AttackNode::init_attack() {
    const std::size_t height = size_param("image_height", 1);
    const std::size_t width = size_param("image_width", 1);
    const std::size_t channels = size_param("channels", 1);
    const std::size_t num_pixels = size_param("num_pixels", 1);
    const std::size_t pop_size = size_param("pop_size", 2);
    const int64_t seed = this->get_parameter("seed").as_int();

    AttackConfig config;
    config.F = this->get_parameter("de_F").as_double();
    config.CR = this->get_parameter("de_CR").as_double();
    config.target_class = size_param("target_class", 0);
    config.actual_class = size_param("actual_class", 0);
    config.max_generations = static_cast<int>(std::min<std::size_t>(
        size_param("max_generations", 0), static_cast<std::size_t>(std::numeric_limits<int>::max())));

    const std::size_t num_classes = size_param("num_classes", 1);
    if (config.target_class >= num_classes || config.actual_class >= num_classes) {
        throw std::invalid_argument("target_class/actual_class must be < num_classes");
    }

    Image img(channels, height, width, this->get_parameter("base_intensity").as_double());

    std::mt19937 init_rng;
    if (seed >= 0) {
        init_rng.seed(static_cast<unsigned int>(seed));
    } else {
        std::random_device rd;
        init_rng.seed(rd());
    }
    Population initial = random_population(pop_size, num_pixels, channels, height, width, init_rng);

    classifier_ = make_classifier(channels);
    if (seed >= 0) {
        attack_ = std::make_unique<DEAttack>(*classifier_, std::move(img), std::move(initial), config,
                                             static_cast<unsigned int>(seed) + 1u);
    } else {
        attack_ = std::make_unique<DEAttack>(*classifier_, std::move(img), std::move(initial), config);
    }

    RCLCPP_INFO(this->get_logger(),
    "Attack ready: %zux%zux%zu image, %zu agents x %zu pixels, F=%.2f CR=%.2f, target=%zu actual=%zu",
    channels, height, width, pop_size, num_pixels, config.F, config.CR,
    config.target_class, config.actual_class);
}

int main(int argc, char **argv) {
  rclcpp::init(argc, argv);
  int rc = 0;
  try {
    rclcpp::spin(std::make_shared<AttackNode>());
  } catch (const std::exception& e) {
    // 参数非法等配置错误
    RCLCPP_FATAL(rclcpp::get_logger("pixel_attack_node"), "Attack node aborted: %s", e.what());
    rc = 1;
  }
  rclcpp::shutdown();
  return rc;
}
