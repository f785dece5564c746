#ifndef PIXEL_ATTACK_CORE__ATTACK_NODE_HPP_
#define PIXEL_ATTACK_CORE__ATTACK_NODE_HPP_

#include "rclcpp/rclcpp.hpp"
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>

#include "pixel_attack_core/classifier.hpp"
#include "pixel_attack_core/de_attack.hpp"

class AttackNode : public rclcpp::Node
{
public:
  AttackNode();
  ~AttackNode() override;

private:
  // 核心循环
  void tick_callback();

  void init_attack();
  std::unique_ptr<Classifier> make_classifier(std::size_t channels);
  void record_local_log();
  // 读取整数参数并检查下界, 非法时抛 std::invalid_argument
  std::size_t size_param(const std::string& name, int64_t min_value);
  void finish();

  int generations_per_tick_;
  bool is_finished_;

  // CSV 日志
  bool enable_csv_log_;
  std::string log_dir_;
  std::ofstream csv_out_;

  rclcpp::TimerBase::SharedPtr timer_;

  // classifier_ 必须先于 attack_ 构造, 后于 attack_ 析构
  std::unique_ptr<Classifier> classifier_;
  std::unique_ptr<DEAttack> attack_;
};

#endif
