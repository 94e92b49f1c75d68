#pragma once

#include "../tui_types.hpp"
#include <functional>

namespace connmgr_tui {

enum class GateOutcome { Confirmed, Cancelled, Swallowed };

/**
 * @brief 退出确认门
 *
 * 激活期间独占所有输入，只识别确认(y/Y)和取消(n/N/Esc)，其他按键一律吞掉。
 * 只读写模式本身，从不触碰导航器或模块选择器的状态。
 */
class ConfirmationGate {
public:
  explicit ConfirmationGate(Mode &mode);

  bool is_active() const { return is_confirm_pending(mode_); }

  /**
   * @brief 进入确认状态，记住当前模式以便取消时恢复
   *
   * 已经处于确认状态时不做任何事。
   */
  void open();

  /**
   * @brief 处理确认期间的按键
   */
  GateOutcome handle(InputKey key);

  /// 确认退出：通知退出回调
  void confirm();

  /// 取消：原样恢复打开前的模式
  void cancel();

  void set_quit_callback(std::function<void()> callback);

private:
  Mode &mode_;
  std::function<void()> quit_callback_;
};

} // namespace connmgr_tui
