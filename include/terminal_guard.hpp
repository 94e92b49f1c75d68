#pragma once

#include <array>
#include <atomic>
#include <csignal>
#include <cstddef>

namespace connmgr_tui {

/**
 * @brief 终端状态守卫
 *
 * 构造时为致命信号安装处理器，析构或收到信号时把终端复位到普通模式
 * （显示光标、关闭鼠标上报、离开备用屏幕）。析构时恢复原有的信号处理器。
 * 同一时刻只允许存在一个实例。
 */
class TerminalGuard {
public:
  TerminalGuard();
  ~TerminalGuard();

  TerminalGuard(const TerminalGuard &) = delete;
  TerminalGuard &operator=(const TerminalGuard &) = delete;

  /**
   * @brief 复位终端，成功后不再重复执行，可在信号处理器中调用
   */
  static void restore_terminal();

  /**
   * @brief 向/dev/tty写入控制序列，TTY不可用时写stdout
   *
   * 只使用异步信号安全的系统调用。
   * @return 是否写入成功
   */
  static bool write_sequence(const char *sequence);

private:
  static constexpr size_t SIGNAL_COUNT = 5;
  static constexpr std::array<int, SIGNAL_COUNT> FATAL_SIGNALS = {SIGINT, SIGTERM, SIGQUIT, SIGHUP, SIGABRT};

  std::array<struct sigaction, SIGNAL_COUNT> previous_actions_{};
  struct sigaction previous_pipe_action_{};

  static std::atomic<bool> armed_;

  static void handle_signal(int sig);
};

} // namespace connmgr_tui
