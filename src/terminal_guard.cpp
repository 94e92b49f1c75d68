#include "terminal_guard.hpp"
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace connmgr_tui {

namespace {

// 显示光标、清除属性、关闭各类鼠标上报和括号粘贴、离开备用屏幕、恢复自动换行
const char *const RESTORE_SEQUENCE = "\033[?25h\033[0m"
                                     "\033[?1000l\033[?1002l\033[?1003l\033[?1006l"
                                     "\033[?2004l\033[?1049l\033[?7h";

} // namespace

std::atomic<bool> TerminalGuard::armed_{false};

TerminalGuard::TerminalGuard() {
  struct sigaction action;
  std::memset(&action, 0, sizeof(action));
  action.sa_handler = &TerminalGuard::handle_signal;
  sigemptyset(&action.sa_mask);

  for (size_t i = 0; i < FATAL_SIGNALS.size(); ++i)
    sigaction(FATAL_SIGNALS[i], &action, &previous_actions_[i]);

  // 终端断开后的写入不应杀死进程
  struct sigaction ignore;
  std::memset(&ignore, 0, sizeof(ignore));
  ignore.sa_handler = SIG_IGN;
  sigemptyset(&ignore.sa_mask);
  sigaction(SIGPIPE, &ignore, &previous_pipe_action_);

  armed_.store(true);
}

TerminalGuard::~TerminalGuard() {
  restore_terminal();
  for (size_t i = 0; i < FATAL_SIGNALS.size(); ++i)
    sigaction(FATAL_SIGNALS[i], &previous_actions_[i], nullptr);
  sigaction(SIGPIPE, &previous_pipe_action_, nullptr);
}

void TerminalGuard::restore_terminal() {
  // 写入失败时保持armed，析构时再试一次
  if (armed_.exchange(false) && !write_sequence(RESTORE_SEQUENCE))
    armed_.store(true);
}

bool TerminalGuard::write_sequence(const char *sequence) {
  if (!sequence)
    return false;

  const size_t length = std::strlen(sequence);
  int fd = open("/dev/tty", O_WRONLY | O_NOCTTY);
  if (fd >= 0) {
    bool written = write(fd, sequence, length) == static_cast<ssize_t>(length);
    close(fd);
    if (written)
      return true;
  }
  return write(STDOUT_FILENO, sequence, length) == static_cast<ssize_t>(length);
}

void TerminalGuard::handle_signal(int sig) {
  restore_terminal();
  std::_Exit(128 + sig);
}

} // namespace connmgr_tui
