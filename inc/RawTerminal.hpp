#ifndef _RAW_TERMINAL_HPP_
#define _RAW_TERMINAL_HPP_

#include "PCH.h"

#include <termios.h>
#include <unistd.h>
#include <poll.h>
#include <csignal>

/**
 * @class RawTerminal
 * @brief 作用域内把终端切成逐键、无回显模式
 *
 * 析构时恢复原设置；SIGTERM 时由信号处理函数恢复。
 * fd 不是终端（管道、重定向）时只负责读键。
 * 同一时间只应存在一个实例（保存的设置是静态的，供信号处理函数访问）。
 */
class RawTerminal
{
public:
    static constexpr int kNoKey = -1;
    static constexpr int kEndOfInput = -2;

    explicit RawTerminal(int fd = STDIN_FILENO) : m_fd(fd)
    {
        if (!isatty(m_fd) || tcgetattr(m_fd, &s_saved) != 0)
        {
            spdlog::warn("[Terminal] fd {} is not a terminal, keys are read as they arrive", m_fd);
            return;
        }

        termios raw = s_saved;
        raw.c_lflag &= ~(ICANON | ECHO | ISIG);
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        if (tcsetattr(m_fd, TCSANOW, &raw) != 0)
        {
            spdlog::warn("[Terminal] Failed to enter raw mode");
            return;
        }
        s_fd.store(m_fd);
        s_raw.store(true);
        std::signal(SIGTERM, &RawTerminal::onTerminate);
    }

    ~RawTerminal()
    {
        if (s_raw.load())
            std::signal(SIGTERM, SIG_DFL);
        restore();
    }

    RawTerminal(const RawTerminal &) = delete;
    RawTerminal &operator=(const RawTerminal &) = delete;

    bool isRaw() const
    {
        return s_raw.load();
    }

    // 最多等待 timeout；返回键值、kNoKey 或 kEndOfInput
    int readKey(std::chrono::milliseconds timeout) const
    {
        pollfd pfd{m_fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready <= 0)
            return kNoKey;

        unsigned char c = 0;
        const ssize_t n = ::read(m_fd, &c, 1);
        if (n == 0)
            return kEndOfInput;
        return n < 0 ? kNoKey : c;
    }

private:
    static void restore()
    {
        if (s_raw.exchange(false))
            tcsetattr(s_fd.load(), TCSANOW, &s_saved);
    }

    // 只调用 async-signal-safe 的函数
    static void onTerminate(int signum)
    {
        if (s_raw.load())
            tcsetattr(s_fd.load(), TCSANOW, &s_saved);
        _exit(128 + signum);
    }

    int m_fd;

    static inline termios s_saved{};
    static inline std::atomic<int> s_fd{STDIN_FILENO};
    static inline std::atomic<bool> s_raw{false};
};

#endif
