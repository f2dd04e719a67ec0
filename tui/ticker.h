#ifndef DRIVE_TUI_TICKER_H
#define DRIVE_TUI_TICKER_H

#include <atomic>
#include <functional>
#include <thread>
#include <utility>

namespace drive {

// Runs `step` over and over on its own thread while `running` holds.
// Stops and joins on destruction, so unwinding the owner never leaves
// the thread behind.
class TickerThread {
public:
    TickerThread(std::atomic<bool>& running, std::function<void()> step)
        : running_(running),
          thread_([this, step = std::move(step)] {
              while (running_) {
                  step();
              }
          }) {}

    ~TickerThread() { stop(); }

    void stop() {
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    std::atomic<bool>& running_;
    std::thread thread_;

    TickerThread(const TickerThread&) = delete;
    TickerThread& operator=(const TickerThread&) = delete;
};

}  // namespace drive

#endif  // DRIVE_TUI_TICKER_H
