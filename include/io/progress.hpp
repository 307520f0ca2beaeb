// progress.hpp — batch progress bar (indicators) polled from an atomic counter
#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <indicators/cursor_control.hpp>
#include <indicators/progress_bar.hpp>

#include "io/term_utils.hpp"

namespace io {

class ProgressManager {
public:
    ProgressManager(const std::atomic<std::size_t>& done, std::size_t total)
    : done_(done), total_(total) {}

    ~ProgressManager() { stop(); }

    ProgressManager(const ProgressManager&) = delete;
    ProgressManager& operator=(const ProgressManager&) = delete;

    void start() {
        indicators::show_console_cursor(false);
        const int cols = get_terminal_width();
        const int barW = std::clamp(cols - 50, 10, 50);
        bar_ = std::make_unique<indicators::ProgressBar>(
            indicators::option::BarWidth{static_cast<std::size_t>(barW)},
            indicators::option::Start{"["},
            indicators::option::Fill{"="},
            indicators::option::Lead{">"},
            indicators::option::Remainder{" "},
            indicators::option::End{"]"},
            indicators::option::PrefixText{"trials "},
            indicators::option::ForegroundColor{indicators::Color::green},
            indicators::option::ShowElapsedTime{true},
            indicators::option::ShowRemainingTime{true},
            indicators::option::MaxProgress{total_},
            indicators::option::Stream{std::cerr}
        );

        stop_flag_.store(false, std::memory_order_relaxed);
        th_ = std::thread([this](){
            using namespace std::chrono_literals;
            std::size_t last = static_cast<std::size_t>(-1);
            for (;;) {
                const std::size_t n = done_.load(std::memory_order_relaxed);
                if (n != last) {
                    std::ostringstream oss;
                    oss << n << "/" << total_;
                    bar_->set_option(indicators::option::PostfixText{oss.str()});
                    bar_->set_progress(n);
                    last = n;
                }
                if (n >= total_ || stop_flag_.load(std::memory_order_relaxed)) break;
                std::this_thread::sleep_for(100ms);
            }
            if (!bar_->is_completed()) bar_->mark_as_completed();
            indicators::show_console_cursor(true);
        });
    }

    void stop() {
        stop_flag_.store(true, std::memory_order_relaxed);
        if (th_.joinable()) th_.join();
        bar_.reset();
    }

private:
    const std::atomic<std::size_t>& done_;
    std::size_t total_;

    std::unique_ptr<indicators::ProgressBar> bar_;
    std::atomic<bool> stop_flag_{false};
    std::thread th_;
};

} // namespace io
