/* -- C++ -- */
/**
 *  @file  apps/include/StatusMonitor.hh
 *
 *  @brief Periodic heartbeat that logs how many yield scans have finished
 *         while a renormalisation run is in progress.
 */
#ifndef FIDNORM_APPS_STATUS_MONITOR_H
#define FIDNORM_APPS_STATUS_MONITOR_H

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "AppLog.hh"



class StatusMonitor
{
  public:
    using ProgressFn = std::function<std::string()>;

    StatusMonitor(const std::string &log_prefix,
                  const std::string &message,
                  ProgressFn progress = ProgressFn(),
                  const std::chrono::seconds interval = std::chrono::minutes(1))
        : log_prefix_(log_prefix),
          message_(message),
          progress_(std::move(progress)),
          interval_(interval),
          start_time_(std::chrono::steady_clock::now()),
          worker_(&StatusMonitor::run_loop, this)
    {
    }

    ~StatusMonitor()
    {
        stop();
    }

    StatusMonitor(const StatusMonitor &) = delete;
    StatusMonitor &operator=(const StatusMonitor &) = delete;

    void stop()
    {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            done_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    double elapsed_seconds() const
    {
        const auto elapsed = std::chrono::steady_clock::now() - start_time_;
        return std::chrono::duration_cast<std::chrono::duration<double>>(elapsed).count();
    }

  private:
    void run_loop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!done_)
        {
            if (cv_.wait_for(lock, interval_, [this]() { return done_; }))
            {
                break;
            }
            std::ostringstream out;
            out << message_;
            if (progress_)
            {
                out << " " << progress_();
            }
            out << " elapsed_s=" << format_seconds(elapsed_seconds());
            log_info(log_prefix_, out.str());
        }
    }

    std::string log_prefix_;
    std::string message_;
    ProgressFn progress_;
    std::chrono::seconds interval_;
    std::chrono::steady_clock::time_point start_time_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
    std::thread worker_;
};



#endif // FIDNORM_APPS_STATUS_MONITOR_H
