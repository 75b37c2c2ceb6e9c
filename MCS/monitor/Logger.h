#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <thread>
#include <ostream>
#include <condition_variable>
#include <atomic>

enum class LogLevel {
    Info,
    Warn,
    Error
};

// Asynchronous line logger: callers enqueue, one thread writes.
class Logger {
public:
    explicit Logger(std::ostream& sink);
    Logger();
    ~Logger();

    void start();
    void stop();

    void log(const std::string& msg);
    void log(LogLevel level, const std::string& msg);
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }

private:
    void run();

private:
    std::ostream& out;
    std::queue<std::string> messages;
    std::mutex mtx;
    std::condition_variable cv;
    std::atomic<bool> running{ false };
    std::thread worker;
};
