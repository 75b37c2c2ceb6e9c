#include "Logger.h"
#include <iostream>

Logger::Logger(std::ostream& sink)
    : out(sink) {
}

Logger::Logger()
    : out(std::cout) {
}

Logger::~Logger() {
    stop();
}

void Logger::start() {
    if (running.exchange(true))
        return;
    worker = std::thread(&Logger::run, this);
}

void Logger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();

    if (worker.joinable())
        worker.join();
}

void Logger::log(const std::string& msg) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        messages.push(msg);
    }
    cv.notify_one();
}

void Logger::log(LogLevel level, const std::string& msg) {
    switch (level) {
    case LogLevel::Info:
        log("[INFO] " + msg);
        break;
    case LogLevel::Warn:
        log("[WARN] " + msg);
        break;
    case LogLevel::Error:
        log("[ERROR] " + msg);
        break;
    }
}

void Logger::run() {
    std::unique_lock<std::mutex> lock(mtx);
    for (;;) {
        cv.wait(lock, [&]() {
            return !messages.empty() || !running.load();
            });

        while (!messages.empty()) {
            std::string line = std::move(messages.front());
            messages.pop();

            lock.unlock();
            out << line << std::endl;
            lock.lock();
        }

        if (!running.load())
            break;
    }
}
