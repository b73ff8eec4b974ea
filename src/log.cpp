#include "fineinput/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace fineinput::log {

namespace {

void defaultSink(Level level, std::string_view message) {
    switch (level) {
        case Level::Debug:
        case Level::Info:
            std::cout << "[fineinput] " << message << "\n";
            break;
        case Level::Warning:
            std::cerr << "[fineinput] WARNING: " << message << "\n";
            break;
        case Level::Error:
            std::cerr << "[fineinput] ERROR: " << message << "\n";
            break;
    }
}

std::mutex& sinkMutex() {
    static std::mutex mutex;
    return mutex;
}

Sink& currentSink() {
    static Sink sink = defaultSink;
    return sink;
}

std::atomic<bool> debugFlag{false};

void emit(Level level, std::string_view message) {
    std::lock_guard lock(sinkMutex());
    currentSink()(level, message);
}

}  // namespace

void setSink(Sink sink) {
    std::lock_guard lock(sinkMutex());
    currentSink() = sink ? std::move(sink) : Sink(defaultSink);
}

void resetSink() {
    setSink(defaultSink);
}

void setDebugEnabled(bool enabled) {
    debugFlag.store(enabled, std::memory_order_relaxed);
}

bool debugEnabled() {
    return debugFlag.load(std::memory_order_relaxed);
}

void debug(std::string_view message) {
    if (debugEnabled()) {
        emit(Level::Debug, message);
    }
}

void info(std::string_view message) {
    emit(Level::Info, message);
}

void warn(std::string_view message) {
    emit(Level::Warning, message);
}

void error(std::string_view message) {
    emit(Level::Error, message);
}

}  // namespace fineinput::log
