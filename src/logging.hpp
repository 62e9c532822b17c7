#pragma once

#include <string>
#include <utility>

#include <spdlog/stopwatch.h>

namespace brewrecents {

// Install a stderr logger as the spdlog default. Level is warn, or debug
// when requested; SPDLOG_LEVEL from the environment overrides both.
void init_logging(bool debug);

// Logs the elapsed time of a named block at debug level on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(std::string block);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string block_;
    spdlog::stopwatch watch_;
};

} // namespace brewrecents
