#include "logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace brewrecents {

void init_logging(bool debug) {
    auto logger = spdlog::get("brew-recents");
    if (!logger) {
        logger = spdlog::stderr_color_mt("brew-recents");
    }
    logger->set_pattern("%^[%l]%$ (+%ims) %v");
    spdlog::set_default_logger(logger);

    spdlog::set_level(debug ? spdlog::level::debug : spdlog::level::warn);
    spdlog::cfg::load_env_levels();
}

ScopedTimer::ScopedTimer(std::string block)
    : block_(std::move(block)) {
    spdlog::debug("Starting block '{}'", block_);
}

ScopedTimer::~ScopedTimer() {
    spdlog::debug("Block '{}' took {:.3f}s", block_, watch_.elapsed().count());
}

} // namespace brewrecents
