#include "rcbeam/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace rcbeam {

namespace {

std::shared_ptr<spdlog::logger> create_logger() {
    if (auto existing = spdlog::get("rcbeam")) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt("rcbeam");
    created->set_level(spdlog::level::warn);
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace rcbeam
