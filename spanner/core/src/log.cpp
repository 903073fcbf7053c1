#include <spanner/core/log.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace spanner::core {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e][%n][%l] %v";

// The logger writes to a single dist_sink; sinks added later go through its
// own lock, so configure_logging() is safe while other threads log.
std::shared_ptr<spdlog::sinks::dist_sink_mt> root_sink() {
    static auto sink = [] {
        auto dist = std::make_shared<spdlog::sinks::dist_sink_mt>();
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern(kPattern);
        dist->add_sink(console);
        return dist;
    }();
    return sink;
}

std::shared_ptr<spdlog::logger> make_logger() {
    auto log = std::make_shared<spdlog::logger>("spanner", root_sink());
    log->set_level(spdlog::level::info);
    return log;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
}

void configure_logging(spdlog::level::level_enum level,
                       const std::optional<std::filesystem::path>& file) {
    static std::mutex configure_mutex;
    std::lock_guard<std::mutex> lock(configure_mutex);

    auto log = logger();
    if (file) {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file->string());
        sink->set_pattern(kPattern);
        root_sink()->add_sink(sink);
    }
    log->set_level(level);
}

} // namespace spanner::core
