#include <spanner/core/types.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace spanner::core {

SourceLocation SourceLocation::current(std::source_location where) {
    return SourceLocation{where.file_name(), where.line(), where.function_name()};
}

int64_t timestamp_to_nanoseconds(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(ts.time_since_epoch()).count();
}

Timestamp timestamp_from_nanoseconds(int64_t ns) noexcept {
    return Timestamp{std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds{ns})};
}

std::string format_timestamp(Timestamp ts) {
    int64_t ns = timestamp_to_nanoseconds(ts);
    int64_t secs = ns / 1'000'000'000;
    int64_t frac = ns % 1'000'000'000;
    if (frac < 0) {
        frac += 1'000'000'000;
        --secs;
    }

    auto seconds = static_cast<std::time_t>(secs);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(9) << std::setfill('0') << frac << 'Z';
    return oss.str();
}

std::string format_duration(Duration d) {
    auto ns = static_cast<double>(d.count());
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (ns < 1e3 && ns > -1e3) {
        oss << ns << "ns";
    } else if (ns < 1e6 && ns > -1e6) {
        oss << ns / 1e3 << "µs";
    } else if (ns < 1e9 && ns > -1e9) {
        oss << ns / 1e6 << "ms";
    } else {
        oss << ns / 1e9 << "s";
    }
    return oss.str();
}

} // namespace spanner::core
