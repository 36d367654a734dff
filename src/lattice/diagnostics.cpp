#include "diagnostics.hpp"
#include <chrono>
#include <ctime>
#include <spdlog/fmt/fmt.h>

namespace lattice {

namespace {

std::string local_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &seconds);
#else
    localtime_r(&seconds, &tm_buf);
#endif

    char stamp[16];
    std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm_buf);
    return fmt::format("{}.{:03}", stamp, ms);
}

} // namespace

void Diagnostics::add(Error error, spdlog::level::level_enum level) {
    spdlog::log(level, "{}", error.to_string());
    _entries.push_back({std::move(error), level, local_timestamp()});
    _trim();
}

size_t Diagnostics::count(ErrorCode code) const {
    size_t n = 0;
    for (const auto& e : _entries) {
        if (e.error.code() == code) ++n;
    }
    return n;
}

void Diagnostics::set_max_size(size_t max_size) {
    _max_size = max_size;
    _trim();
}

void Diagnostics::_trim() {
    while (_entries.size() > _max_size) {
        _entries.pop_front();
    }
}

} // namespace lattice
