#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace fieldsync {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

// Source of "now". Injected wherever a timestamp ends up in a merged value so
// that identical inputs produce identical outputs.
using Clock = std::function<Timestamp()>;

Timestamp now() noexcept;
Clock system_clock();
Clock fixed_clock(Timestamp at);

inline Timestamp from_millis(int64_t ms) noexcept {
    return Timestamp(std::chrono::milliseconds(ms));
}

inline int64_t to_millis(Timestamp ts) noexcept {
    return ts.time_since_epoch().count();
}

// 2026-10-19T08:30:00.000Z
std::string to_iso8601(Timestamp ts);

// Accepts "YYYY-MM-DDTHH:MM:SS[.mmm]Z"; returns nullopt on anything else.
std::optional<Timestamp> parse_iso8601(std::string_view text);

} // namespace fieldsync
