#ifndef SKILLBENCH_CORE_TIME_UTILS_HPP_
#define SKILLBENCH_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <string_view>

namespace skillbench::core {

// Canonical UTC timestamp formatter used by records, snapshots and logs.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

inline std::string NowUtcTimestamp() {
  return FormatUtcTimestamp(std::chrono::system_clock::now());
}

// `<prefix>-<epoch_ms>-<8 hex>`. Millisecond stamp keeps ids sortable by
// creation time; the random tail separates ids minted in the same tick.
inline std::string MakePrefixedId(std::string_view prefix) {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<unsigned int> dist(0U, 0xFFFFFFFFU);

  std::ostringstream out;
  out << prefix << '-' << millis << '-' << std::hex << std::setw(8) << std::setfill('0')
      << dist(rng);
  return out.str();
}

// Random RFC 4122 version-4 id. Skill directories are named after the first
// eight characters, so ids must not share a fixed prefix.
inline std::string MakeRandomUuid() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  const std::uint64_t high = (rng() & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  const std::uint64_t low = (rng() & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::ostringstream out;
  out << std::hex << std::setfill('0') << std::setw(8) << (high >> 32U) << '-' << std::setw(4)
      << ((high >> 16U) & 0xFFFFU) << '-' << std::setw(4) << (high & 0xFFFFU) << '-'
      << std::setw(4) << (low >> 48U) << '-' << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
  return out.str();
}

} // namespace skillbench::core

#endif // SKILLBENCH_CORE_TIME_UTILS_HPP_
