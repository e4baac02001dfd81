#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bwmon::collectors {

struct ConnectionCount {
  int32_t pid{};
  uint32_t connection_count{};
};

struct IoCounters {
  uint64_t bytes_sent{};
  uint64_t bytes_recv{};
};

// OS process enumeration and metadata lookup. Every per-pid query returns
// std::nullopt when the process is gone or access is denied; callers treat
// that as "skip this pid", never as fatal.
class IProcessInfoProvider {
public:
  virtual ~IProcessInfoProvider() = default;

  // Processes holding at least one active inet socket.
  [[nodiscard]] virtual std::vector<ConnectionCount> enumerate_active_connections() = 0;

  [[nodiscard]] virtual std::optional<std::filesystem::path> get_executable_path(int32_t pid) = 0;

  // Cumulative per-process network byte counters, if the platform keeps them.
  [[nodiscard]] virtual std::optional<IoCounters> get_cumulative_io(int32_t pid) = 0;

  [[nodiscard]] virtual std::optional<std::string> process_name(int32_t pid) = 0;
  [[nodiscard]] virtual std::optional<std::string> cmdline(int32_t pid) = 0;

  // Vendor/product display name recorded for an executable, if any.
  [[nodiscard]] virtual std::optional<std::string> product_name(const std::filesystem::path& exe) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace bwmon::collectors
