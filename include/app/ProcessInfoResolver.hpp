#pragma once
#include "collectors/IProcessInfoProvider.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace bwmon::app {

struct ProcessInfo {
  int32_t pid{};
  std::string process_name;
  std::string app_name;
  std::string cmdline;
};

// Resolves pids to display names, memoized per pid. The resolver cannot see
// pid reuse; callers invalidate() a pid when they detect it.
class ProcessInfoResolver {
public:
  explicit ProcessInfoResolver(std::shared_ptr<collectors::IProcessInfoProvider> provider);

  // Never throws. A vanished process yields "Unknown", an unexpected failure
  // "Error"; neither is cached.
  ProcessInfo resolve(int32_t pid);

  void invalidate(int32_t pid);
  void clear();
  [[nodiscard]] size_t cached() const;

  // "firefox.exe" -> "Firefox"
  [[nodiscard]] static std::string clean_process_name(std::string name);

private:
  std::string resolve_app_name(int32_t pid, const std::string& process_name);

  std::shared_ptr<collectors::IProcessInfoProvider> provider_;
  mutable std::mutex mu_;
  std::unordered_map<int32_t, ProcessInfo> cache_;
};

} // namespace bwmon::app
