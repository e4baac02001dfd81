#pragma once
#include "collectors/IProcessInfoProvider.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace bwmon::collectors {

// Linux provider backed by /proc. Sockets are attributed to a process by
// matching /proc/<pid>/fd/* "socket:[inode]" links against the inodes listed
// in /proc/net/{tcp,tcp6,udp,udp6}. Linux keeps no per-process network byte
// counters, so get_cumulative_io() always returns std::nullopt.
class ProcfsInfoProvider : public IProcessInfoProvider {
public:
  // desktop_dirs: directories scanned for *.desktop entries. Empty selects
  // the XDG defaults ($XDG_DATA_HOME/applications, $XDG_DATA_DIRS/*/applications).
  explicit ProcfsInfoProvider(std::vector<std::filesystem::path> desktop_dirs = {});

  std::vector<ConnectionCount> enumerate_active_connections() override;
  std::optional<std::filesystem::path> get_executable_path(int32_t pid) override;
  std::optional<IoCounters> get_cumulative_io(int32_t pid) override;
  std::optional<std::string> process_name(int32_t pid) override;
  std::optional<std::string> cmdline(int32_t pid) override;
  std::optional<std::string> product_name(const std::filesystem::path& exe) override;
  const char* name() const override { return "procfs"; }

  // Inodes of active inet sockets (TCP excluding LISTEN/CLOSE, all UDP).
  [[nodiscard]] static std::unordered_set<uint64_t> read_socket_inodes();

private:
  void build_desktop_index();

  std::vector<std::filesystem::path> desktop_dirs_;
  std::once_flag desktop_once_;
  std::unordered_map<std::string, std::string> desktop_names_; // exe basename -> Name
};

} // namespace bwmon::collectors
