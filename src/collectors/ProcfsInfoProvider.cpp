#include "collectors/ProcfsInfoProvider.hpp"
#include "util/KeyFileReader.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"

#include <cstdlib>
#include <sstream>

namespace fs = std::filesystem;

namespace bwmon::collectors {

namespace {

constexpr const char* kTcpListen = "0A";
constexpr const char* kTcpClose = "07";

void parse_net_table(const std::string& path, bool tcp, std::unordered_set<uint64_t>& out) {
  auto txt = util::read_file_string(path);
  if (!txt) return; // e.g. no IPv6
  std::istringstream ss(*txt);
  std::string line;
  std::getline(ss, line); // header
  while (std::getline(ss, line)) {
    // sl local_address rem_address st tx_queue:rx_queue tr:tm->when retrnsmt uid timeout inode
    std::istringstream ls(line);
    std::string sl, local, remote, st, queues, timer, retr, uid, timeout;
    uint64_t inode = 0;
    if (!(ls >> sl >> local >> remote >> st >> queues >> timer >> retr >> uid >> timeout >> inode)) continue;
    if (inode == 0) continue; // TIME_WAIT entries have no owning socket
    if (tcp && (st == kTcpListen || st == kTcpClose)) continue;
    out.insert(inode);
  }
}

// "socket:[12345]" -> 12345
std::optional<uint64_t> socket_inode(const std::string& link) {
  constexpr std::string_view prefix = "socket:[";
  if (link.size() <= prefix.size() + 1 || link.compare(0, prefix.size(), prefix) != 0 || link.back() != ']')
    return std::nullopt;
  try {
    return std::stoull(link.substr(prefix.size(), link.size() - prefix.size() - 1));
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::vector<fs::path> default_desktop_dirs() {
  std::vector<fs::path> dirs;
  if (const char* home_data = std::getenv("XDG_DATA_HOME"); home_data && *home_data) {
    dirs.emplace_back(fs::path(home_data) / "applications");
  } else if (const char* home = std::getenv("HOME"); home && *home) {
    dirs.emplace_back(fs::path(home) / ".local/share/applications");
  }
  std::string data_dirs = "/usr/local/share:/usr/share";
  if (const char* env = std::getenv("XDG_DATA_DIRS"); env && *env) data_dirs = env;
  std::istringstream ss(data_dirs);
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (!dir.empty()) dirs.emplace_back(fs::path(dir) / "applications");
  }
  return dirs;
}

// Program named by an Exec= line: first token after any "env VAR=..." prefix.
std::string exec_program(const std::string& exec) {
  std::istringstream ss(exec);
  std::string tok;
  while (ss >> tok) {
    if (tok.size() >= 2 && tok.front() == '"' && tok.back() == '"') tok = tok.substr(1, tok.size() - 2);
    if (tok == "env" || tok.find('=') != std::string::npos) continue;
    return fs::path(tok).filename().string();
  }
  return {};
}

} // namespace

ProcfsInfoProvider::ProcfsInfoProvider(std::vector<fs::path> desktop_dirs)
    : desktop_dirs_(std::move(desktop_dirs)) {
  if (desktop_dirs_.empty()) desktop_dirs_ = default_desktop_dirs();
}

std::unordered_set<uint64_t> ProcfsInfoProvider::read_socket_inodes() {
  std::unordered_set<uint64_t> inodes;
  parse_net_table("/proc/net/tcp", true, inodes);
  parse_net_table("/proc/net/tcp6", true, inodes);
  parse_net_table("/proc/net/udp", false, inodes);
  parse_net_table("/proc/net/udp6", false, inodes);
  return inodes;
}

std::vector<ConnectionCount> ProcfsInfoProvider::enumerate_active_connections() {
  std::vector<ConnectionCount> out;
  auto inodes = read_socket_inodes();
  if (inodes.empty()) return out;
  for (const auto& name : util::list_dir("/proc")) {
    if (!util::is_number(name)) continue;
    int32_t pid = static_cast<int32_t>(std::strtol(name.c_str(), nullptr, 10));
    auto fd_dir = std::string("/proc/") + name + "/fd";
    uint32_t count = 0;
    // Unreadable fd dir (other user's process without privileges) lists as empty
    for (const auto& fd : util::list_dir(fd_dir)) {
      auto link = util::read_symlink(fd_dir + "/" + fd);
      if (!link) continue;
      auto inode = socket_inode(*link);
      if (inode && inodes.count(*inode)) ++count;
    }
    if (count > 0) out.push_back(ConnectionCount{pid, count});
  }
  return out;
}

std::optional<fs::path> ProcfsInfoProvider::get_executable_path(int32_t pid) {
  auto link = util::read_symlink("/proc/" + std::to_string(pid) + "/exe");
  if (!link || link->empty()) return std::nullopt;
  constexpr std::string_view deleted = " (deleted)";
  std::string p = *link;
  if (p.size() > deleted.size() && p.compare(p.size() - deleted.size(), deleted.size(), deleted) == 0)
    p.resize(p.size() - deleted.size());
  return fs::path(p);
}

std::optional<IoCounters> ProcfsInfoProvider::get_cumulative_io(int32_t) {
  return std::nullopt;
}

std::optional<std::string> ProcfsInfoProvider::process_name(int32_t pid) {
  auto comm = util::read_file_string("/proc/" + std::to_string(pid) + "/comm");
  if (!comm) return std::nullopt;
  std::string s = *comm;
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
  if (s.empty()) return std::nullopt;
  return s;
}

std::optional<std::string> ProcfsInfoProvider::cmdline(int32_t pid) {
  auto bytes = util::read_file_bytes("/proc/" + std::to_string(pid) + "/cmdline");
  if (!bytes) return std::nullopt;
  std::string out; out.reserve(bytes->size()); bool sep = true;
  for (auto b : *bytes) {
    if (b == 0) { if (!sep) { out.push_back(' '); sep = true; } }
    else { out.push_back(static_cast<char>(b)); sep = false; }
  }
  if (!out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

std::optional<std::string> ProcfsInfoProvider::product_name(const fs::path& exe) {
  std::call_once(desktop_once_, [this]{ build_desktop_index(); });
  auto it = desktop_names_.find(exe.filename().string());
  if (it == desktop_names_.end()) return std::nullopt;
  return it->second;
}

void ProcfsInfoProvider::build_desktop_index() {
  size_t entries = 0;
  for (const auto& dir : desktop_dirs_) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec), end;
    if (ec) continue;
    for (; it != end; it.increment(ec)) {
      if (ec) break;
      const auto& path = it->path();
      if (path.extension() != ".desktop") continue;
      util::KeyFileReader kf;
      if (!kf.load(path.string())) continue;
      constexpr const char* group = "Desktop Entry";
      if (kf.get_string(group, "Type", "Application") != "Application") continue;
      auto display = kf.get_string(group, "Name");
      if (display.empty()) continue;
      for (const char* key : {"TryExec", "Exec"}) {
        auto prog = exec_program(kf.get_string(group, key));
        if (!prog.empty()) desktop_names_.emplace(prog, display); // earlier dirs take precedence
      }
      ++entries;
    }
  }
  util::log_debug("ProcfsInfoProvider", "indexed %zu desktop entries (%zu executables)",
                  entries, desktop_names_.size());
}

} // namespace bwmon::collectors
