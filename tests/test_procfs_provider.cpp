#include "minitest.hpp"
#include "collectors/ProcfsInfoProvider.hpp"
#include "util/Procfs.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

static const char* kNetHeader =
  "  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n";

static std::string net_row(const char* st, unsigned long inode) {
  return std::string("   0: 0100007F:1F90 0200007F:C350 ") + st +
         " 00000000:00000000 00:00000000 00000000  1000        0 " + std::to_string(inode) +
         " 1 0000000000000000 20 4 30 10 -1\n";
}

static void add_fd(const fs::path& root, int pid, int fd, const std::string& target) {
  auto dir = root / "proc" / std::to_string(pid) / "fd";
  fs::create_directories(dir);
  std::error_code ec;
  fs::remove(dir / std::to_string(fd), ec);
  fs::create_symlink(target, dir / std::to_string(fd));
}

static fs::path make_root() {
  auto root = fs::temp_directory_path() / ("bwmon_test_procfs_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "proc/net");
  std::ofstream(root / "proc/net/tcp") << kNetHeader
    << net_row("01", 1001)   // ESTABLISHED
    << net_row("0A", 1002)   // LISTEN
    << net_row("07", 1003)   // CLOSE
    << net_row("06", 0);     // TIME_WAIT, no inode
  std::ofstream(root / "proc/net/tcp6") << kNetHeader << net_row("01", 1004);
  std::ofstream(root / "proc/net/udp") << kNetHeader << net_row("07", 1005);
  // no udp6: missing tables are skipped

  // pid 100: two established sockets plus a listener and a pipe
  add_fd(root, 100, 3, "socket:[1001]");
  add_fd(root, 100, 4, "socket:[1004]");
  add_fd(root, 100, 5, "socket:[1002]");
  add_fd(root, 100, 6, "pipe:[77]");
  std::ofstream(root / "proc/100/comm") << "firefox\n";
  static const char kCmdline[] = "/usr/lib/firefox/firefox\0--new-tab\0";
  std::ofstream(root / "proc/100/cmdline") << std::string(kCmdline, sizeof(kCmdline) - 1);
  fs::create_symlink("/usr/lib/firefox/firefox", root / "proc/100/exe");

  // pid 200: one udp socket, binary replaced on disk
  add_fd(root, 200, 3, "socket:[1005]");
  std::ofstream(root / "proc/200/comm") << "syncthing\n";
  fs::create_symlink("/opt/syncthing/syncthing (deleted)", root / "proc/200/exe");

  // pid 300: listener only
  add_fd(root, 300, 3, "socket:[1002]");
  std::ofstream(root / "proc/300/comm") << "sshd\n";
  return root;
}

static fs::path make_desktop_dir(const fs::path& root) {
  auto dir = root / "applications";
  fs::create_directories(dir);
  std::ofstream(dir / "firefox.desktop") <<
    "[Desktop Entry]\nType=Application\nName=Firefox Web Browser\nExec=/usr/lib/firefox/firefox %u\n"
    "[Desktop Action private]\nName=Private Window\nExec=/usr/lib/firefox/firefox --private-window %u\n";
  std::ofstream(dir / "link.desktop") << "[Desktop Entry]\nType=Link\nName=Not An App\nExec=syncthing\n";
  std::ofstream(dir / "notes.txt") << "[Desktop Entry]\nType=Application\nName=Ignored\nExec=sshd\n";
  return dir;
}

struct ProcRootGuard {
  explicit ProcRootGuard(const fs::path& root) { ::setenv("BWMON_PROC_ROOT", root.c_str(), 1); }
  ~ProcRootGuard() { ::unsetenv("BWMON_PROC_ROOT"); }
};

TEST(procfs_socket_inodes_skip_listen_close_and_orphans) {
  auto root = make_root();
  ProcRootGuard guard(root);
  auto inodes = bwmon::collectors::ProcfsInfoProvider::read_socket_inodes();
  ASSERT_EQ(inodes.size(), 3u);
  ASSERT_TRUE(inodes.count(1001));
  ASSERT_TRUE(inodes.count(1004));
  // UDP has no connection state; every bound socket counts
  ASSERT_TRUE(inodes.count(1005));
  ASSERT_FALSE(inodes.count(1002));
  ASSERT_FALSE(inodes.count(1003));
  fs::remove_all(root);
}

TEST(procfs_enumerates_processes_with_active_sockets) {
  auto root = make_root();
  ProcRootGuard guard(root);
  bwmon::collectors::ProcfsInfoProvider p({root / "applications"});
  auto conns = p.enumerate_active_connections();
  std::sort(conns.begin(), conns.end(), [](const auto& a, const auto& b){ return a.pid < b.pid; });
  ASSERT_EQ(conns.size(), 2u);
  ASSERT_EQ(conns[0].pid, 100);
  ASSERT_EQ(conns[0].connection_count, 2u);
  ASSERT_EQ(conns[1].pid, 200);
  ASSERT_EQ(conns[1].connection_count, 1u);
  fs::remove_all(root);
}

TEST(procfs_process_metadata) {
  auto root = make_root();
  ProcRootGuard guard(root);
  bwmon::collectors::ProcfsInfoProvider p({root / "applications"});
  ASSERT_EQ(p.process_name(100).value_or(""), "firefox");
  ASSERT_EQ(p.cmdline(100).value_or(""), "/usr/lib/firefox/firefox --new-tab");
  ASSERT_EQ(p.get_executable_path(100).value_or("").string(), "/usr/lib/firefox/firefox");
  ASSERT_EQ(p.get_executable_path(200).value_or("").string(), "/opt/syncthing/syncthing");
  ASSERT_FALSE(p.get_cumulative_io(100).has_value());
  ASSERT_FALSE(p.process_name(999).has_value());
  ASSERT_FALSE(p.get_executable_path(300).has_value());
  fs::remove_all(root);
}

TEST(procfs_product_name_from_desktop_entries) {
  auto root = make_root();
  auto dir = make_desktop_dir(root);
  bwmon::collectors::ProcfsInfoProvider p({dir});
  ASSERT_EQ(p.product_name("/usr/lib/firefox/firefox").value_or(""), "Firefox Web Browser");
  ASSERT_FALSE(p.product_name("/opt/syncthing/syncthing").has_value());
  ASSERT_FALSE(p.product_name("/usr/sbin/sshd").has_value());
  fs::remove_all(root);
}

TEST(procfs_map_proc_path_only_remaps_proc) {
  ProcRootGuard guard("/tmp/fakeroot");
  ASSERT_EQ(bwmon::util::map_proc_path("/proc/net/tcp"), "/tmp/fakeroot/proc/net/tcp");
  ASSERT_EQ(bwmon::util::map_proc_path("/etc/hosts"), "/etc/hosts");
}
