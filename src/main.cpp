#include "app/Config.hpp"
#include "app/Monitor.hpp"
#include "app/SummaryManager.hpp"
#include "storage/SqliteStorage.hpp"
#include "util/Dates.hpp"
#include "util/Log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

static std::string human_bytes(uint64_t b) {
  const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  double v = static_cast<double>(b);
  int u = 0;
  while (v >= 1024.0 && u < 4) { v /= 1024.0; ++u; }
  char buf[32];
  std::snprintf(buf, sizeof(buf), u == 0 ? "%.0f %s" : "%.2f %s", v, units[u]);
  return buf;
}

static void print_usage() {
  std::printf(
    "Usage: bwmon [options] [command]\n"
    "Options:\n"
    "  --config PATH              config file (default $XDG_CONFIG_HOME/bwmon/config.toml)\n"
    "  --db PATH                  database file\n"
    "  --report-interval S        seconds between reports while monitoring (default 5)\n"
    "Commands (run once and exit):\n"
    "  --aggregate YYYY-MM-DD     build the daily summary for a date\n"
    "  --aggregate-range START END\n"
    "  --summary YYYY-MM-DD       print a daily summary\n"
    "  --dates                    list dates with summaries\n"
    "  --cleanup DAYS             delete samples older than DAYS\n"
    "Without a command, monitors until SIGINT/SIGTERM.\n");
}

static std::optional<bwmon::util::Date> date_arg(const char* text) {
  auto d = bwmon::util::parse_date(text);
  if (!d) std::fprintf(stderr, "bwmon: invalid date '%s' (expected YYYY-MM-DD)\n", text);
  return d;
}

static void print_report(bwmon::app::Monitor& monitor) {
  auto totals = monitor.total_bandwidth();
  std::printf("\nTotal: %s sent, %s received\n",
              human_bytes(totals.bytes_sent).c_str(), human_bytes(totals.bytes_recv).c_str());
  for (const auto& rp : monitor.top_n_processes(5)) {
    std::printf("  %7d  %-24s %12s\n", rp.pid, rp.usage.app_name.c_str(), human_bytes(rp.usage.total()).c_str());
  }
  for (const auto& rec : monitor.get_recommendations()) std::printf("  * %s\n", rec.c_str());
  if (auto w = monitor.permissions_warning()) std::printf("  (%s)\n", w->c_str());
  std::fflush(stdout);
}

static int run_command(const std::string& cmd, const std::vector<std::string>& args,
                       const bwmon::app::Config& cfg) {
  auto storage = std::make_shared<bwmon::storage::SqliteStorage>(cfg.db_path);
  bwmon::app::SummaryManager summary(storage, cfg.summary);
  if (cmd == "--aggregate") {
    auto d = date_arg(args[0].c_str());
    if (!d) return 2;
    summary.aggregate_date(*d);
    std::printf("Aggregated %s\n", bwmon::util::format_date(*d).c_str());
  } else if (cmd == "--aggregate-range") {
    auto start = date_arg(args[0].c_str());
    auto end = date_arg(args[1].c_str());
    if (!start || !end) return 2;
    auto n = summary.aggregate_date_range(*start, *end);
    std::printf("Aggregated %zu day(s)\n", n);
  } else if (cmd == "--summary") {
    auto d = date_arg(args[0].c_str());
    if (!d) return 2;
    auto rows = storage->get_daily_summary(*d);
    if (rows.empty()) std::printf("No summary for %s\n", bwmon::util::format_date(*d).c_str());
    for (const auto& r : rows) {
      std::printf("%-28s %12s sent %12s recv %12s total\n", r.app_name.c_str(),
                  human_bytes(r.bytes_sent).c_str(), human_bytes(r.bytes_recv).c_str(),
                  human_bytes(r.total_bytes).c_str());
    }
  } else if (cmd == "--dates") {
    for (const auto& d : storage->get_available_dates()) std::printf("%s\n", bwmon::util::format_date(d).c_str());
  } else if (cmd == "--cleanup") {
    int days = std::atoi(args[0].c_str());
    if (days <= 0) { std::fprintf(stderr, "bwmon: --cleanup expects a positive day count\n"); return 2; }
    auto n = summary.force_cleanup(days);
    std::printf("Deleted %llu sample(s)\n", static_cast<unsigned long long>(n));
  }
  return 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string db_override;
  int report_interval = 5;
  std::string command;
  std::vector<std::string> command_args;

  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    if (std::strcmp(a, "--config") == 0 && i + 1 < argc) config_path = argv[++i];
    else if (std::strcmp(a, "--db") == 0 && i + 1 < argc) db_override = argv[++i];
    else if (std::strcmp(a, "--report-interval") == 0 && i + 1 < argc) report_interval = std::atoi(argv[++i]);
    else if ((std::strcmp(a, "--aggregate") == 0 || std::strcmp(a, "--summary") == 0 ||
              std::strcmp(a, "--cleanup") == 0) && i + 1 < argc) {
      command = a;
      command_args = {argv[++i]};
    } else if (std::strcmp(a, "--aggregate-range") == 0 && i + 2 < argc) {
      command = a;
      command_args = {argv[i + 1], argv[i + 2]};
      i += 2;
    } else if (std::strcmp(a, "--dates") == 0) {
      command = a;
    } else if (std::strcmp(a, "-h") == 0 || std::strcmp(a, "--help") == 0) {
      print_usage();
      return 0;
    } else {
      std::fprintf(stderr, "bwmon: unknown or incomplete argument '%s'\n", a);
      print_usage();
      return 2;
    }
  }
  if (report_interval < 1) report_interval = 1;

  auto cfg = bwmon::app::load_config(config_path);
  if (!db_override.empty()) cfg.db_path = db_override;
  bwmon::util::set_log_level(cfg.log_level);

  try {
    if (!command.empty()) return run_command(command, command_args, cfg);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    bwmon::app::Monitor monitor(cfg);
    bwmon::util::log_info("main", "database %s", cfg.db_path.c_str());
    monitor.start();

    auto next_report = std::chrono::steady_clock::now() + std::chrono::seconds(report_interval);
    while (!g_stop.load()) {
      std::this_thread::sleep_for(100ms);
      if (std::chrono::steady_clock::now() >= next_report) {
        print_report(monitor);
        next_report += std::chrono::seconds(report_interval);
      }
    }
    monitor.stop();
  } catch (const bwmon::storage::StorageError& e) {
    std::fprintf(stderr, "bwmon: storage: %s\n", e.what());
    return 1;
  }
  return 0;
}
