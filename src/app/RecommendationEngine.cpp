#include "app/RecommendationEngine.hpp"
#include "util/Log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <iterator>
#include <string_view>

namespace bwmon::app {

namespace {

constexpr double kMiB = 1024.0 * 1024.0;

constexpr std::array<std::string_view, 9> kSyncServices = {
  "onedrive", "dropbox", "googledrivesync", "google drive",
  "icloud", "sync", "backup", "megasync", "pcloud"};

constexpr std::array<std::string_view, 6> kSystemProcesses = {
  "svchost", "system", "windows update", "wuauclt", "trustedinstaller", "tiworker"};

// Matched as whole words only: "apt" must not hit "Laptop".
// unattended-upgr: comm is truncated to 15 characters
constexpr std::array<std::string_view, 6> kLinuxSystemProcesses = {
  "systemd", "packagekit", "unattended-upgr", "apt", "dnf", "snapd"};

std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

template <size_t N>
bool contains_any(const std::string& haystack, const std::array<std::string_view, N>& needles) {
  return std::any_of(needles.begin(), needles.end(),
                     [&](std::string_view n) { return haystack.find(n) != std::string::npos; });
}

bool is_word_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

template <size_t N>
bool contains_any_word(const std::string& haystack, const std::array<std::string_view, N>& words) {
  for (std::string_view w : words) {
    for (size_t pos = haystack.find(w); pos != std::string::npos; pos = haystack.find(w, pos + 1)) {
      size_t end = pos + w.size();
      bool starts = pos == 0 || !is_word_char(haystack[pos - 1]);
      bool ends = end == haystack.size() || !is_word_char(haystack[end]);
      if (starts && ends) return true;
    }
  }
  return false;
}

double share_pct(uint64_t part, uint64_t total) {
  return static_cast<double>(part) / static_cast<double>(total) * 100.0;
}

std::string format_msg(const char* f, auto... args) {
  int n = std::snprintf(nullptr, 0, f, args...);
  if (n <= 0) return {};
  std::string out(static_cast<size_t>(n), '\0');
  std::snprintf(out.data(), out.size() + 1, f, args...);
  return out;
}

void check_dominant_apps(const std::vector<AppUsage>& apps, uint64_t total, std::vector<std::string>& out) {
  for (const auto& a : apps) {
    double pct = share_pct(a.total, total);
    if (pct <= 50.0) continue;
    auto name = lower(a.app_name);
    const char* action;
    if (name.find("chrome") != std::string::npos || name.find("firefox") != std::string::npos ||
        name.find("edge") != std::string::npos)
      action = "Consider pausing video playback or closing unused tabs.";
    else if (name.find("steam") != std::string::npos || name.find("epic") != std::string::npos ||
             name.find("origin") != std::string::npos)
      action = "Pause game downloads or updates.";
    else if (name.find("torrent") != std::string::npos)
      action = "Pause or limit torrent downloads.";
    else
      action = "Consider closing or limiting this application.";
    out.push_back(format_msg("%s is using %.0f%% of bandwidth (%.2f MB/s). %s",
                      a.app_name.c_str(), pct, a.total / kMiB, action));
  }
}

void check_sync_services(const std::vector<AppUsage>& apps, uint64_t total, std::vector<std::string>& out) {
  uint64_t sync_total = 0;
  std::string names;
  for (const auto& a : apps) {
    if (!contains_any(lower(a.app_name), kSyncServices)) continue;
    sync_total += a.total;
    if (!names.empty()) names += ", ";
    names += a.app_name;
  }
  if (sync_total == 0) return;
  double pct = share_pct(sync_total, total);
  if (pct <= 20.0) return;
  out.push_back(format_msg("Background sync services (%s) are using %.0f%% of bandwidth (%.2f MB/s). "
                    "Consider pausing cloud sync temporarily.",
                    names.c_str(), pct, sync_total / kMiB));
}

void check_system_processes(const std::vector<AppUsage>& apps, uint64_t total, std::vector<std::string>& out) {
  for (const auto& a : apps) {
    auto name = lower(a.app_name);
    if (!contains_any(name, kSystemProcesses) && !contains_any_word(name, kLinuxSystemProcesses)) continue;
    double pct = share_pct(a.total, total);
    if (pct <= 15.0) continue;
    out.push_back(format_msg("System process (%s) is using %.0f%% of bandwidth (%.2f MB/s). "
                      "This may be a system update or maintenance task; consider deferring updates.",
                      a.app_name.c_str(), pct, a.total / kMiB));
  }
}

void check_threshold(uint64_t total, uint64_t threshold, std::vector<std::string>& out) {
  if (total <= threshold) return;
  out.push_back(format_msg("High bandwidth usage detected: %.2f MB/s (threshold: %.2f MB/s). "
                    "Consider enabling data saver mode in browsers and streaming apps.",
                    total / kMiB, threshold / kMiB));
}

void check_multiple_apps(const std::vector<AppUsage>& apps, uint64_t total, std::vector<std::string>& out) {
  struct Moderate { const AppUsage* app; double pct; };
  std::vector<Moderate> moderate;
  for (const auto& a : apps) {
    double pct = share_pct(a.total, total);
    if (pct >= 10.0 && pct <= 50.0) moderate.push_back({&a, pct});
  }
  if (moderate.size() < 3) return;
  uint64_t combined = 0;
  for (const auto& m : moderate) combined += m.app->total;
  std::string listed;
  for (size_t i = 0; i < 3; ++i) {
    if (i) listed += ", ";
    listed += format_msg("%s (%.0f%%)", moderate[i].app->app_name.c_str(), moderate[i].pct);
  }
  out.push_back(format_msg("Multiple applications are actively using bandwidth: %s. "
                    "Combined usage: %.2f MB/s. Consider closing non-essential applications.",
                    listed.c_str(), combined / kMiB));
}

} // namespace

RecommendationEngine::RecommendationEngine(uint64_t threshold_bytes) : threshold_(threshold_bytes) {}

void RecommendationEngine::set_threshold(uint64_t threshold_bytes) {
  threshold_.store(threshold_bytes);
  util::log_info("RecommendationEngine", "bandwidth threshold set to %.2f MB/s", threshold_bytes / kMiB);
}

std::vector<AppUsage> RecommendationEngine::aggregate_by_app(const model::Snapshot& snapshot) {
  std::vector<AppUsage> apps;
  for (const auto& [pid, u] : snapshot.processes) {
    const std::string& name = u.app_name.empty() ? u.process_name : u.app_name;
    auto it = std::find_if(apps.begin(), apps.end(), [&](const AppUsage& a) { return a.app_name == name; });
    if (it == apps.end()) {
      apps.push_back(AppUsage{name, 0, 0, 0, {}});
      it = std::prev(apps.end());
    }
    it->bytes_sent += u.bytes_sent;
    it->bytes_recv += u.bytes_recv;
    it->total += u.total();
    it->pids.push_back(pid);
  }
  return apps;
}

std::vector<std::string> RecommendationEngine::evaluate(const model::Snapshot& snapshot,
                                                        const model::BandwidthTotals& totals) const {
  std::vector<std::string> out;
  if (snapshot.empty() || totals.total == 0) return out;
  const uint64_t total = totals.total;
  const auto apps = aggregate_by_app(snapshot);

  check_dominant_apps(apps, total, out);
  check_sync_services(apps, total, out);
  check_system_processes(apps, total, out);
  check_threshold(total, threshold_.load(), out);
  check_multiple_apps(apps, total, out);
  return out;
}

} // namespace bwmon::app
