#include "app/ProcessInfoResolver.hpp"
#include "util/Log.hpp"

#include <cctype>
#include <string_view>

namespace bwmon::app {

ProcessInfoResolver::ProcessInfoResolver(std::shared_ptr<collectors::IProcessInfoProvider> provider)
    : provider_(std::move(provider)) {}

ProcessInfo ProcessInfoResolver::resolve(int32_t pid) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = cache_.find(pid);
    if (it != cache_.end()) return it->second;
  }
  // Provider calls run unlocked; a racing resolve of the same pid just repeats the lookup
  try {
    auto name = provider_->process_name(pid);
    if (!name) return ProcessInfo{pid, "Unknown", "Unknown", ""};
    ProcessInfo info;
    info.pid = pid;
    info.process_name = *name;
    info.app_name = resolve_app_name(pid, *name);
    info.cmdline = provider_->cmdline(pid).value_or("");
    std::lock_guard<std::mutex> lk(mu_);
    cache_[pid] = info;
    return info;
  } catch (const std::exception& e) {
    util::log_error("ProcessInfoResolver", "pid %d: %s", pid, e.what());
    return ProcessInfo{pid, "Error", "Error", ""};
  }
}

std::string ProcessInfoResolver::resolve_app_name(int32_t pid, const std::string& process_name) {
  if (auto exe = provider_->get_executable_path(pid)) {
    if (auto product = provider_->product_name(*exe); product && !product->empty()) return *product;
  }
  return clean_process_name(process_name);
}

void ProcessInfoResolver::invalidate(int32_t pid) {
  std::lock_guard<std::mutex> lk(mu_);
  cache_.erase(pid);
}

void ProcessInfoResolver::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  cache_.clear();
}

size_t ProcessInfoResolver::cached() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cache_.size();
}

std::string ProcessInfoResolver::clean_process_name(std::string name) {
  auto ends_with_ci = [&](std::string_view ext) {
    if (name.size() <= ext.size()) return false;
    for (size_t i = 0; i < ext.size(); ++i) {
      char c = name[name.size() - ext.size() + i];
      if (std::tolower(static_cast<unsigned char>(c)) != ext[i]) return false;
    }
    return true;
  };
  for (std::string_view ext : {".exe", ".bin", ".appimage"}) {
    if (ends_with_ci(ext)) { name.resize(name.size() - ext.size()); break; }
  }
  if (!name.empty()) name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
  return name;
}

} // namespace bwmon::app
