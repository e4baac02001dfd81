#include "minitest.hpp"
#include "fakes.hpp"
#include "app/ProcessInfoResolver.hpp"

using bwmon::app::ProcessInfoResolver;

TEST(resolver_prefers_product_name) {
  auto p = std::make_shared<bwtest::FakeProvider>();
  p->set(10, {"firefox", "/usr/lib/firefox/firefox", "firefox --new-tab", "Firefox Web Browser", 1});
  ProcessInfoResolver r(p);
  auto info = r.resolve(10);
  ASSERT_EQ(info.pid, 10);
  ASSERT_EQ(info.process_name, "firefox");
  ASSERT_EQ(info.app_name, "Firefox Web Browser");
  ASSERT_EQ(info.cmdline, "firefox --new-tab");
}

TEST(resolver_falls_back_to_cleaned_process_name) {
  auto p = std::make_shared<bwtest::FakeProvider>();
  p->set(11, {"chrome.exe", "", "", "", 1});
  p->set(12, {"Obsidian.AppImage", "/opt/Obsidian.AppImage", "", "", 1});
  ProcessInfoResolver r(p);
  ASSERT_EQ(r.resolve(11).app_name, "Chrome");
  ASSERT_EQ(r.resolve(12).app_name, "Obsidian");
}

TEST(resolver_caches_until_invalidated) {
  auto p = std::make_shared<bwtest::FakeProvider>();
  p->set(20, {"curl", "", "", "", 1});
  ProcessInfoResolver r(p);
  (void)r.resolve(20);
  (void)r.resolve(20);
  ASSERT_EQ(p->name_lookups, 1);
  ASSERT_EQ(r.cached(), 1u);
  p->set(20, {"wget", "", "", "", 1});
  ASSERT_EQ(r.resolve(20).process_name, "curl");
  r.invalidate(20);
  ASSERT_EQ(r.resolve(20).process_name, "wget");
  r.clear();
  ASSERT_EQ(r.cached(), 0u);
}

TEST(resolver_unknown_and_error_are_not_cached) {
  auto p = std::make_shared<bwtest::FakeProvider>();
  ProcessInfoResolver r(p);
  auto gone = r.resolve(404);
  ASSERT_EQ(gone.process_name, "Unknown");
  ASSERT_EQ(gone.app_name, "Unknown");
  ASSERT_EQ(r.cached(), 0u);

  p->set(405, {"ssh", "", "", "", 1});
  p->throw_on_name = true;
  auto err = r.resolve(405);
  ASSERT_EQ(err.process_name, "Error");
  ASSERT_EQ(r.cached(), 0u);
  p->throw_on_name = false;
  ASSERT_EQ(r.resolve(405).process_name, "ssh");
}

TEST(resolver_clean_process_name) {
  ASSERT_EQ(ProcessInfoResolver::clean_process_name("firefox.exe"), "Firefox");
  ASSERT_EQ(ProcessInfoResolver::clean_process_name("tool.BIN"), "Tool");
  ASSERT_EQ(ProcessInfoResolver::clean_process_name("spotify"), "Spotify");
  ASSERT_EQ(ProcessInfoResolver::clean_process_name(".exe"), ".exe");
  ASSERT_EQ(ProcessInfoResolver::clean_process_name(""), "");
}
