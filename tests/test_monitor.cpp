#include "minitest.hpp"
#include "fakes.hpp"
#include "app/Monitor.hpp"
#include "storage/SqliteStorage.hpp"

#include <cstdint>
#include <thread>

using namespace std::chrono_literals;

static bwmon::app::Config fast_config() {
  bwmon::app::Config cfg;
  cfg.sampler.interval = 20ms;
  cfg.persistence.flush_interval = 10s;
  cfg.summary.check_interval = 3600s;
  return cfg;
}

TEST(monitor_samples_persist_on_stop) {
  auto provider = std::make_shared<bwtest::FakeProvider>();
  provider->set(42, {"chrome", "/opt/google/chrome/chrome", "", "Google Chrome", 2});
  auto storage = std::make_shared<bwmon::storage::SqliteStorage>(":memory:");
  bwmon::app::Monitor monitor(fast_config(), provider,
                              std::make_unique<bwmon::collectors::ConnectionProxyEstimator>(), storage);
  auto ch = monitor.sampler().open_channel(64);
  monitor.start();
  ASSERT_TRUE(monitor.running());
  // the first tick only establishes a baseline
  uint64_t seen = 0;
  while (seen < 3) {
    auto s = ch->pop(2000ms);
    ASSERT_TRUE(s.has_value());
    seen = s->seq;
  }
  monitor.stop();
  ASSERT_FALSE(monitor.running());

  ASSERT_TRUE(storage->sample_count() >= 2u);
  auto rows = storage->get_samples_for_range(0, INT64_MAX);
  ASSERT_EQ(rows[0].pid, 42);
  ASSERT_EQ(rows[0].effective_app_name(), "Google Chrome");
  ASSERT_EQ(rows[0].bytes_sent, 2048u);

  auto top = monitor.top_n_processes(5);
  ASSERT_EQ(top.size(), 1u);
  ASSERT_EQ(monitor.total_bandwidth().total, 4096u);
  auto recs = monitor.get_recommendations();
  ASSERT_EQ(recs.size(), 1u);
  ASSERT_TRUE(recs[0].find("Google Chrome is using 100%") == 0);
  ASSERT_FALSE(monitor.permissions_warning().has_value());
}

TEST(monitor_reports_permission_problem_when_nothing_visible) {
  auto provider = std::make_shared<bwtest::FakeProvider>();
  auto storage = std::make_shared<bwtest::FakeStorage>();
  bwmon::app::Monitor monitor(fast_config(), provider,
                              std::make_unique<bwmon::collectors::ConnectionProxyEstimator>(), storage);
  (void)monitor.sampler().tick();
  ASSERT_TRUE(monitor.permissions_warning().has_value());
  ASSERT_TRUE(monitor.get_recommendations().empty());
  ASSERT_TRUE(monitor.top_n_processes(5).empty());
}

TEST(monitor_reads_summaries_through_storage) {
  auto provider = std::make_shared<bwtest::FakeProvider>();
  auto storage = std::make_shared<bwmon::storage::SqliteStorage>(":memory:");
  bwmon::app::Monitor monitor(fast_config(), provider,
                              std::make_unique<bwmon::collectors::ConnectionProxyEstimator>(), storage);
  bwmon::util::Date d{std::chrono::year{2024}, std::chrono::month{2}, std::chrono::day{10}};
  storage->insert_sample(bwtest::sample(bwmon::util::local_midnight(d) + 60, 1, "curl", std::nullopt, 10, 5));
  monitor.summary().aggregate_date(d);
  auto rows = monitor.get_daily_summary(d);
  ASSERT_EQ(rows.size(), 1u);
  ASSERT_EQ(rows[0].total_bytes, 15u);
  ASSERT_EQ(monitor.get_available_dates().size(), 1u);
}

TEST(monitor_destroyed_while_sampler_tick_is_in_flight) {
  auto provider = std::make_shared<bwtest::FakeProvider>();
  provider->set(42, {"chrome", "/opt/google/chrome/chrome", "", "Google Chrome", 2});
  provider->enumerate_delay_ms = 400;
  auto storage = std::make_shared<bwtest::FakeStorage>();
  auto cfg = fast_config();
  cfg.sampler.join_timeout = 50ms;
  cfg.persistence.join_timeout = 50ms;
  cfg.summary.join_timeout = 50ms;
  {
    bwmon::app::Monitor monitor(cfg, provider,
                                std::make_unique<bwmon::collectors::ConnectionProxyEstimator>(), storage);
    monitor.start();
    std::this_thread::sleep_for(50ms);
  }
  // the abandoned tick completes against a destroyed Monitor
  std::this_thread::sleep_for(700ms);
  ASSERT_EQ(storage->stored(), 0u);
  std::lock_guard<std::mutex> lk(provider->mu);
  ASSERT_TRUE(provider->enumerations >= 1);
}
