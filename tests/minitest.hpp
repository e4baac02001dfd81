#pragma once
#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mini {

struct TestCase { std::string name; std::function<void()> fn; };
inline std::vector<TestCase>& registry() { static std::vector<TestCase> r; return r; }

struct Registrar {
  Registrar(const std::string& name, std::function<void()> fn) { registry().push_back({name, std::move(fn)}); }
};

inline bool env_flag(const char* name) {
  const char* v = std::getenv(name);
  return v && (*v == '1' || *v == 't' || *v == 'T' || *v == 'y' || *v == 'Y');
}

inline void json_escape(std::ostream& os, const std::string& s) {
  for (const char c : s) {
    if (c == '"' || c == '\\') os << '\\' << c; else if (c == '\n') os << "\\n"; else os << c;
  }
}

// filter: run only tests whose name contains it (empty runs everything).
// BWMON_TEST_JSON=1 switches to one JSON object per line.
inline int run_all(const std::string& filter = {}) {
  bool json = env_flag("BWMON_TEST_JSON");
  int failed = 0; int passed = 0; int skipped = 0;
  auto report_fail = [&](const std::string& name, const std::string& what) {
    ++failed;
    if (json) {
      std::cout << "{\"event\":\"test\",\"name\":\"" << name << "\",\"status\":\"fail\",\"error\":\"";
      json_escape(std::cout, what);
      std::cout << "\"}" << "\n";
    } else {
      std::cerr << "[FAIL] " << name << ": " << what << "\n";
    }
  };
  for (auto& t : registry()) {
    if (!filter.empty() && t.name.find(filter) == std::string::npos) { ++skipped; continue; }
    try {
      t.fn();
      ++passed;
      if (json) {
        std::cout << "{\"event\":\"test\",\"name\":\"" << t.name << "\",\"status\":\"pass\"}" << "\n";
      } else {
        std::cout << "[PASS] " << t.name << "\n";
      }
    } catch (const std::exception& e) {
      report_fail(t.name, e.what());
    } catch (...) {
      report_fail(t.name, "unknown exception");
    }
  }
  if (json) {
    std::cout << "{\"event\":\"summary\",\"passed\":" << passed << ",\"failed\":" << failed
              << ",\"skipped\":" << skipped << "}" << "\n";
  } else {
    std::cout << "\n" << passed << " passed, " << failed << " failed";
    if (skipped) std::cout << ", " << skipped << " filtered out";
    std::cout << "\n";
  }
  return failed == 0 ? 0 : 1;
}

struct AssertionError : public std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace mini

#define TEST(name) \
  static void name(); \
  static ::mini::Registrar name##_registrar{#name, name}; \
  static void name()

#define ASSERT_TRUE(expr) do { if(!(expr)) throw ::mini::AssertionError(std::string("ASSERT_TRUE failed: ") + #expr); } while(0)
#define ASSERT_FALSE(expr) do { if((expr)) throw ::mini::AssertionError(std::string("ASSERT_FALSE failed: ") + #expr); } while(0)
#define ASSERT_EQ(a,b) do { if(!((a)==(b))) { throw ::mini::AssertionError(std::string("ASSERT_EQ failed: ") + #a " == " #b); } } while(0)
#define ASSERT_NE(a,b) do { if(!((a)!=(b))) { throw ::mini::AssertionError(std::string("ASSERT_NE failed: ") + #a " != " #b); } } while(0)
#define ASSERT_THROWS(expr, type) do { bool thrown_ = false; \
  try { (void)(expr); } catch (const type&) { thrown_ = true; } \
  if (!thrown_) throw ::mini::AssertionError(std::string("ASSERT_THROWS failed: ") + #expr " throws " #type); } while(0)
