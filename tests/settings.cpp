#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include "svcagent/exceptions.hpp"
#include "svcagent/settings.hpp"

// Cross-platform setenv wrapper
static void set_env(const char* name, const char* value) {
#ifdef _WIN32
  _putenv_s(name, value);
#else
  setenv(name, value, 1);
#endif
}

static bool rejects(const svcagent::Settings& s) {
  try {
    s.validate();
  } catch (const svcagent::ConfigError&) {
    return true;
  }
  return false;
}

int main() {
  using namespace svcagent;

  // Defaults
  Settings d;
  assert(d.host == "0.0.0.0");
  assert(d.port == 8000);
  assert(d.transport == "http");
  assert(d.request_timeout_ms == 30000);
  assert(d.conversations_dir == "conversations");
  d.validate();

  // JSON parse
  auto s = Settings::from_json(Json{{"log_level", "debug"}, {"port", 9000}, {"transport", "sse"}});
  assert(s.log_level == "debug");
  assert(s.port == 9000);
  assert(s.transport == "sse");
  assert(s.host == "0.0.0.0");  // untouched keys keep defaults

  // Wrong JSON types are configuration errors
  bool threw = false;
  try {
    Settings::from_json(Json{{"port", "not a number"}});
  } catch (const ConfigError&) {
    threw = true;
  }
  assert(threw);

  // Integers outside the int range are rejected rather than wrapped
  threw = false;
  try {
    Settings::from_json(Json{{"port", 4294975296LL}});
  } catch (const ConfigError&) {
    threw = true;
  }
  assert(threw);
  threw = false;
  try {
    Settings::from_json(Json{{"request_timeout_ms", 18446744073709551615ULL}});
  } catch (const ConfigError&) {
    threw = true;
  }
  assert(threw);

  // Env parse (set locally)
  set_env("SVCAGENT_LOG_LEVEL", "warn");
  set_env("SVCAGENT_PORT", "8123");
  set_env("SVCAGENT_TRANSPORT", "sse");
  set_env("SVCAGENT_INSTRUCTIONS", "Be brief");
  auto e = Settings::from_env();
  assert(e.log_level == "WARN");  // uppercased
  assert(e.port == 8123);
  assert(e.transport == "sse");
  assert(e.instructions == "Be brief");

  // Bytes outside ASCII pass through the upper-casing untouched
  set_env("SVCAGENT_LOG_LEVEL", "d\xc3\xa9" "bug");
  assert(Settings::from_env().log_level == "D\xc3\xa9" "BUG");
  set_env("SVCAGENT_LOG_LEVEL", "warn");

  // File overlays environment values, keys absent from the file survive
  const char* path = "svcagent_settings_test.json";
  {
    std::ofstream out(path);
    out << R"({"port": 9100, "request_timeout_ms": 0})";
  }
  e.merge_file(path);
  assert(e.port == 9100);
  assert(e.request_timeout_ms == 0);
  assert(e.transport == "sse");
  std::remove(path);

  threw = false;
  try {
    Settings::from_file("does/not/exist.json");
  } catch (const ConfigError&) {
    threw = true;
  }
  assert(threw);

  set_env("SVCAGENT_PORT", "eighty");
  threw = false;
  try {
    Settings::from_env();
  } catch (const ConfigError&) {
    threw = true;
  }
  assert(threw);
  set_env("SVCAGENT_PORT", "8000");

  // Validation
  Settings bad = d;
  bad.transport = "stdio";
  assert(rejects(bad));
  bad = d;
  bad.port = 70000;
  assert(rejects(bad));
  bad = d;
  bad.request_timeout_ms = -5;
  assert(rejects(bad));
  bad = d;
  bad.log_level = "chatty";
  assert(rejects(bad));
  bad = d;
  bad.host = "";
  assert(rejects(bad));
  return 0;
}
