#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/dispatch_policy.hpp"
#include "internal/util/errors.hpp"

namespace {

using ridedispatch::config::ConfigLoader;
using ridedispatch::config::ResolvePolicy;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "ride_dispatch_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullFileIsLoaded() {
  const auto yaml_path = WriteYaml("full", R"(server:
  bind_address: "127.0.0.1:7000"
database:
  sqlite:
    path: "/var/lib/ride-dispatch/dispatch.db"
    wal_mode: true
    busy_timeout_ms: 2500
logging:
  level: debug
dispatch:
  city_initial_radius_km: 4
  max_rounds: 7
  city_matching_timeout: "90s"
  service_area:
    service_radius_km: 30
fares:
  base_fare: 40
  rider_cancellation_fee: 25.5
suspension:
  threshold: 5
  window: "43200s"
notifications:
  workers: 4
maintenance:
  sweep_interval: "2s"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.database().sqlite().path() == "/var/lib/ride-dispatch/dispatch.db");
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.notifications().workers() == 4);
  assert(config.maintenance().sweep_interval().seconds() == 2);

  auto policy = ResolvePolicy(config);
  assert(policy.dispatch.city_initial_radius_km == 4.0);
  assert(policy.dispatch.extended_initial_radius_km == 8.0);
  assert(policy.dispatch.max_rounds == 7);
  assert(policy.dispatch.city_matching_timeout == std::chrono::seconds(90));
  assert(policy.dispatch.extended_matching_timeout == std::chrono::seconds(180));
  assert(policy.dispatch.service_area.service_radius_km == 30.0);
  assert(policy.fares.base_fare == 40.0);
  assert(policy.fares.per_km == 12.0);
  assert(policy.fares.rider_cancellation_fee == 25.5);
  assert(policy.suspension.threshold == 5);
  assert(policy.suspension.window == std::chrono::hours(12));
  assert(policy.suspension.duration == std::chrono::hours(24));
}

void TestEmptyDocumentUsesDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_memory());

  auto policy = ResolvePolicy(config);
  assert(policy.dispatch.city_initial_radius_km == 5.0);
  assert(policy.dispatch.lease_ttl == std::chrono::seconds(10));
  assert(policy.fares.base_fare == 30.0);
  assert(policy.suspension.threshold == 3);
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://dispatch:secret@db/rides"
    max_connections: 8
server:
  bind_address: "line1\nline2☃"
)");
  assert(config.database().postgres().connection_uri() == "postgresql://dispatch:secret@db/rides");
  assert(config.database().postgres().max_connections() == 8);
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestInconsistentSectionsAreRejected() {
  auto expect_invalid = [](const std::string& yaml) {
    bool threw = false;
    try {
      auto config = ConfigLoader::LoadFromYamlString(yaml);
      (void)ResolvePolicy(config);
    } catch (const ridedispatch::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  };

  expect_invalid("database:\n  sqlite:\n    wal_mode: true\n");
  expect_invalid("database:\n  postgres:\n    max_connections: 2\n");
  expect_invalid("observability:\n  transport: carrier-pigeon\n");
  expect_invalid("dispatch:\n  max_radius_km: 3\n");
  expect_invalid("dispatch:\n  service_area:\n    city_min_latitude: 23\n    city_max_latitude: 22\n");
  expect_invalid("- just\n- a list\n");
}

void TestMissingFileThrows() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/ride-dispatch.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullFileIsLoaded();
  TestEmptyDocumentUsesDefaults();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestInconsistentSectionsAreRejected();
  TestMissingFileThrows();

  std::cout << "ride_dispatch_unit_config_loader: pass\n";
  return 0;
}
