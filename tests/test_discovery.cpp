#include <stdio.h>

#include <string>

#include "controller/discovery_poller.h"
#include "mocks/ManualClock.h"
#include "protocol/bridge_protocol.h"
#include "protocol/discovery_record.h"
#include "test_support.h"
#include "util/file_utils.h"

using namespace scenelink;

static void test_record_text_round_trip() {
  rpc::DiscoveryRecord record;
  record.port = 52100;
  record.pid = 4242;
  record.version = "1.1";
  record.channel = "c0ffee";
  record.timestamp = 1700000000;
  auto parsed = rpc::parseDiscoveryRecord(rpc::serializeDiscoveryRecord(record));
  TEST_ASSERT(parsed.has_value());
  TEST_ASSERT_EQ_UINT(parsed.value().port, 52100);
  TEST_ASSERT_EQ_UINT(parsed.value().pid, 4242);
  TEST_ASSERT_EQ_STR(parsed.value().channel, "c0ffee");
  TEST_ASSERT(parsed.value().timestamp == 1700000000);

  record.channel.clear();
  TEST_ASSERT(rpc::serializeDiscoveryRecord(record).find("channel") == std::string::npos);
  TEST_CASE_OK("record_text_round_trip");
}

static void test_record_validation() {
  TEST_ASSERT(!rpc::parseDiscoveryRecord("{\"port\":0,\"version\":\"1.0\"}").has_value());
  TEST_ASSERT(!rpc::parseDiscoveryRecord("{\"port\":70000,\"version\":\"1.0\"}").has_value());
  TEST_ASSERT(!rpc::parseDiscoveryRecord("{\"port\":5000}").has_value());
  TEST_ASSERT(!rpc::parseDiscoveryRecord("{\"port\":\"5000\",\"version\":\"1.0\"}").has_value());
  TEST_ASSERT(!rpc::parseDiscoveryRecord("not json").has_value());
  auto minimal = rpc::parseDiscoveryRecord("{\"port\":5000,\"version\":\"1.0\"}");
  TEST_ASSERT(minimal.has_value());
  TEST_ASSERT_EQ_UINT(minimal.value().pid, 0);
  TEST_ASSERT(minimal.value().timestamp == 0);
  TEST_CASE_OK("record_validation");
}

static void test_record_numbers_out_of_range() {
  auto huge_port = rpc::parseDiscoveryRecord(
      "{\"port\":18446744073709551615,\"version\":\"1.0\",\"timestamp\":0}");
  TEST_ASSERT(!huge_port.has_value());
  TEST_ASSERT(huge_port.error() == rpc::DiscoveryError::MALFORMED);
  TEST_ASSERT(!rpc::parseDiscoveryRecord("{\"port\":1e300,\"version\":\"1.0\"}").has_value());
  TEST_ASSERT(!rpc::parseDiscoveryRecord("{\"port\":5000.5,\"version\":\"1.0\"}").has_value());

  auto huge_time = rpc::parseDiscoveryRecord("{\"port\":5000,\"version\":\"1.0\",\"timestamp\":1e300}");
  TEST_ASSERT(huge_time.has_value());
  TEST_ASSERT(huge_time.value().timestamp == 0);
  auto negative = rpc::parseDiscoveryRecord(
      "{\"port\":5000,\"version\":\"1.0\",\"timestamp\":-9223372036854775808}");
  TEST_ASSERT(negative.has_value());
  TEST_ASSERT(negative.value().timestamp == 0);
  auto fractional = rpc::parseDiscoveryRecord(
      "{\"port\":5000,\"version\":\"1.0\",\"timestamp\":1700000000.75}");
  TEST_ASSERT(fractional.has_value());
  TEST_ASSERT(fractional.value().timestamp == 1700000000);
  TEST_CASE_OK("record_numbers_out_of_range");
}

static void test_poller_outcomes() {
  TempProject project;
  ManualClock clock;
  controller::DiscoveryPoller poller(project.root(), 60, clock);
  TEST_ASSERT_EQ_STR(poller.path(), project.path(rpc::DISCOVERY_RELATIVE_PATH));

  rpc::DiscoveryRecord out;
  TEST_ASSERT(poller.poll(out) == controller::PollOutcome::NO_RECORD);

  TEST_ASSERT(util::writeFileAtomic(poller.path(), "{\"port\":0}"));
  TEST_ASSERT(poller.poll(out) == controller::PollOutcome::MALFORMED);
  TEST_ASSERT(util::fileExists(poller.path()));
  TEST_ASSERT(util::writeFileAtomic(poller.path(),
                                    "{\"port\":18446744073709551615,\"version\":\"1.0\",\"timestamp\":0}"));
  TEST_ASSERT(poller.poll(out) == controller::PollOutcome::MALFORMED);

  // An unrepresentable timestamp is treated as ancient.
  TEST_ASSERT(util::writeFileAtomic(poller.path(),
                                    "{\"port\":6000,\"version\":\"1.0\",\"timestamp\":1e300}"));
  TEST_ASSERT(poller.poll(out) == controller::PollOutcome::STALE_REMOVED);

  rpc::DiscoveryRecord record;
  record.port = 6000;
  record.version = "1.0";
  record.timestamp = clock.unixSeconds() - 10;
  TEST_ASSERT(rpc::writeDiscoveryRecord(poller.path(), record));
  TEST_ASSERT(poller.poll(out) == controller::PollOutcome::FRESH);
  TEST_ASSERT_EQ_UINT(out.port, 6000);
  TEST_CASE_OK("poller_outcomes");
}

static void test_stale_record_deleted_exactly_once() {
  TempProject project;
  ManualClock clock;
  controller::DiscoveryPoller poller(project.root(), 60, clock);

  rpc::DiscoveryRecord record;
  record.port = 6001;
  record.version = "1.0";
  record.timestamp = clock.unixSeconds() - 61;
  TEST_ASSERT(rpc::writeDiscoveryRecord(poller.path(), record));

  rpc::DiscoveryRecord out;
  TEST_ASSERT(poller.poll(out) == controller::PollOutcome::STALE_REMOVED);
  TEST_ASSERT(!util::fileExists(poller.path()));
  TEST_ASSERT(poller.poll(out) == controller::PollOutcome::NO_RECORD);
  TEST_CASE_OK("stale_record_deleted_exactly_once");
}

static void test_remove_missing_record_is_not_an_error() {
  TempProject project;
  TEST_ASSERT(rpc::removeDiscoveryRecord(rpc::discoveryPath(project.root())));
  TEST_CASE_OK("remove_missing_record_is_not_an_error");
}

int main() {
  test_record_text_round_trip();
  test_record_validation();
  test_record_numbers_out_of_range();
  test_poller_outcomes();
  test_stale_record_deleted_exactly_once();
  test_remove_missing_record_is_not_an_error();
  return 0;
}
