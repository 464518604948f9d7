// Tests for the local network lookup.
#include "eufyLocalDiscovery.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <thread>

using eufytest::LoopbackEndpoint;

TEST(LocalDiscoveryTest, SendsLocalLookupToDevicePort) {
  LoopbackEndpoint device;
  std::vector<unsigned char> request;
  std::thread device_thread([&]() {
    Eufy::Address from;
    request = device.Receive(&from);
    if (!request.empty()) device.Reply(from, Eufy::Response::LOCAL_LOOKUP_RESP, std::vector<unsigned char>());
  });

  std::ostringstream log;
  eufyLocalDiscovery discovery(&log, 2000);
  discovery.setDevicePort(device.address().port);
  std::vector<Eufy::Address> candidates = discovery.lookup("127.0.0.1");
  device_thread.join();

  std::vector<unsigned char> expected = {0xF1, 0x30, 0x00, 0x02, 0x00, 0x00};
  EXPECT_EQ(request, expected);
  ASSERT_EQ(candidates.size(), 1u);
  EXPECT_EQ(candidates[0], device.address());
}

TEST(LocalDiscoveryTest, DefaultsToDevicePort) {
  eufyLocalDiscovery discovery;
  EXPECT_EQ(discovery.getDevicePort(), EUFY_LOCAL_PORT);
  EXPECT_EQ(discovery.getTimeout(), EUFY_LOOKUP_TIMEOUT_MS);
}

TEST(LocalDiscoveryTest, FirstResponseWins) {
  std::ostringstream log;
  eufyLocalDiscovery discovery(&log);
  int calls = 0;
  discovery.setCompletionCallback([&](const std::vector<Eufy::Address> &) { ++calls; });

  std::vector<unsigned char> message = Eufy::EncodeFrame(Eufy::Response::LOCAL_LOOKUP_RESP, std::vector<unsigned char>());
  Eufy::Address first("192.168.1.20", 32108);
  Eufy::Address second("192.168.1.21", 32108);
  discovery.processDatagram(message.data(), (int)message.size(), first);
  discovery.processDatagram(message.data(), (int)message.size(), second);
  discovery.processDatagram(message.data(), (int)message.size(), first);

  ASSERT_EQ(discovery.getCandidates().size(), 1u);
  EXPECT_EQ(discovery.getCandidates()[0], first);
  EXPECT_EQ(calls, 1);
}

TEST(LocalDiscoveryTest, IgnoresRelayResponses) {
  std::ostringstream log;
  eufyLocalDiscovery discovery(&log);
  std::vector<unsigned char> message = Eufy::EncodeFrame(
      Eufy::Response::LOOKUP_ADDR, eufytest::LookupAddrPayload(Eufy::Address("10.0.0.1", 1)));
  discovery.processDatagram(message.data(), (int)message.size(), Eufy::Address("192.168.1.20", 32108));
  EXPECT_TRUE(discovery.getCandidates().empty());
  EXPECT_FALSE(discovery.isComplete());
}

TEST(LocalDiscoveryTest, TimesOutWhenNothingAnswers) {
  LoopbackEndpoint silent;
  std::ostringstream log;
  eufyLocalDiscovery discovery(&log, 150);
  discovery.setDevicePort(silent.address().port);
  std::vector<Eufy::Address> candidates = discovery.lookup("127.0.0.1");
  EXPECT_TRUE(candidates.empty());
  EXPECT_TRUE(discovery.isComplete());
  EXPECT_NE(log.str().find("no answer"), std::string::npos);
}
