// Tests for device sessions and scoped acquisition.
#include "eufyErrors.hpp"
#include "eufyScopedSession.hpp"
#include "eufySession.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

using eufytest::LoopbackEndpoint;

namespace {

class FakeAuthenticator : public eufyAuthenticator {
 public:
  enum Mode { ACCEPT, REFUSE, REJECT };

  explicit FakeAuthenticator(Mode mode = ACCEPT) : mode_(mode), calls(0) {}

  bool authenticate(eufyUDP &, const Eufy::Address &address, const std::string &dsk_key,
                    const std::string &user_id) override {
    ++calls;
    last_address = address;
    last_key = dsk_key;
    last_user = user_id;
    if (mode_ == REJECT) throw Eufy::AuthenticationError("rejected by device");
    return mode_ == ACCEPT;
  }

  Mode mode_;
  int calls;
  Eufy::Address last_address;
  std::string last_key;
  std::string last_user;
};

class CountingSession : public eufySession {
 public:
  CountingSession(eufyAuthenticator *authenticator, std::ostream *out, int *closes)
      : eufySession("T8010P0000000001", "AB-00001-CD", "dsk", "user-1", authenticator, out), closes_(closes) {}

  void close() override {
    ++*closes_;
    eufySession::close();
  }

 private:
  int *closes_;
};

}  // namespace

TEST(SessionTest, ConnectsThroughAuthenticator) {
  LoopbackEndpoint device;
  FakeAuthenticator authenticator;
  std::ostringstream log;
  eufySession session("T8010P0000000001", "AB-00001-CD", "dsk", "user-1", &authenticator, &log);

  EXPECT_EQ(session.getState(), Eufy::Session::UNCONNECTED);
  ASSERT_TRUE(session.connect(device.address()));
  EXPECT_EQ(session.getState(), Eufy::Session::CONNECTED);
  EXPECT_EQ(authenticator.calls, 1);
  EXPECT_EQ(authenticator.last_address, device.address());
  EXPECT_EQ(authenticator.last_key, "dsk");
  EXPECT_EQ(authenticator.last_user, "user-1");
  EXPECT_EQ(session.getAddress(), device.address());
}

TEST(SessionTest, ValidOnlyForItsOwnStationWhileConnected) {
  LoopbackEndpoint device;
  FakeAuthenticator authenticator;
  std::ostringstream log;
  eufySession session("A", "AB-00001-CD", "dsk", "user-1", &authenticator, &log);

  EXPECT_FALSE(session.validFor("A"));
  ASSERT_TRUE(session.connect(device.address()));
  EXPECT_TRUE(session.validFor("A"));
  EXPECT_FALSE(session.validFor("B"));

  session.close();
  EXPECT_FALSE(session.validFor("A"));
}

TEST(SessionTest, FailedHandshakeCloses) {
  LoopbackEndpoint device;
  FakeAuthenticator authenticator(FakeAuthenticator::REFUSE);
  std::ostringstream log;
  eufySession session("A", "AB-00001-CD", "dsk", "user-1", &authenticator, &log);

  EXPECT_FALSE(session.connect(device.address()));
  EXPECT_EQ(session.getState(), Eufy::Session::CLOSED);
  EXPECT_FALSE(session.isOpen());
  EXPECT_FALSE(session.sendCommandWithInt(0, EUFY_CMD_SET_ARMING, 1));
}

TEST(SessionTest, MissingAuthenticatorFails) {
  LoopbackEndpoint device;
  std::ostringstream log;
  eufySession session("A", "AB-00001-CD", "dsk", "user-1", nullptr, &log);
  EXPECT_FALSE(session.connect(device.address()));
  EXPECT_EQ(session.getState(), Eufy::Session::CLOSED);
}

TEST(SessionTest, RejectionPropagatesAndCloses) {
  LoopbackEndpoint device;
  FakeAuthenticator authenticator(FakeAuthenticator::REJECT);
  std::ostringstream log;
  eufySession session("A", "AB-00001-CD", "dsk", "user-1", &authenticator, &log);

  EXPECT_THROW(session.connect(device.address()), Eufy::AuthenticationError);
  EXPECT_EQ(session.getState(), Eufy::Session::CLOSED);
  EXPECT_FALSE(session.isOpen());
}

TEST(SessionTest, DoesNotReconnectAfterClose) {
  LoopbackEndpoint device;
  FakeAuthenticator authenticator;
  std::ostringstream log;
  eufySession session("A", "AB-00001-CD", "dsk", "user-1", &authenticator, &log);

  ASSERT_TRUE(session.connect(device.address()));
  session.close();
  EXPECT_FALSE(session.connect(device.address()));
  EXPECT_EQ(session.getState(), Eufy::Session::CLOSED);
  EXPECT_EQ(authenticator.calls, 1);
}

TEST(SessionTest, SendsCommandsAndEnd) {
  LoopbackEndpoint device;
  FakeAuthenticator authenticator;
  std::ostringstream log;
  eufySession session("A", "AB-00001-CD", "dsk", "user-1", &authenticator, &log);
  ASSERT_TRUE(session.connect(device.address()));

  ASSERT_TRUE(session.sendCommandWithInt(0, EUFY_CMD_SET_ARMING, 1));
  ASSERT_TRUE(session.sendCommandWithIntString(0, EUFY_CMD_SET_DEVS_OSD, 1));
  session.close();

  Eufy::Address from;
  std::vector<unsigned char> first = device.Receive(&from);
  std::vector<unsigned char> second = device.Receive(&from);
  std::vector<unsigned char> end = device.Receive(&from);

  ASSERT_EQ(first.size(), (size_t)(EUFY_FRAME_HEADER_SIZE + 4 + EUFY_COMMAND_HEADER_SIZE + EUFY_COMMAND_INT_SIZE));
  EXPECT_EQ(first[0], 0xF1);
  EXPECT_EQ(first[1], 0xD0);
  // sequence numbers count up per command
  EXPECT_EQ(first[7], 0x00);
  ASSERT_EQ(second.size(), first.size() + EUFY_COMMAND_STRING_SIZE);
  EXPECT_EQ(second[7], 0x01);

  std::vector<unsigned char> expected_end = {0xF1, 0xF0, 0x00, 0x00};
  EXPECT_EQ(end, expected_end);
}

TEST(CommandPayloadTest, IntCommandLayout) {
  std::vector<unsigned char> payload = eufySession::BuildCommandPayload(0x0102, EUFY_CMD_SET_ARMING, 0, 63, nullptr);
  std::vector<unsigned char> expected = {
      0xD1, 0x00, 0x01, 0x02,
      'X', 'Z', 'Y', 'H', 0xC8, 0x04, 0x0C, 0x00, 0x00, 0x00, 0x00, 0x00,
      0x3F, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
  EXPECT_EQ(payload, expected);
}

TEST(CommandPayloadTest, IntStringCommandCarriesPaddedUser) {
  std::string user = "user-1";
  std::vector<unsigned char> payload = eufySession::BuildCommandPayload(0, EUFY_CMD_SET_DEVS_OSD, 2, 1, &user);
  ASSERT_EQ(payload.size(), (size_t)(4 + EUFY_COMMAND_HEADER_SIZE + EUFY_COMMAND_INT_SIZE + EUFY_COMMAND_STRING_SIZE));
  // command 1214 little endian, body length 140
  EXPECT_EQ(payload[8], 0xBE);
  EXPECT_EQ(payload[9], 0x04);
  EXPECT_EQ(payload[10], 0x8C);
  EXPECT_EQ(payload[11], 0x00);
  EXPECT_EQ(payload[16], 0x01);
  EXPECT_EQ(payload[24], 0x02);
  EXPECT_EQ(std::string(payload.begin() + 28, payload.begin() + 34), user);
  EXPECT_EQ(payload[34], 0x00);
  EXPECT_EQ(payload.back(), 0x00);
}

TEST(ScopedSessionTest, ClosesOwnedSessionOnce) {
  LoopbackEndpoint device;
  FakeAuthenticator authenticator;
  std::ostringstream log;
  int closes = 0;
  {
    std::unique_ptr<eufySession> session(new CountingSession(&authenticator, &log, &closes));
    ASSERT_TRUE(session->connect(device.address()));
    eufyScopedSession scoped(std::move(session));
    EXPECT_TRUE(scoped.isOwned());
    EXPECT_EQ(scoped->getState(), Eufy::Session::CONNECTED);
  }
  EXPECT_EQ(closes, 1);
}

TEST(ScopedSessionTest, ClosesOwnedSessionWhenOperationThrows) {
  LoopbackEndpoint device;
  FakeAuthenticator authenticator;
  std::ostringstream log;
  int closes = 0;
  try {
    std::unique_ptr<eufySession> session(new CountingSession(&authenticator, &log, &closes));
    ASSERT_TRUE(session->connect(device.address()));
    eufyScopedSession scoped(std::move(session));
    throw std::runtime_error("operation failed");
  } catch (const std::runtime_error &) {
  }
  EXPECT_EQ(closes, 1);
}

TEST(ScopedSessionTest, LeavesBorrowedSessionOpen) {
  LoopbackEndpoint device;
  FakeAuthenticator authenticator;
  std::ostringstream log;
  int closes = 0;
  CountingSession session(&authenticator, &log, &closes);
  ASSERT_TRUE(session.connect(device.address()));
  {
    eufyScopedSession scoped(&session);
    EXPECT_FALSE(scoped.isOwned());
    EXPECT_EQ(scoped.get(), &session);
  }
  EXPECT_EQ(closes, 0);
  EXPECT_TRUE(session.validFor("T8010P0000000001"));
}

TEST(ScopedSessionTest, MovedFromScopeDoesNotClose) {
  LoopbackEndpoint device;
  FakeAuthenticator authenticator;
  std::ostringstream log;
  int closes = 0;
  {
    std::unique_ptr<eufySession> session(new CountingSession(&authenticator, &log, &closes));
    ASSERT_TRUE(session->connect(device.address()));
    eufyScopedSession outer(std::move(session));
    {
      eufyScopedSession inner(std::move(outer));
      EXPECT_TRUE(inner.isOwned());
      EXPECT_FALSE(outer.isOwned());
    }
    EXPECT_EQ(closes, 1);
  }
  EXPECT_EQ(closes, 1);
}
