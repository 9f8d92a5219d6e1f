#include "PacketChannel.hpp"

#include "FakeSocketHandler.hpp"
#include "TestHeaders.hpp"

using namespace tether;

TEST_CASE("PacketChannel delivers framed packets", "[PacketChannel]") {
  auto socketHandler = make_shared<FakeSocketHandler>();
  auto fds = socketHandler->createPair();
  PacketChannel channel(socketHandler, fds.first, 64 * 1024);

  InputAck ack;
  ack.set_session_id("s1");
  ack.set_ack_seq(7);
  REQUIRE(channel.send(Packet::fromProto(PacketType::INPUT_ACK, ack)));
  REQUIRE(channel.sendClose(CLOSE_SESSION_NOT_FOUND, "Session not found"));
  channel.drain(1000);
  REQUIRE(!channel.hasPendingData());

  auto packets = socketHandler->readPackets(fds.second);
  REQUIRE(packets.size() == 2);
  REQUIRE(packets[0].getHeader() == PacketType::INPUT_ACK);
  REQUIRE(stringToProto<InputAck>(packets[0].getPayload()).ack_seq() == 7);
  ConnectionClose close =
      stringToProto<ConnectionClose>(packets[1].getPayload());
  REQUIRE(close.code() == CLOSE_SESSION_NOT_FOUND);
  REQUIRE(close.reason() == "Session not found");
}

TEST_CASE("PacketChannel drops a peer that stops reading", "[PacketChannel]") {
  auto socketHandler = make_shared<FakeSocketHandler>();
  auto fds = socketHandler->createPair();
  PacketChannel channel(socketHandler, fds.first, 64 * 1024);

  string payload(1024, 'x');
  bool alive = true;
  for (int a = 0; a < 100000 && alive; a++) {
    alive = channel.sendSerialized(Packet(PacketType::HEARTBEAT, payload)
                                       .serialize());
  }
  REQUIRE(!alive);
  REQUIRE(channel.isDead());
  REQUIRE(!channel.hasPendingData());
  REQUIRE(!channel.flush());
}

TEST_CASE("PacketChannel notices a closed peer", "[PacketChannel]") {
  auto socketHandler = make_shared<FakeSocketHandler>();
  auto fds = socketHandler->createPair();
  PacketChannel channel(socketHandler, fds.first, 64 * 1024);

  socketHandler->close(fds.second);
  REQUIRE(!channel.send(Packet(PacketType::HEARTBEAT, "")));
  REQUIRE(channel.isDead());
  REQUIRE(!channel.send(Packet(PacketType::HEARTBEAT, "")));
}
