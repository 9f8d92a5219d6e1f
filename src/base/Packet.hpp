#ifndef __TETHER_PACKET_H__
#define __TETHER_PACKET_H__

#include "Headers.hpp"

namespace tether {
/**
 * @brief A typed protocol message: one header byte naming the `PacketType`
 * followed by the serialized protobuf payload.
 */
class Packet {
 public:
  Packet() : header(255) {}
  Packet(uint8_t _header, const string& _payload)
      : header(_header), payload(_payload) {}
  /**
   * @brief Deserializes a packet from its raw byte representation.
   * @throws std::runtime_error when the bytes are too short to hold a header.
   */
  explicit Packet(const string& serializedPacket) {
    if (serializedPacket.empty()) {
      throw std::runtime_error("Tried to parse an empty packet");
    }
    header = uint8_t(serializedPacket[0]);
    payload = serializedPacket.substr(1);
  }

  template <typename T>
  static Packet fromProto(PacketType type, const T& t) {
    return Packet(uint8_t(type), protoToString(t));
  }

  uint8_t getHeader() const { return header; }
  const string& getPayload() const { return payload; }

  /** @brief Returns the serialized byte count including the header. */
  ssize_t length() const { return HEADER_SIZE + payload.length(); }

  string serialize() const {
    string s = "0" + payload;
    s[0] = char(header);
    return s;
  }

 protected:
  static const int HEADER_SIZE = 1;
  uint8_t header;
  string payload;
};
}  // namespace tether

#endif  // __TETHER_PACKET_H__
