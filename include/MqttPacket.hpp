#pragma once
#include <string>
#include <cstdint>
#include <optional>

// MQTT 3.1.1 packets needed by a QoS 0 subscriber.
class MqttPacket
{
public:
    static constexpr std::uint8_t CONNECT    = 0x10;
    static constexpr std::uint8_t CONNACK    = 0x20;
    static constexpr std::uint8_t PUBLISH    = 0x30;
    static constexpr std::uint8_t PUBACK     = 0x40;
    static constexpr std::uint8_t SUBSCRIBE  = 0x82;
    static constexpr std::uint8_t SUBACK     = 0x90;
    static constexpr std::uint8_t PINGREQ    = 0xC0;
    static constexpr std::uint8_t PINGRESP   = 0xD0;
    static constexpr std::uint8_t DISCONNECT = 0xE0;

    static constexpr std::uint32_t MAX_REMAINING_LENGTH = 268435455;

    struct Publish
    {
        std::string topic;
        std::string payload;
        std::uint8_t qos = 0;
        std::uint16_t packetId = 0;
    };

    static std::string encodeRemainingLength(std::uint32_t length);
    // Feeds one length byte; returns the length once the last byte was seen.
    static std::optional<std::uint32_t> decodeRemainingLength(std::uint8_t byte, std::uint32_t& value, int& position);

    static std::string encodeConnect(std::string const& clientId, std::uint16_t keepAliveSeconds);
    static std::string encodeSubscribe(std::uint16_t packetId, std::string const& topicFilter);
    static std::string encodePuback(std::uint16_t packetId);
    static std::string encodePingreq();
    static std::string encodeDisconnect();

    // Returns the CONNACK return code.
    static std::uint8_t decodeConnack(std::string const& body);
    // Returns the granted QoS, 0x80 on refusal.
    static std::uint8_t decodeSuback(std::string const& body, std::uint16_t expectedPacketId);
    static Publish decodePublish(std::uint8_t flags, std::string const& body);

private:
    static void appendString(std::string& out, std::string const& value);
    static void appendUint16(std::string& out, std::uint16_t value);
    static std::uint16_t readUint16(std::string const& body, std::size_t offset);
};
