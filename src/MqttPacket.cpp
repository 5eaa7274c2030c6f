#include <stdexcept>
#include "MqttPacket.hpp"

void MqttPacket::appendUint16(std::string& out, std::uint16_t value)
{
    out.push_back(static_cast<char>(value >> 8));
    out.push_back(static_cast<char>(value & 0xFF));
}

void MqttPacket::appendString(std::string& out, std::string const& value)
{
    if (value.size() > 0xFFFF)
        throw std::invalid_argument("MQTT string too long");
    appendUint16(out, static_cast<std::uint16_t>(value.size()));
    out.append(value);
}

std::uint16_t MqttPacket::readUint16(std::string const& body, std::size_t offset)
{
    if (offset + 2 > body.size())
        throw std::runtime_error("MQTT packet truncated");
    return static_cast<std::uint16_t>((static_cast<std::uint8_t>(body[offset]) << 8) |
                                      static_cast<std::uint8_t>(body[offset + 1]));
}

std::string MqttPacket::encodeRemainingLength(std::uint32_t length)
{
    if (length > MAX_REMAINING_LENGTH)
        throw std::invalid_argument("MQTT packet too large");

    std::string out;
    do
    {
        std::uint8_t byte = length % 128;
        length /= 128;
        if (length > 0)
            byte |= 0x80;
        out.push_back(static_cast<char>(byte));
    } while (length > 0);
    return out;
}

std::optional<std::uint32_t> MqttPacket::decodeRemainingLength(std::uint8_t byte, std::uint32_t& value, int& position)
{
    if (position >= 4)
        throw std::runtime_error("MQTT remaining length exceeds four bytes");

    std::uint32_t multiplier = 1;
    for (int i = 0; i < position; ++i)
        multiplier *= 128;

    value += static_cast<std::uint32_t>(byte & 0x7F) * multiplier;
    ++position;

    if (byte & 0x80)
        return std::nullopt;
    return value;
}

std::string MqttPacket::encodeConnect(std::string const& clientId, std::uint16_t keepAliveSeconds)
{
    std::string body;
    appendString(body, "MQTT");
    body.push_back(0x04);  // protocol level 3.1.1
    body.push_back(0x02);  // clean session
    appendUint16(body, keepAliveSeconds);
    appendString(body, clientId);

    std::string packet(1, static_cast<char>(CONNECT));
    packet += encodeRemainingLength(static_cast<std::uint32_t>(body.size()));
    packet += body;
    return packet;
}

std::string MqttPacket::encodeSubscribe(std::uint16_t packetId, std::string const& topicFilter)
{
    std::string body;
    appendUint16(body, packetId);
    appendString(body, topicFilter);
    body.push_back(0x00);

    std::string packet(1, static_cast<char>(SUBSCRIBE));
    packet += encodeRemainingLength(static_cast<std::uint32_t>(body.size()));
    packet += body;
    return packet;
}

std::string MqttPacket::encodePuback(std::uint16_t packetId)
{
    std::string packet{static_cast<char>(PUBACK), 0x02};
    appendUint16(packet, packetId);
    return packet;
}

std::string MqttPacket::encodePingreq()
{
    return std::string{static_cast<char>(PINGREQ), 0x00};
}

std::string MqttPacket::encodeDisconnect()
{
    return std::string{static_cast<char>(DISCONNECT), 0x00};
}

std::uint8_t MqttPacket::decodeConnack(std::string const& body)
{
    if (body.size() != 2)
        throw std::runtime_error("malformed CONNACK");
    return static_cast<std::uint8_t>(body[1]);
}

std::uint8_t MqttPacket::decodeSuback(std::string const& body, std::uint16_t expectedPacketId)
{
    if (body.size() < 3)
        throw std::runtime_error("malformed SUBACK");
    if (readUint16(body, 0) != expectedPacketId)
        throw std::runtime_error("SUBACK for unknown packet id");
    return static_cast<std::uint8_t>(body[2]);
}

MqttPacket::Publish MqttPacket::decodePublish(std::uint8_t flags, std::string const& body)
{
    Publish publish;
    publish.qos = (flags >> 1) & 0x03;
    if (publish.qos == 3)
        throw std::runtime_error("PUBLISH with invalid QoS");

    std::uint16_t topicLength = readUint16(body, 0);
    std::size_t offset = 2;
    if (offset + topicLength > body.size())
        throw std::runtime_error("PUBLISH topic truncated");

    publish.topic = body.substr(offset, topicLength);
    offset += topicLength;

    if (publish.qos > 0)
    {
        publish.packetId = readUint16(body, offset);
        offset += 2;
    }

    publish.payload = body.substr(offset);
    return publish;
}
