#include "tuiobridge/Normalizer.h"

#include <cstdint>

#include "tuiobridge/Exceptions.h"

namespace tuiobridge {

    Packet Packet::fromJson(const nlohmann::json &object) {
        if (!object.is_object()) {
            throw ShapeException("Packet must be a JSON object, got " +
                                 std::string(object.type_name()));
        }

        auto address = object.find("address");
        if (address == object.end() || !address->is_string()) {
            throw ShapeException("Packet has no string \"address\"");
        }

        Packet packet;
        packet.address = address->get<std::string>();
        if (packet.address.empty()) {
            throw ShapeException("Packet address is empty");
        }

        auto args = object.find("args");
        if (args == object.end() || args->is_null()) {
            packet.args = nlohmann::json::array();
        } else if (args->is_array()) {
            packet.args = *args;
        } else {
            packet.args = nlohmann::json::array({*args});
        }
        return packet;
    }

    namespace {
        // Requested times past this (year 33658) are ignored
        constexpr double MAX_REQUESTED_MILLISECONDS = 1.0e15;

        std::vector<Packet> packetsFromArray(const nlohmann::json &array) {
            std::vector<Packet> packets;
            packets.reserve(array.size());
            for (const auto &element : array) {
                packets.push_back(Packet::fromJson(element));
            }
            return packets;
        }

        const nlohmann::json &requireArray(const nlohmann::json &packets, Envelope envelope) {
            if (!packets.is_array()) {
                throw ShapeException(std::string("\"packets\" of a ") +
                                     Normalizer::envelopeName(envelope) + " must be an array");
            }
            return packets;
        }
    }  // namespace

    Envelope Normalizer::classify(const nlohmann::json &document) {
        if (document.is_object()) {
            if (document.contains("address")) {
                return Envelope::SingleMessage;
            }

            bool hasPackets = document.contains("packets");
            auto bundle = document.find("bundle");
            if (hasPackets && bundle != document.end() && bundle->is_boolean() &&
                bundle->get<bool>()) {
                return Envelope::FlaggedBundle;
            }
            if (hasPackets && document.contains("timeTag")) {
                return Envelope::TimedBundle;
            }
            if (hasPackets) {
                return Envelope::PacketList;
            }
            return Envelope::Unrecognized;
        }

        if (document.is_array()) {
            return Envelope::BareArray;
        }

        return Envelope::Unrecognized;
    }

    std::vector<Packet> Normalizer::normalize(const nlohmann::json &document) {
        Envelope envelope = classify(document);
        switch (envelope) {
            case Envelope::SingleMessage:
                return {Packet::fromJson(document)};

            case Envelope::FlaggedBundle: {
                const auto &packets = document.at("packets");
                if (packets.is_array()) {
                    return packetsFromArray(packets);
                }
                return {Packet::fromJson(packets)};
            }

            case Envelope::TimedBundle:
            case Envelope::PacketList:
                return packetsFromArray(requireArray(document.at("packets"), envelope));

            case Envelope::BareArray:
                return packetsFromArray(document);

            case Envelope::Unrecognized:
                break;
        }

        std::string text =
            document.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        throw ShapeException("Unrecognized message format: " + text.substr(0, 100));
    }

    nlohmann::json Normalizer::parse(const std::string &jsonText) {
        try {
            return nlohmann::json::parse(jsonText);
        } catch (const nlohmann::json::parse_error &e) {
            throw ParseException("JSON parse failed: " + std::string(e.what()));
        }
    }

    std::vector<Packet> Normalizer::normalize(const std::string &jsonText) {
        return normalize(parse(jsonText));
    }

    std::optional<TimeTag> Normalizer::requestedTime(const nlohmann::json &document) {
        if (!document.is_object()) {
            return std::nullopt;
        }
        auto timeTag = document.find("timeTag");
        if (timeTag == document.end() || !timeTag->is_number()) {
            return std::nullopt;
        }
        if (timeTag->is_number_float()) {
            double milliseconds = timeTag->get<double>();
            if (!(milliseconds >= 0.0 && milliseconds < MAX_REQUESTED_MILLISECONDS)) {
                return std::nullopt;
            }
            return TimeTag::fromUnixMilliseconds(static_cast<int64_t>(milliseconds));
        }
        if (timeTag->is_number_unsigned()) {
            uint64_t milliseconds = timeTag->get<uint64_t>();
            if (milliseconds >= static_cast<uint64_t>(MAX_REQUESTED_MILLISECONDS)) {
                return std::nullopt;
            }
            return TimeTag::fromUnixMilliseconds(static_cast<int64_t>(milliseconds));
        }
        int64_t milliseconds = timeTag->get<int64_t>();
        if (milliseconds < 0 || milliseconds >= static_cast<int64_t>(MAX_REQUESTED_MILLISECONDS)) {
            return std::nullopt;
        }
        return TimeTag::fromUnixMilliseconds(milliseconds);
    }

    const char *Normalizer::envelopeName(Envelope envelope) {
        switch (envelope) {
            case Envelope::SingleMessage:
                return "single message";
            case Envelope::FlaggedBundle:
                return "flagged bundle";
            case Envelope::TimedBundle:
                return "timed bundle";
            case Envelope::PacketList:
                return "packet list";
            case Envelope::BareArray:
                return "bare array";
            case Envelope::Unrecognized:
                break;
        }
        return "unrecognized envelope";
    }

}  // namespace tuiobridge
