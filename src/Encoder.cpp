#include "tuiobridge/Encoder.h"

#include "tuiobridge/Bundle.h"
#include "tuiobridge/Message.h"

namespace tuiobridge {

    std::vector<std::byte> encodeMessage(const std::string &address, const nlohmann::json &args) {
        Packet packet;
        packet.address = address;
        packet.args = args;
        return encodeMessage(packet);
    }

    std::vector<std::byte> encodeMessage(const Packet &packet) {
        return Message::fromPacket(packet).serialize();
    }

    std::vector<std::byte> encodeBundle(const std::vector<Packet> &packets,
                                        const TimeTag &requestedTime) {
        Bundle bundle(requestedTime);
        for (const auto &packet : packets) {
            bundle.addMessage(Message::fromPacket(packet));
        }
        return bundle.serialize();
    }

}  // namespace tuiobridge
