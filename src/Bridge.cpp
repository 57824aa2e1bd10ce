#include "tuiobridge/Bridge.h"

#include <chrono>
#include <iomanip>
#include <optional>
#include <sstream>

#include "tuiobridge/Encoder.h"
#include "tuiobridge/Exceptions.h"
#include "tuiobridge/Logging.h"
#include "tuiobridge/Normalizer.h"
#include "tuiobridge/Types.h"

namespace tuiobridge {

    namespace {
        constexpr size_t LOG_EXCERPT_LENGTH = 100;
        const char *const TUIO_CURSOR_ADDRESS = "/tuio/2Dcur";

        std::string excerpt(const std::string &text) {
            if (text.size() <= LOG_EXCERPT_LENGTH) {
                return text;
            }
            return text.substr(0, LOG_EXCERPT_LENGTH) + "...";
        }

        // Numbers with three decimals, anything else as compact JSON
        std::string formatArgument(const nlohmann::json &value) {
            if (value.is_number_float()) {
                std::ostringstream ss;
                ss << std::fixed << std::setprecision(3) << value.get<double>();
                return ss.str();
            }
            if (value.is_string()) {
                return value.get<std::string>();
            }
            return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }
    }  // namespace

    const char *frameResultName(FrameResult result) {
        switch (result) {
            case FrameResult::Sent:
                return "sent";
            case FrameResult::ParseFailed:
                return "parse failed";
            case FrameResult::ShapeRejected:
                return "shape rejected";
            case FrameResult::Empty:
                return "empty";
            case FrameResult::EncodeFailed:
                return "encode failed";
            case FrameResult::TransportFailed:
                return "transport failed";
            case FrameResult::BinaryRejected:
                return "binary rejected";
        }
        return "unknown";
    }

    std::string BridgeStats::toString() const {
        std::ostringstream ss;
        ss << framesReceived << " frames, " << datagramsSent << " datagrams (" << bytesSent
           << " bytes)";
        uint64_t dropped = parseFailures + shapeRejections + emptyFrames + encodeFailures +
                           transportFailures + binaryRejections;
        if (dropped > 0) {
            ss << ", dropped: " << parseFailures << " unparsable, " << shapeRejections
               << " unrecognized, " << emptyFrames << " empty, " << encodeFailures
               << " unencodable, " << transportFailures << " send failures, "
               << binaryRejections << " binary";
        }
        return ss.str();
    }

    Bridge::Bridge(DatagramSender sender, std::string destination)
        : sender_(std::move(sender)), destination_(std::move(destination)) {
        if (!sender_) {
            throw InvalidArgumentException("Bridge requires a datagram sender");
        }
    }

    FrameResult Bridge::handleText(const std::string &text) {
        ++stats_.framesReceived;

        std::vector<Packet> packets;
        try {
            nlohmann::json document = Normalizer::parse(text);
            packets = Normalizer::normalize(document);
            if (Logging::isEnabled(LogLevel::Debug)) {
                logRequestedTime(document);
            }
        } catch (const ParseException &e) {
            ++stats_.parseFailures;
            logError(std::string(e.what()) + ", data: " + excerpt(text));
            return FrameResult::ParseFailed;
        } catch (const ShapeException &e) {
            ++stats_.shapeRejections;
            logWarning(e.what());
            return FrameResult::ShapeRejected;
        }

        if (packets.empty()) {
            ++stats_.emptyFrames;
            logWarning("Frame carried no packets: " + excerpt(text));
            return FrameResult::Empty;
        }

        if (Logging::isEnabled(LogLevel::Debug)) {
            logTuioPackets(packets);
        }

        std::vector<std::byte> datagram;
        try {
            datagram = encodePackets(packets);
        } catch (const BridgeException &e) {
            ++stats_.encodeFailures;
            logError("Failed to encode frame: " + std::string(e.what()));
            return FrameResult::EncodeFailed;
        }

        try {
            sender_(datagram);
        } catch (const BridgeException &e) {
            ++stats_.transportFailures;
            logError(e.what());
            return FrameResult::TransportFailed;
        }

        ++stats_.datagramsSent;
        stats_.bytesSent += datagram.size();
        if (Logging::isEnabled(LogLevel::Debug)) {
            std::string target = destination_.empty() ? std::string() : " to " + destination_;
            logDebug("Forwarded " + std::to_string(packets.size()) + " packet(s)" + target +
                     ", size: " + std::to_string(datagram.size()) + " bytes");
        }
        return FrameResult::Sent;
    }

    FrameResult Bridge::handleBinary(size_t size) {
        ++stats_.framesReceived;
        ++stats_.binaryRejections;
        logWarning("Received non-text frame (" + std::to_string(size) + " bytes), ignoring");
        return FrameResult::BinaryRejected;
    }

    std::vector<std::byte> Bridge::encodePackets(const std::vector<Packet> &packets) {
        if (packets.empty()) {
            throw InvalidArgumentException("No packets to encode");
        }
        if (packets.size() == 1) {
            return encodeMessage(packets.front());
        }
        return encodeBundle(packets, TimeTag::now());
    }

    void Bridge::logRequestedTime(const nlohmann::json &document) const {
        std::optional<TimeTag> requested = Normalizer::requestedTime(document);
        if (!requested) {
            return;
        }
        auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
                                requested->toTimePoint().time_since_epoch())
                                .count();
        logDebug("Frame requests time tag " + std::to_string(milliseconds) +
                 " ms, sending as immediate");
    }

    void Bridge::logTuioPackets(const std::vector<Packet> &packets) const {
        for (const auto &packet : packets) {
            const auto &args = packet.args;
            if (packet.address != TUIO_CURSOR_ADDRESS || args.size() < 2 ||
                !args[0].is_string()) {
                continue;
            }

            const std::string command = args[0].get<std::string>();
            if (command == "set" && args.size() >= 7) {
                logDebug("TUIO set: session=" + formatArgument(args[1]) +
                         ", x=" + formatArgument(args[2]) + ", y=" + formatArgument(args[3]) +
                         ", vx=" + formatArgument(args[4]) + ", vy=" + formatArgument(args[5]) +
                         ", accel=" + formatArgument(args[6]));
            } else if (command == "alive" && args.size() >= 3) {
                nlohmann::json sessions = nlohmann::json::array();
                for (size_t i = 1; i < args.size(); ++i) {
                    sessions.push_back(args[i]);
                }
                logDebug("TUIO alive: " + formatArgument(sessions));
            } else if (command == "fseq") {
                logDebug("TUIO fseq: " + formatArgument(args[1]));
            } else if (command == "source") {
                logDebug("TUIO source: " + formatArgument(args[1]));
            }
        }
    }

}  // namespace tuiobridge
