/*
 * TuioBridge - WebSocket JSON to OSC/TUIO relay.
 * This file contains the implementation of the TimeTag class,
 * which is responsible for handling OSC time tags.
 */

#include <chrono>
#include <cstdint>

#include "tuiobridge/Types.h"

namespace tuiobridge {

    namespace {
        // Seconds between the NTP epoch (1900) and the Unix epoch (1970)
        constexpr uint64_t NTP_UNIX_OFFSET = 2208988800ULL;
    }  // namespace

    // Default constructor (immediate time tag)
    TimeTag::TimeTag() : seconds_(0), fraction_(1) {}

    // Constructor from NTP format
    TimeTag::TimeTag(uint64_t ntp)
        : seconds_(static_cast<uint32_t>((ntp >> 32) & 0xFFFFFFFF)),
          fraction_(static_cast<uint32_t>(ntp & 0xFFFFFFFF)) {}

    // Constructor from seconds and fraction
    TimeTag::TimeTag(uint32_t seconds, uint32_t fraction)
        : seconds_(seconds), fraction_(fraction) {}

    // Constructor from std::chrono::system_clock::time_point
    TimeTag::TimeTag(std::chrono::system_clock::time_point tp) {
        auto sinceEpoch = tp.time_since_epoch();
        auto wholeSeconds = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
        auto nanos =
            std::chrono::duration_cast<std::chrono::nanoseconds>(sinceEpoch - wholeSeconds).count();
        if (nanos < 0) {
            wholeSeconds -= std::chrono::seconds(1);
            nanos += 1000000000LL;
        }
        seconds_ = static_cast<uint32_t>(static_cast<uint64_t>(wholeSeconds.count()) +
                                         NTP_UNIX_OFFSET);
        fraction_ = static_cast<uint32_t>((static_cast<uint64_t>(nanos) << 32) / 1000000000ULL);
    }

    TimeTag TimeTag::now() { return TimeTag(std::chrono::system_clock::now()); }

    TimeTag TimeTag::immediate() { return TimeTag(); }

    TimeTag TimeTag::fromUnixMilliseconds(int64_t milliseconds) {
        return TimeTag(std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::milliseconds(milliseconds))));
    }

    // Convert to NTP format
    uint64_t TimeTag::toNTP() const { return (static_cast<uint64_t>(seconds_) << 32) | fraction_; }

    // Convert to std::chrono::system_clock::time_point
    std::chrono::system_clock::time_point TimeTag::toTimePoint() const {
        auto secondsSinceEpoch =
            static_cast<int64_t>(seconds_) - static_cast<int64_t>(NTP_UNIX_OFFSET);
        auto nanos = static_cast<int64_t>((static_cast<uint64_t>(fraction_) * 1000000000ULL) >> 32);
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(secondsSinceEpoch) + std::chrono::nanoseconds(nanos)));
    }

    uint32_t TimeTag::seconds() const { return seconds_; }

    uint32_t TimeTag::fraction() const { return fraction_; }

    bool TimeTag::isImmediate() const { return seconds_ == 0 && fraction_ == 1; }

    bool TimeTag::operator==(const TimeTag &other) const {
        return seconds_ == other.seconds_ && fraction_ == other.fraction_;
    }

    bool TimeTag::operator!=(const TimeTag &other) const { return !(*this == other); }

    bool TimeTag::operator<(const TimeTag &other) const {
        return (seconds_ < other.seconds_) ||
               (seconds_ == other.seconds_ && fraction_ < other.fraction_);
    }

}  // namespace tuiobridge
