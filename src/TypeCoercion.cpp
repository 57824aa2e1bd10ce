#include "tuiobridge/TypeCoercion.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

#include "tuiobridge/Logging.h"

namespace tuiobridge {

    namespace {
        // Largest magnitude that still converts exactly to int64_t
        constexpr double INT64_CONVERTIBLE_LIMIT = 9223372036854775807.0;

        float narrowToFloat(double value) {
            if (std::isfinite(value) && std::fabs(value) > std::numeric_limits<float>::max()) {
                return value > 0 ? std::numeric_limits<float>::infinity()
                                 : -std::numeric_limits<float>::infinity();
            }
            return static_cast<float>(value);
        }
    }  // namespace

    int32_t TypeCoercion::truncateToInt32(uint64_t value) {
        return static_cast<int32_t>(static_cast<uint32_t>(value & 0xFFFFFFFFULL));
    }

    std::optional<Value> TypeCoercion::parseNumeric(const std::string &text) {
        if (text.empty()) {
            return std::nullopt;
        }

        const char *begin = text.c_str();
        char *end = nullptr;
        errno = 0;
        double number = std::strtod(begin, &end);
        if (end != begin + text.size() || errno == ERANGE || !std::isfinite(number)) {
            return std::nullopt;
        }

        if (std::floor(number) == number && std::fabs(number) < INT64_CONVERTIBLE_LIMIT) {
            auto whole = static_cast<int64_t>(number);
            return Value(truncateToInt32(static_cast<uint64_t>(whole)));
        }
        return Value(narrowToFloat(number));
    }

    Value TypeCoercion::classify(const nlohmann::json &value) {
        if (value.is_string()) {
            return Value(value.get<std::string>());
        }

        if (value.is_boolean()) {
            return Value(static_cast<Value::Int32>(value.get<bool>() ? 1 : 0));
        }

        if (value.is_number_unsigned()) {
            return Value(truncateToInt32(value.get<uint64_t>()));
        }

        if (value.is_number_integer()) {
            return Value(truncateToInt32(static_cast<uint64_t>(value.get<int64_t>())));
        }

        if (value.is_number_float()) {
            return Value(narrowToFloat(value.get<double>()));
        }

        // null, array, object, binary: fall back to the value's JSON text
        std::string text = value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (auto numeric = parseNumeric(text)) {
            return *numeric;
        }

        logWarning("Cannot encode argument " + text + " of type " + value.type_name() +
                   ", sending it as a string");
        return Value(text);
    }

}  // namespace tuiobridge
