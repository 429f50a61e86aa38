#include "toolgov/inspection/canonical_json.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace toolgov::inspection {

namespace {

Json canonicalize_value(const Json& value) {
    switch (value.type()) {
        case Json::value_t::object: {
            Json out = Json::object();
            for (const auto& [key, item] : value.items()) {
                out[key] = canonicalize_value(item);
            }
            return out;
        }
        case Json::value_t::array: {
            Json out = Json::array();
            for (const auto& item : value) {
                out.push_back(canonicalize_value(item));
            }
            return out;
        }
        case Json::value_t::number_float: {
            double d = value.get<double>();
            constexpr double lo = static_cast<double>(std::numeric_limits<int64_t>::min());
            constexpr double hi = static_cast<double>(std::numeric_limits<int64_t>::max());
            if (std::isfinite(d) && std::trunc(d) == d && d >= lo && d < hi) {
                return Json(static_cast<int64_t>(d));
            }
            return value;
        }
        case Json::value_t::number_unsigned: {
            auto u = value.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Json(static_cast<int64_t>(u));
            }
            return value;
        }
        default:
            return value;
    }
}

}  // namespace

Json canonicalize(const Json& value) {
    if (value.is_null()) {
        return Json::object();
    }
    return canonicalize_value(value);
}

std::string canonical_encoding(const Json& value) {
    return canonicalize(value).dump();
}

}  // namespace toolgov::inspection
