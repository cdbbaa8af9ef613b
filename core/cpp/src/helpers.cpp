#include "storefront/helpers.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace storefront {
namespace helpers {

google::protobuf::Timestamp to_timestamp(Timestamp tp) {
    auto duration = tp.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

google::protobuf::Timestamp now() {
    return to_timestamp(std::chrono::system_clock::now());
}

std::string utc_date_stamp(Timestamp tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y%m%d");
    return ss.str();
}

std::optional<std::string> mask_phone(const std::optional<std::string>& phone) {
    if (!phone || phone->empty()) return std::nullopt;
    auto tail = phone->size() > 4 ? phone->substr(phone->size() - 4) : *phone;
    return "***" + tail;
}

std::string normalize_order_number(const std::string& raw) {
    auto begin = std::find_if_not(raw.begin(), raw.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(raw.rbegin(), raw.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) return "";

    std::string result(begin, end);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool is_valid_utf8(const std::string& text) {
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t length = 0;
        unsigned char min_second = 0x80;
        unsigned char max_second = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) min_second = 0xA0;  // overlong
            if (lead == 0xED) max_second = 0x9F;  // surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) min_second = 0x90;  // overlong
            if (lead == 0xF4) max_second = 0x8F;  // above U+10FFFF
        } else {
            return false;
        }

        if (n - i < length) return false;
        auto second = static_cast<unsigned char>(text[i + 1]);
        if (second < min_second || second > max_second) return false;
        for (size_t k = 2; k < length; ++k) {
            auto next = static_cast<unsigned char>(text[i + k]);
            if (next < 0x80 || next > 0xBF) return false;
        }
        i += length;
    }
    return true;
}

} // namespace helpers
} // namespace storefront
