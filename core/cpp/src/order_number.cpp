#include "storefront/order_number.hpp"
#include "storefront/errors.hpp"
#include "storefront/helpers.hpp"
#include "storefront/logging.hpp"

#include <cctype>
#include <cstring>
#include <memory>
#include <mutex>
#include <random>

namespace storefront {

namespace {

bool is_prefix_char(char c) {
    return std::isupper(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c));
}

bool in_alphabet(char c) {
    return c != '\0' && std::strchr(OrderNumberGenerator::kAlphabet, c) != nullptr;
}

} // anonymous namespace

OrderNumberGenerator::OrderNumberGenerator(std::string prefix, TokenSource source)
    : prefix_(std::move(prefix)), source_(std::move(source)) {
    if (prefix_.empty()) throw ConfigError("order number prefix must not be empty");
    for (char c : prefix_) {
        if (!is_prefix_char(c)) {
            throw ConfigError("order number prefix must be upper-case alphanumeric: " + prefix_);
        }
    }
}

std::string OrderNumberGenerator::generate(Timestamp date) {
    return prefix_ + "-" + helpers::utc_date_stamp(date) + "-" + source_();
}

std::string OrderNumberGenerator::allocate(db::Connection& connection, Timestamp date) {
    auto exists = connection.prepare("SELECT 1 FROM orders WHERE order_number = ?1");

    for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
        auto candidate = generate(date);
        exists.bind(1, candidate);
        bool taken = exists.step();
        exists.reset();
        if (!taken) return candidate;

        log_warn("order_number", "order_number_collision",
                 {{"candidate", candidate}, {"attempt", attempt}});
    }
    throw IdentifierExhaustedError(kMaxAttempts);
}

bool OrderNumberGenerator::is_well_formed(const std::string& number) {
    auto first = number.find('-');
    if (first == std::string::npos || first == 0) return false;
    // PREFIX '-' 8 digits '-' 4 symbols
    if (number.size() != first + 1 + 8 + 1 + kTokenLength) return false;

    for (size_t i = 0; i < first; ++i) {
        if (!is_prefix_char(number[i])) return false;
    }
    for (size_t i = first + 1; i < first + 9; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(number[i]))) return false;
    }
    if (number[first + 9] != '-') return false;
    for (size_t i = first + 10; i < number.size(); ++i) {
        if (!in_alphabet(number[i])) return false;
    }
    return true;
}

OrderNumberGenerator::TokenSource OrderNumberGenerator::random_token_source() {
    struct Engine {
        std::mutex mutex;
        std::random_device device;
        std::uniform_int_distribution<size_t> pick{0, std::strlen(kAlphabet) - 1};
    };
    auto engine = std::make_shared<Engine>();

    return [engine]() {
        std::string token(kTokenLength, ' ');
        std::lock_guard<std::mutex> lock(engine->mutex);
        for (auto& c : token) {
            c = kAlphabet[engine->pick(engine->device)];
        }
        return token;
    };
}

} // namespace storefront
