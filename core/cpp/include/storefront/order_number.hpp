#pragma once

#include <functional>
#include <string>
#include "db.hpp"
#include "types.hpp"

namespace storefront {

/**
 * Generates public order numbers of the form PREFIX-YYYYMMDD-XXXX.
 *
 * The 4-character suffix is drawn from a 32-symbol alphabet without the
 * look-alikes 0/O/1/I, giving 32^4 combinations per day. Candidates are
 * checked against persisted orders and regenerated on collision, up to
 * kMaxAttempts candidates in total.
 *
 * Example:
 *   OrderNumberGenerator numbers("TF");
 *   db::Transaction tx(*lease);
 *   auto number = numbers.allocate(*lease, checkout_started_at);
 *   // "TF-20260301-K7QD"
 */
class OrderNumberGenerator {
public:
    using TokenSource = std::function<std::string()>;

    static constexpr const char* kAlphabet = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
    static constexpr int kTokenLength = 4;
    static constexpr int kMaxAttempts = 5;

    /**
     * @param prefix Non-empty upper-case alphanumeric prefix
     * @param source Suffix source; defaults to a random_device-seeded engine
     * @throws ConfigError if the prefix is malformed
     */
    explicit OrderNumberGenerator(std::string prefix, TokenSource source = random_token_source());

    /**
     * Build one candidate for the UTC date of `date`. No store access.
     */
    std::string generate(Timestamp date);

    /**
     * Allocate a number no persisted order uses. Call inside the checkout
     * transaction so the existence check and the insert see the same data.
     *
     * The date is taken as given; callers fix it when the checkout starts.
     *
     * @throws IdentifierExhaustedError after kMaxAttempts collisions
     */
    std::string allocate(db::Connection& connection, Timestamp date);

    const std::string& prefix() const { return prefix_; }

    /**
     * Check that `number` has the shape PREFIX-YYYYMMDD-XXXX with a suffix
     * from the alphabet. Any prefix of upper-case letters and digits is accepted.
     */
    static bool is_well_formed(const std::string& number);

    /**
     * Thread-safe source of random suffixes.
     */
    static TokenSource random_token_source();

private:
    std::string prefix_;
    TokenSource source_;
};

} // namespace storefront
