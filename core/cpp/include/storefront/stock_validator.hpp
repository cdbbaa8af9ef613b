#pragma once

#include <vector>
#include "db.hpp"
#include "types.hpp"

namespace storefront {

/**
 * Read-only stock pre-check for a cart.
 *
 * Advisory only: stock can change between this check and the checkout
 * transaction, which re-checks through its conditional decrement.
 */
class StockValidator {
public:
    explicit StockValidator(db::ConnectionPool& pool) : pool_(pool) {}

    /**
     * Compare each requested quantity with the unit's current stock.
     *
     * Units that are missing or inactive count as zero available. The result
     * holds one shortfall per insufficient line, in input order, and none for
     * lines that fit.
     *
     * @throws StoreError on store failure
     */
    StockCheck validate(const std::vector<StockRequest>& items);

private:
    db::ConnectionPool& pool_;
};

} // namespace storefront
