#include "storefront/stock_validator.hpp"

#include <algorithm>
#include <unordered_map>

namespace storefront {

StockCheck StockValidator::validate(const std::vector<StockRequest>& items) {
    StockCheck result;
    if (items.empty()) return result;

    auto lease = pool_.acquire();
    db::Transaction tx(*lease, db::Transaction::Mode::Deferred);
    auto lookup = lease->prepare(
        "SELECT stock FROM variants WHERE id = ?1 AND is_active = 1");

    std::unordered_map<std::string, int64_t> available_by_unit;
    for (const auto& item : items) {
        auto it = available_by_unit.find(item.variant_id);
        if (it == available_by_unit.end()) {
            lookup.bind(1, item.variant_id);
            int64_t available = lookup.step() ? std::max<int64_t>(lookup.column_int64(0), 0) : 0;
            lookup.reset();
            it = available_by_unit.emplace(item.variant_id, available).first;
        }

        if (it->second < item.quantity) {
            result.shortfalls.push_back(
                {item.variant_id, item.product_name, item.quantity, it->second});
        }
    }

    lookup.reset();
    tx.commit();

    result.valid = result.shortfalls.empty();
    return result;
}

} // namespace storefront
