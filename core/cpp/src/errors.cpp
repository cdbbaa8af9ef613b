#include "storefront/errors.hpp"
#include "storefront/wire.hpp"

#include <sstream>
#include <google/protobuf/any.pb.h>

namespace storefront {

InsufficientStockError::InsufficientStockError(std::vector<StockShortfall> shortfalls)
    : OrderError(describe(shortfalls)), shortfalls_(std::move(shortfalls)) {}

std::string InsufficientStockError::describe(const std::vector<StockShortfall>& shortfalls) {
    std::ostringstream ss;
    ss << "Some items are out of stock: ";
    for (size_t i = 0; i < shortfalls.size(); ++i) {
        if (i > 0) ss << "; ";
        ss << shortfalls[i].product_name << ": only " << shortfalls[i].available
           << " left (you requested " << shortfalls[i].requested << ")";
    }
    return ss.str();
}

grpc::Status InsufficientStockError::to_grpc_status() const {
    google::protobuf::Any details;
    details.PackFrom(wire::to_proto(shortfalls_));
    return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, what(),
                        details.SerializeAsString());
}

grpc::Status IllegalTransitionError::to_grpc_status() const {
    v1::TransitionRejected rejected;
    rejected.set_current(wire::to_proto(current_));
    rejected.set_attempted(wire::to_proto(attempted_));

    google::protobuf::Any details;
    details.PackFrom(rejected);
    return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, what(),
                        details.SerializeAsString());
}

} // namespace storefront
