#include "order_service.hpp"
#include "storefront/config.hpp"
#include "storefront/db.hpp"
#include "storefront/errors.hpp"
#include "storefront/logging.hpp"
#include "storefront/outbox.hpp"
#include "storefront/schema.hpp"
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <memory>
#include <string>

namespace {

// Chat delivery and email live outside this service; record what would be sent.
class LoggingMessenger final : public storefront::ChatMessenger {
public:
    void send(const storefront::v1::Order& order) override {
        storefront::log_info("chat", "order_message_ready",
            {{"order_number", order.order_number()}, {"tenant_id", order.tenant_id()},
             {"total_cents", order.total_cents()}});
    }
};

class LoggingNotifier final : public storefront::OrderNotifier {
public:
    void notify_new_order(const storefront::v1::Order& order) override {
        storefront::log_info("notifications", "new_order",
            {{"order_number", order.order_number()}, {"tenant_id", order.tenant_id()}});
    }

    void notify_low_stock(const storefront::v1::LowStockDetected& alert) override {
        storefront::log_warn("notifications", "low_stock",
            {{"tenant_id", alert.tenant_id()}, {"variant_id", alert.variant_id()},
             {"product_name", alert.product_name()}, {"remaining", alert.remaining()},
             {"threshold", alert.threshold()}});
    }
};

}  // namespace

int main(int argc, char** argv) {
    try {
        auto config = storefront::Config::from_env();
        std::string server_address = "0.0.0.0:" + config.port;

        storefront::db::ConnectionPool pool(config.database_path, config.pool_size,
                                            config.busy_timeout_ms);
        {
            auto lease = pool.acquire();
            storefront::schema::migrate(*lease);
        }

        LoggingMessenger messenger;
        LoggingNotifier notifier;
        storefront::EventRouter router("side_effects");
        storefront::register_side_effects(router, messenger, notifier);
        storefront::EventOutbox outbox(router);

        storefront::OrderNumberGenerator numbers(config.order_prefix);
        storefront::StockValidator validator(pool);
        storefront::OrderEngine engine(pool, validator, numbers, outbox, config.engine_options());
        storefront::OrderLifecycle lifecycle(pool, outbox);
        storefront::OrderQueries queries(pool);
        storefront::StaticTenantResolver resolver(config.seller_tokens);

        auto service = order_service::create_order_service(
            {engine, validator, lifecycle, queries, resolver});

        grpc::EnableDefaultHealthCheckService(true);
        grpc::reflection::InitProtoReflectionServerBuilderPlugin();

        grpc::ServerBuilder builder;
        builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
        builder.RegisterService(service.get());

        std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
        if (!server) {
            storefront::log_error("order", "server_start_failed", {{"address", server_address}});
            return 1;
        }

        storefront::log_info("order", "order_server_started",
            {{"port", config.port}, {"database", config.database_path},
             {"decrement_policy", storefront::to_string(config.decrement_policy)},
             {"sellers", config.seller_tokens.size()}});

        server->Wait();
        return 0;
    } catch (const storefront::ConfigError& e) {
        storefront::log_error("order", "invalid_configuration", {{"error", e.what()}});
        return 1;
    } catch (const storefront::StoreError& e) {
        storefront::log_error("order", "store_unavailable", {{"error", e.what()}, {"code", e.code()}});
        return 1;
    }
}
