#include "store_service.hpp"
#include "storefront/logging.hpp"
#include "storefront/validation_error.hpp"
#include <string>
#include <vector>

namespace catalog {

using namespace storefront;

grpc::Status CatalogService::ListProducts(grpc::ServerContext* /*context*/,
                                        const storefront::v1::ListProductsRequest* /*request*/,
                                        storefront::v1::ListProductsResponse* response) {
    std::lock_guard<std::mutex> lock(mutex_);
    int32_t index = 0;
    for (const auto& product : store_.active_products()) {
        auto* view = response->add_products();
        view->set_index(index++);
        view->set_name(product->name());
        view->set_price(product->price());
        view->set_unlimited(!product->tracks_stock());
        view->set_stock(product->tracks_stock() ? product->stock() : 0);
        view->set_maximum(product->maximum());
        if (product->promotion()) view->set_promotion(product->promotion()->name());
        view->set_description(product->describe());
    }
    return grpc::Status::OK;
}

grpc::Status CatalogService::GetTotalStock(grpc::ServerContext* /*context*/,
                                         const storefront::v1::GetTotalStockRequest* /*request*/,
                                         storefront::v1::GetTotalStockResponse* response) {
    std::lock_guard<std::mutex> lock(mutex_);
    response->set_total_stock(store_.total_stock());
    return grpc::Status::OK;
}

grpc::Status CatalogService::PlaceOrder(grpc::ServerContext* /*context*/,
                                      const storefront::v1::PlaceOrderRequest* request,
                                      storefront::v1::PlaceOrderResponse* response) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (request->lines().empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Order has no lines");
    }

    auto listing = store_.active_products();
    std::vector<OrderLine> lines;
    for (const auto& line : request->lines()) {
        if (line.index() < 0 || static_cast<size_t>(line.index()) >= listing.size()) {
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                                "Product index out of range: " + std::to_string(line.index()));
        }
        lines.push_back({listing[line.index()], line.quantity()});
    }

    try {
        log_info("store", "placing_order", {{"lines", lines.size()}});
        auto settlement = store_.settle_order(lines);

        response->set_total(settlement.total);
        for (const auto& failure : settlement.failures) {
            log_warn("store", "order_line_rejected",
                {{"line", failure.line}, {"product", failure.product},
                 {"requested", failure.requested}, {"reason", error_kind_name(failure.kind)}});
            auto* out = response->add_failures();
            out->set_line(static_cast<int32_t>(failure.line));
            out->set_product(failure.product);
            out->set_requested(failure.requested);
            out->set_reason(error_kind_name(failure.kind));
            out->set_message(failure.message);
        }
        log_info("store", "order_settled",
            {{"total", settlement.total}, {"failed_lines", settlement.failures.size()}});
        return grpc::Status::OK;
    } catch (const ValidationError& e) {
        log_warn("store", "order_refused", {{"reason", error_kind_name(e.kind())}, {"error", e.what()}});
        return e.to_grpc_status();
    }
}

std::unique_ptr<CatalogService> create_store_service(Store store) {
    return std::make_unique<CatalogService>(std::move(store));
}

}  // namespace catalog
