#pragma once

#include <memory>
#include <mutex>
#include <utility>
#include "storefront/storefront.grpc.pb.h"
#include "store.hpp"

namespace catalog {

/**
 * gRPC front for a Store. Every call holds one mutex for its whole duration,
 * so purchases stay check-then-mutate atomic under the server's thread pool.
 */
class CatalogService final : public storefront::v1::StoreService::Service {
public:
    explicit CatalogService(Store store) : store_(std::move(store)) {}

    grpc::Status ListProducts(grpc::ServerContext* context,
                              const storefront::v1::ListProductsRequest* request,
                              storefront::v1::ListProductsResponse* response) override;

    grpc::Status GetTotalStock(grpc::ServerContext* context,
                               const storefront::v1::GetTotalStockRequest* request,
                               storefront::v1::GetTotalStockResponse* response) override;

    grpc::Status PlaceOrder(grpc::ServerContext* context,
                            const storefront::v1::PlaceOrderRequest* request,
                            storefront::v1::PlaceOrderResponse* response) override;

private:
    std::mutex mutex_;
    Store store_;
};

std::unique_ptr<CatalogService> create_store_service(Store store);

}  // namespace catalog
