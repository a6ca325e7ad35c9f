#pragma once

#include <grpcpp/grpcpp.h>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace storefront {

enum class ErrorKind {
    InvalidConfiguration,
    InvalidQuantity,
    ProductInactive,
    InsufficientStock,
    MaximumExceeded,
    DuplicateProduct
};

class ValidationError : public std::runtime_error {
public:
    ValidationError(const std::string& message, ErrorKind kind)
        : std::runtime_error(message), kind_(kind) {}

    static ValidationError invalid_configuration(const std::string& message) {
        return ValidationError(message, ErrorKind::InvalidConfiguration);
    }

    static ValidationError invalid_quantity(const std::string& product, int32_t quantity) {
        return ValidationError("Quantity for '" + product + "' must be positive, got " +
                                   std::to_string(quantity),
                               ErrorKind::InvalidQuantity);
    }

    static ValidationError product_inactive(const std::string& product) {
        return ValidationError("'" + product + "' is not available for ordering",
                               ErrorKind::ProductInactive);
    }

    static ValidationError insufficient_stock(const std::string& product, int32_t requested,
                                              int32_t available) {
        return ValidationError("Store cannot provide " + std::to_string(requested) + "x '" +
                                   product + "', only " + std::to_string(available) + " left",
                               ErrorKind::InsufficientStock);
    }

    static ValidationError maximum_exceeded(const std::string& product, int32_t requested,
                                            int32_t maximum) {
        return ValidationError("'" + product + "' is limited to " + std::to_string(maximum) +
                                   " per order, requested " + std::to_string(requested),
                               ErrorKind::MaximumExceeded);
    }

    static ValidationError duplicate_product(const std::string& product) {
        return ValidationError("Product '" + product + "' already exists in the store",
                               ErrorKind::DuplicateProduct);
    }

    ErrorKind kind() const { return kind_; }

    // Per-line failures that settlement reports and skips.
    bool recoverable() const {
        return kind_ == ErrorKind::ProductInactive ||
               kind_ == ErrorKind::InsufficientStock ||
               kind_ == ErrorKind::MaximumExceeded;
    }

    grpc::Status to_grpc_status() const {
        switch (kind_) {
            case ErrorKind::InvalidConfiguration:
            case ErrorKind::InvalidQuantity:
                return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, what());
            case ErrorKind::ProductInactive:
            case ErrorKind::InsufficientStock:
            case ErrorKind::MaximumExceeded:
                return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, what());
            case ErrorKind::DuplicateProduct:
                return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, what());
            default:
                return grpc::Status(grpc::StatusCode::UNKNOWN, what());
        }
    }

private:
    ErrorKind kind_;
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidConfiguration: return "invalid_configuration";
        case ErrorKind::InvalidQuantity: return "invalid_quantity";
        case ErrorKind::ProductInactive: return "product_inactive";
        case ErrorKind::InsufficientStock: return "insufficient_stock";
        case ErrorKind::MaximumExceeded: return "maximum_exceeded";
        case ErrorKind::DuplicateProduct: return "duplicate_product";
    }
    return "unknown";
}

}  // namespace storefront
