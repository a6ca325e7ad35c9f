#include "product.hpp"
#include "storefront/validation.hpp"
#include <iomanip>
#include <sstream>
#include <utility>

namespace catalog {

using namespace storefront;

Product::Product(Key, ProductKind kind, std::string name, double price, int32_t stock,
                 int32_t maximum)
    : kind_(kind), name_(std::move(name)), price_(price), stock_(stock), maximum_(maximum) {
    validation::require_not_empty(name_, "Product name");
    validation::require_finite(price_, "Price");
    validation::require_non_negative(price_, "Price");
    validation::require_non_negative(stock_, "Quantity");
    if (kind_ == ProductKind::Limited) validation::require_positive(maximum_, "Maximum");
}

ProductPtr Product::standard(const std::string& name, double price, int32_t stock) {
    return std::make_shared<Product>(Key{}, ProductKind::Standard, name, price, stock, 0);
}

ProductPtr Product::unlimited(const std::string& name, double price) {
    return std::make_shared<Product>(Key{}, ProductKind::Unlimited, name, price, 0, 0);
}

ProductPtr Product::limited(const std::string& name, double price, int32_t stock,
                            int32_t maximum) {
    return std::make_shared<Product>(Key{}, ProductKind::Limited, name, price, stock, maximum);
}

void Product::set_stock(int32_t stock) {
    if (!tracks_stock()) {
        throw ValidationError::invalid_configuration("'" + name_ + "' does not track stock");
    }
    if (stock < 0) throw ValidationError::invalid_quantity(name_, stock);
    stock_ = stock;
}

double Product::purchase(int32_t quantity) {
    if (quantity < 1) throw ValidationError::invalid_quantity(name_, quantity);
    if (tracks_stock() && !enabled_) throw ValidationError::product_inactive(name_);
    if (kind_ == ProductKind::Limited && quantity > maximum_) {
        throw ValidationError::maximum_exceeded(name_, quantity, maximum_);
    }
    if (tracks_stock() && quantity > stock_) {
        throw ValidationError::insufficient_stock(name_, quantity, stock_);
    }

    if (tracks_stock()) stock_ -= quantity;
    return quote(quantity);
}

double Product::quote(int32_t quantity) const {
    if (promotion_) return promotion_->apply(price_, quantity);
    return quantity * price_;
}

std::string Product::describe() const {
    std::ostringstream out;
    out << name_ << ", Price: $" << std::fixed << std::setprecision(2) << price_ << ", Quantity: ";
    if (tracks_stock()) {
        out << stock_;
    } else {
        out << "Unlimited";
    }
    out << ", Promotion: " << (promotion_ ? promotion_->name() : "None");
    if (kind_ == ProductKind::Limited) out << ", Limited to " << maximum_ << " per order!";
    return out.str();
}

}  // namespace catalog
