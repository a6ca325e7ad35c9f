#include "promotion.hpp"
#include "storefront/validation.hpp"
#include <utility>

namespace catalog {

using namespace storefront;

Promotion::Promotion(PromotionKind kind, std::string name, double percent)
    : kind_(kind), name_(std::move(name)), percent_(percent) {
    validation::require_not_empty(name_, "Promotion name");
}

Promotion Promotion::second_half_price(const std::string& name) {
    return Promotion(PromotionKind::SecondHalfPrice, name, 0.0);
}

Promotion Promotion::third_one_free(const std::string& name) {
    return Promotion(PromotionKind::ThirdOneFree, name, 0.0);
}

Promotion Promotion::percent_off(const std::string& name, double percent) {
    validation::require_finite(percent, "Discount percent");
    validation::require_positive(percent, "Discount percent");
    if (percent > 100.0) {
        throw ValidationError::invalid_configuration("Discount percent cannot exceed 100");
    }
    return Promotion(PromotionKind::PercentOff, name, percent);
}

double Promotion::apply(double unit_price, int32_t quantity) const {
    switch (kind_) {
        case PromotionKind::SecondHalfPrice: {
            // Every second unit of a pair is half price.
            int32_t half_units = quantity / 2;
            int32_t full_units = quantity - half_units;
            return full_units * unit_price + half_units * (unit_price / 2.0);
        }
        case PromotionKind::ThirdOneFree: {
            int32_t free_units = quantity / 3;
            return (quantity - free_units) * unit_price;
        }
        case PromotionKind::PercentOff:
            return quantity * unit_price * (1.0 - percent_ / 100.0);
    }
    return quantity * unit_price;
}

}  // namespace catalog
