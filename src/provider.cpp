#include "conductor/provider.hpp"

namespace conductor {

ErrorKind classify_status(int http_status) {
    switch (http_status) {
        case 408:
            return ErrorKind::Timeout;
        case 429:
            return ErrorKind::RateLimited;
        case 500:
        case 502:
        case 503:
        case 504:
            return ErrorKind::TransientProviderError;
        default:
            break;
    }
    if (http_status >= 500 && http_status != 501) {
        return ErrorKind::TransientProviderError;
    }
    // 400, 401, 403 and every other 4xx, plus anything unexpected
    return ErrorKind::PermanentProviderError;
}

ErrorKind classify_error(const ProviderError& error) {
    if (error.http_status().has_value()) {
        return classify_status(error.http_status().value());
    }
    return error.hint();
}

double call_cost(const ModelPricing& pricing, std::int64_t input_tokens, std::int64_t output_tokens) {
    return (static_cast<double>(input_tokens) / 1000.0) * pricing.input_price_per_1k +
           (static_cast<double>(output_tokens) / 1000.0) * pricing.output_price_per_1k +
           pricing.cost_per_request;
}

} // namespace conductor
