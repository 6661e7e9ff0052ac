#pragma once

#include "conductor/types.hpp"
#include "conductor/config.hpp"
#include "conductor/cancellation.hpp"
#include "conductor/exceptions.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace conductor {

// What the core hands a provider client. Wire formats stay opaque.
struct ProviderRequest {
    ActionId action_id;
    AgentKey agent_id;
    std::string type;
    ParameterMap parameters;
    std::string model;                       // empty = provider default
    RequestPriority priority{RequestPriority::Medium};
    std::optional<Duration> timeout;

    // Providers the router must not use for this request
    std::vector<ProviderId> excluded_providers;

    // Degradation advice attached by the budget guardrail
    std::optional<std::string> fallback_model;
    std::optional<std::int64_t> max_context_tokens;

    // Charge the agent's token bucket at dispatch. Cleared for requests
    // whose agent was already charged on the way into the queue.
    bool charge_agent{true};

    // Checked before every attempt, retry pause and admission wait
    std::shared_ptr<CancellationToken> cancellation;
};

struct ProviderResponse {
    std::string payload;
    std::int64_t input_tokens{0};
    std::int64_t output_tokens{0};
    std::string model;
};

// Thrown by ProviderClient implementations.
//
// http_status, when present, decides the classification. Transport-level
// failures without a status carry a kind hint instead.
class ProviderError : public ConductorException {
public:
    explicit ProviderError(const std::string& message,
                           std::optional<int> http_status = std::nullopt,
                           ErrorKind hint = ErrorKind::TransientProviderError)
        : ConductorException(message)
        , http_status_(http_status)
        , hint_(hint) {}

    static ProviderError timeout(const std::string& message) {
        return ProviderError(message, std::nullopt, ErrorKind::Timeout);
    }
    static ProviderError connection_reset(const std::string& message) {
        return ProviderError(message, std::nullopt, ErrorKind::TransientProviderError);
    }

    const std::optional<int>& http_status() const noexcept { return http_status_; }
    ErrorKind hint() const noexcept { return hint_; }

private:
    std::optional<int> http_status_;
    ErrorKind hint_;
};

// Maps an HTTP status to Timeout / RateLimited / TransientProviderError /
// PermanentProviderError.
ErrorKind classify_status(int http_status);
ErrorKind classify_error(const ProviderError& error);

// Abstract upstream client. Implementations must be safe to call from
// several threads at once; an abandoned (timed out) call may still be
// running when the next one starts.
class ProviderClient {
public:
    virtual ~ProviderClient() = default;
    virtual ProviderResponse invoke(const ProviderConfig& provider, const ProviderRequest& request) = 0;
};

// Provider-priced cost of one call in USD
double call_cost(const ModelPricing& pricing, std::int64_t input_tokens, std::int64_t output_tokens);

} // namespace conductor
