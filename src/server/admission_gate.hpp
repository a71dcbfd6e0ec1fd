#pragma once

#include "common/errors.hpp"
#include "common/types.hpp"

#include <boost/asio/awaitable.hpp>
#include <jwt-cpp/jwt.h>

#include <atomic>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace shellrelay {

namespace net = boost::asio;

class ProxmoxApi;

// "Bearer abc" -> "abc"; empty if the header is not a bearer credential
std::string_view bearer_from_header(std::string_view header);

/**
 * AdmissionGate - decides who may open which console
 *
 * authenticate() turns a bearer credential into an operator identity.
 * admit() runs before any ticket is minted or claimed and before any
 * upstream connection is attempted; the relay trusts an affirmative answer.
 */
class AdmissionGate {
public:
    virtual ~AdmissionGate() = default;

    virtual std::expected<OperatorIdentity, RelayError> authenticate(std::string_view bearer) const = 0;

    virtual net::awaitable<std::expected<void, RelayError>>
    admit(const OperatorIdentity& requester, const ResourceDescriptor& target) = 0;
};

// ============================================================================
// TokenAdmissionGate
// ============================================================================
// HS256 operator tokens (claims: sub, role, email, exp). Admins may open any
// console; everyone else needs "<owner_tag_prefix><sub>" among the resource's
// hypervisor tags.
class TokenAdmissionGate : public AdmissionGate {
public:
    TokenAdmissionGate(std::string secret, ProxmoxApi& api,
                       std::string owner_tag_prefix, std::string admin_role);

    std::expected<OperatorIdentity, RelayError> authenticate(std::string_view bearer) const override;

    net::awaitable<std::expected<void, RelayError>>
    admit(const OperatorIdentity& requester, const ResourceDescriptor& target) override;

    // Signs an operator token with the gate's secret
    std::string issue_token(const std::string& subject, const std::string& role,
                            std::chrono::seconds ttl, const std::string& email = {}) const;

private:
    std::string secret_;
    ProxmoxApi& api_;
    std::string owner_tag_prefix_;
    std::string admin_role_;
    jwt::verifier<jwt::default_clock, jwt::traits::kazuho_picojson> verifier_;
};

// ============================================================================
// OpenAdmissionGate
// ============================================================================
// auth.mode = "disabled": everyone is an anonymous admin
class OpenAdmissionGate : public AdmissionGate {
public:
    std::expected<OperatorIdentity, RelayError> authenticate(std::string_view bearer) const override;

    net::awaitable<std::expected<void, RelayError>>
    admit(const OperatorIdentity& requester, const ResourceDescriptor& target) override;
};

// ============================================================================
// StaticAdmissionGate
// ============================================================================
// Callback-driven gate for embedding the relay in another process
class StaticAdmissionGate : public AdmissionGate {
public:
    using Authenticator = std::function<std::expected<OperatorIdentity, RelayError>(std::string_view)>;
    using Policy = std::function<bool(const OperatorIdentity&, const ResourceDescriptor&)>;

    StaticAdmissionGate(Authenticator authenticator, Policy policy);

    std::expected<OperatorIdentity, RelayError> authenticate(std::string_view bearer) const override;

    net::awaitable<std::expected<void, RelayError>>
    admit(const OperatorIdentity& requester, const ResourceDescriptor& target) override;

    uint64_t admit_calls() const { return admit_calls_.load(std::memory_order_relaxed); }

private:
    Authenticator authenticator_;
    Policy policy_;
    std::atomic<uint64_t> admit_calls_{0};
};

} // namespace shellrelay
