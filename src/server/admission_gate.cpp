#include "server/admission_gate.hpp"
#include "server/proxmox_api.hpp"
#include "common/log.hpp"

#include <algorithm>
#include <cctype>

namespace shellrelay {

std::string_view bearer_from_header(std::string_view header) {
    constexpr std::string_view prefix = "Bearer ";
    if (header.size() <= prefix.size()) {
        return {};
    }
    auto scheme = header.substr(0, prefix.size());
    if (!std::equal(scheme.begin(), scheme.end(), prefix.begin(), prefix.end(),
                    [](char a, char b) {
                        return std::tolower(static_cast<unsigned char>(a)) ==
                               std::tolower(static_cast<unsigned char>(b));
                    })) {
        return {};
    }
    auto token = header.substr(prefix.size());
    while (!token.empty() && token.front() == ' ') {
        token.remove_prefix(1);
    }
    return token;
}

// ============================================================================
// TokenAdmissionGate
// ============================================================================

TokenAdmissionGate::TokenAdmissionGate(std::string secret, ProxmoxApi& api,
                                       std::string owner_tag_prefix, std::string admin_role)
    : secret_(std::move(secret))
    , api_(api)
    , owner_tag_prefix_(std::move(owner_tag_prefix))
    , admin_role_(std::move(admin_role))
    , verifier_(jwt::verify()
        .allow_algorithm(jwt::algorithm::hs256{secret_})
        .leeway(5)) {
}

std::expected<OperatorIdentity, RelayError> TokenAdmissionGate::authenticate(std::string_view bearer) const {
    if (bearer.empty()) {
        return std::unexpected(RelayError::UNAUTHORIZED);
    }

    try {
        auto decoded = jwt::decode(std::string(bearer));
        verifier_.verify(decoded);

        if (!decoded.has_subject() || decoded.get_subject().empty()) {
            return std::unexpected(RelayError::UNAUTHORIZED);
        }

        OperatorIdentity identity;
        identity.subject = decoded.get_subject();
        if (decoded.has_payload_claim("role")) {
            identity.role = decoded.get_payload_claim("role").as_string();
        }
        if (decoded.has_payload_claim("email")) {
            identity.email = decoded.get_payload_claim("email").as_string();
        }
        identity.admin = identity.role == admin_role_;
        return identity;
    } catch (const std::exception& e) {
        NLOG_DEBUG(log::ADMISSION_LOGGER, "TokenAdmissionGate: Rejected token: {}", e.what());
        return std::unexpected(RelayError::UNAUTHORIZED);
    }
}

net::awaitable<std::expected<void, RelayError>>
TokenAdmissionGate::admit(const OperatorIdentity& requester, const ResourceDescriptor& target) {
    if (requester.is_admin()) {
        co_return std::expected<void, RelayError>{};
    }

    auto tags = co_await api_.resource_tags(target);
    if (!tags) {
        co_return std::unexpected(tags.error());
    }

    const auto owner_tag = owner_tag_prefix_ + requester.subject;
    if (std::find(tags->begin(), tags->end(), owner_tag) == tags->end()) {
        NLOG_WARN(log::ADMISSION_LOGGER, "TokenAdmissionGate: {} does not own {}",
                  requester.subject, target.to_string());
        co_return std::unexpected(RelayError::UNAUTHORIZED);
    }
    co_return std::expected<void, RelayError>{};
}

std::string TokenAdmissionGate::issue_token(const std::string& subject, const std::string& role,
                                            std::chrono::seconds ttl, const std::string& email) const {
    auto now_time = std::chrono::system_clock::now();

    auto builder = jwt::create()
        .set_type("JWT")
        .set_subject(subject)
        .set_issued_at(now_time)
        .set_expires_at(now_time + ttl)
        .set_payload_claim("role", jwt::claim(role));
    if (!email.empty()) {
        builder.set_payload_claim("email", jwt::claim(email));
    }
    return builder.sign(jwt::algorithm::hs256{secret_});
}

// ============================================================================
// OpenAdmissionGate
// ============================================================================

std::expected<OperatorIdentity, RelayError> OpenAdmissionGate::authenticate(std::string_view) const {
    OperatorIdentity identity;
    identity.subject = "anonymous";
    identity.role = "admin";
    identity.admin = true;
    return identity;
}

net::awaitable<std::expected<void, RelayError>>
OpenAdmissionGate::admit(const OperatorIdentity&, const ResourceDescriptor&) {
    co_return std::expected<void, RelayError>{};
}

// ============================================================================
// StaticAdmissionGate
// ============================================================================

StaticAdmissionGate::StaticAdmissionGate(Authenticator authenticator, Policy policy)
    : authenticator_(std::move(authenticator))
    , policy_(std::move(policy)) {}

std::expected<OperatorIdentity, RelayError> StaticAdmissionGate::authenticate(std::string_view bearer) const {
    if (!authenticator_) {
        return std::unexpected(RelayError::UNAUTHORIZED);
    }
    return authenticator_(bearer);
}

net::awaitable<std::expected<void, RelayError>>
StaticAdmissionGate::admit(const OperatorIdentity& requester, const ResourceDescriptor& target) {
    admit_calls_.fetch_add(1, std::memory_order_relaxed);
    if (policy_ && policy_(requester, target)) {
        co_return std::expected<void, RelayError>{};
    }
    co_return std::unexpected(RelayError::UNAUTHORIZED);
}

} // namespace shellrelay
