#pragma once

#include "common/errors.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace shellrelay {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Hypervisor resource identifier (Proxmox VMID)
using ResourceId = uint32_t;

// Opaque session identifier, 32 lowercase hex characters
using SessionId = std::string;

// ============================================================================
// Resource Kind
// ============================================================================
enum class ResourceKind : uint8_t {
    Vm,
    Container,
};

// Accepts vm/qemu and ct/lxc/container, case-insensitive
std::expected<ResourceKind, RelayError> parse_resource_kind(std::string_view text);

// "vm" / "container"
std::string_view resource_kind_name(ResourceKind kind);

// Hypervisor API path segment: "qemu" / "lxc"
std::string_view resource_kind_path(ResourceKind kind);

// ============================================================================
// Resource Descriptor
// ============================================================================
struct ResourceDescriptor {
    std::string node;
    ResourceKind kind{ResourceKind::Vm};
    ResourceId resource_id{0};

    // Structural validation only; authorization is the admission gate's job
    std::expected<void, RelayError> validate() const;

    // "vm:n1/101"
    std::string to_string() const;

    bool operator==(const ResourceDescriptor&) const = default;
};

// Parses a decimal VMID; rejects empty, signs, overflow and zero
std::expected<ResourceId, RelayError> parse_resource_id(std::string_view text);

// Parses a TCP port in 1..65535
std::expected<uint16_t, RelayError> parse_port(std::string_view text);

// ============================================================================
// Operator Identity
// ============================================================================
struct OperatorIdentity {
    std::string subject;
    std::string role;
    std::string email;
    bool admin{false};

    bool is_admin() const { return admin; }
};

// ============================================================================
// Console Ticket
// ============================================================================
// Immutable once minted; valid for exactly one upstream connection attempt
struct ConsoleTicket {
    std::string value;
    uint16_t target_port{0};
    ResourceDescriptor issued_for;
    std::string issued_to;      // operator subject
    std::string upstream_user;  // hypervisor user the ticket belongs to (termproxy login)
    TimePoint issued_at{};
    TimePoint expires_at{};

    bool is_expired(TimePoint now = Clock::now()) const { return now >= expires_at; }
};

// Fresh random session id (libsodium CSPRNG)
SessionId generate_session_id();

// Seconds since the Unix epoch
int64_t to_unix_seconds(TimePoint tp);

} // namespace shellrelay
