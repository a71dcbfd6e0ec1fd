#include "common/types.hpp"
#include <sodium.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace shellrelay {

namespace {

std::string to_lower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool is_node_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
}

} // anonymous namespace

std::expected<ResourceKind, RelayError> parse_resource_kind(std::string_view text) {
    auto lower = to_lower(text);
    if (lower == "vm" || lower == "qemu") return ResourceKind::Vm;
    if (lower == "ct" || lower == "lxc" || lower == "container") return ResourceKind::Container;
    return std::unexpected(RelayError::BAD_REQUEST);
}

std::string_view resource_kind_name(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Vm: return "vm";
        case ResourceKind::Container: return "container";
    }
    return "vm";
}

std::string_view resource_kind_path(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Vm: return "qemu";
        case ResourceKind::Container: return "lxc";
    }
    return "qemu";
}

std::expected<void, RelayError> ResourceDescriptor::validate() const {
    if (node.empty() || node.size() > 64) {
        return std::unexpected(RelayError::BAD_REQUEST);
    }
    if (!std::all_of(node.begin(), node.end(), is_node_char)) {
        return std::unexpected(RelayError::BAD_REQUEST);
    }
    if (resource_id == 0) {
        return std::unexpected(RelayError::BAD_REQUEST);
    }
    return {};
}

std::string ResourceDescriptor::to_string() const {
    std::string out(resource_kind_name(kind));
    out += ':';
    out += node;
    out += '/';
    out += std::to_string(resource_id);
    return out;
}

std::expected<ResourceId, RelayError> parse_resource_id(std::string_view text) {
    ResourceId value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return std::unexpected(RelayError::BAD_REQUEST);
    }
    return value;
}

std::expected<uint16_t, RelayError> parse_port(std::string_view text) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() ||
        value == 0 || value > 65535) {
        return std::unexpected(RelayError::BAD_REQUEST);
    }
    return static_cast<uint16_t>(value);
}

SessionId generate_session_id() {
    uint8_t bytes[16];
    randombytes_buf(bytes, sizeof(bytes));

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : bytes) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

int64_t to_unix_seconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace shellrelay
