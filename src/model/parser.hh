#pragma once

#include "core/status.hh"
#include "model/interface.hh"
#include <optional>
#include <string>
#include <string_view>

namespace suitegen {

// ============================================================================
// Interface Schema Parser
// ============================================================================

struct ParseResult {
    std::optional<InterfaceModel> model;
    Failure failure;

    [[nodiscard]] bool ok() const { return model.has_value(); }
};

// Parse a JSON interface schema. Both the native key names and the common
// Anchor IDL aliases are accepted (isMut/writable, pda/derivedAddress, ...).
[[nodiscard]] ParseResult parse_interface(std::string_view json_text);

// Read and parse a schema file. A missing or unreadable file is a PARSE_ERROR.
[[nodiscard]] ParseResult parse_interface_file(const std::string& path);

// Parse a primitive type name ("u64", "string", "pubkey", "bool", "bytes").
// Unknown names and floats map to DataKind::UNSUPPORTED; an empty name is nullopt.
[[nodiscard]] std::optional<DataType> parse_type_name(std::string_view text);

}  // namespace suitegen
