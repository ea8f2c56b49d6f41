#pragma once

#include <optional>
#include <remit/schema/primitives.hpp>
#include <string>
#include <string_view>

namespace remit::encoding {

std::string to_hex(const remit::schema::bytes_view_t& bytes);
std::string to_upper_hex(const remit::schema::bytes_view_t& bytes);

/// Decode hex, accepting an optional 0x prefix and either case.
std::optional<remit::schema::bytes_t> try_from_hex(std::string_view hex);

}  // namespace remit::encoding
