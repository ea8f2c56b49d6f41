#pragma once

#include <filesystem>
#include <optional>
#include <remit/schema/transaction_receipt.hpp>
#include <remit/v1/report.pb.h>
#include <string>
#include <string_view>

namespace remit::execution {

remit::v1::TransferReport make_report(
    const remit::schema::transaction_receipt_t& receipt);

/// Single-line JSON `{"code":..,"height":..,"tx_hash":..}` with numeric code
/// and height. Zero values are printed. Fails for a negative height or one
/// above 2^53.
std::optional<std::string> render_report(
    const remit::schema::transaction_receipt_t& receipt,
    std::string& error);

bool write_report(const std::filesystem::path& path,
                  std::string_view json,
                  std::string& error);

}  // namespace remit::execution
