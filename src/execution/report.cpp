#include <google/protobuf/util/json_util.h>
#include <fstream>
#include <remit/execution/report.hpp>

using namespace remit::schema;

namespace remit::execution {

namespace {

// Largest integer a JSON number (IEEE double) holds exactly.
constexpr auto kMaxExactHeight = int64_t{1} << 53;

}  // namespace

remit::v1::TransferReport make_report(const transaction_receipt_t& receipt) {
  auto report = remit::v1::TransferReport{};
  report.set_code(receipt.code);
  report.set_height(static_cast<double>(receipt.height));
  report.set_tx_hash(receipt.tx_hash);
  return report;
}

std::optional<std::string> render_report(const transaction_receipt_t& receipt,
                                         std::string& error) {
  if (receipt.height < 0 || receipt.height > kMaxExactHeight) {
    error = "cannot render report: height " + std::to_string(receipt.height) +
            " is outside the exact JSON number range";
    return std::nullopt;
  }

  auto options = google::protobuf::util::JsonPrintOptions{};
  options.add_whitespace = false;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;

  auto json = std::string{};
  auto status = google::protobuf::util::MessageToJsonString(
      make_report(receipt), &json, options);
  if (!status.ok()) {
    error = "cannot render report: " + status.ToString();
    return std::nullopt;
  }
  return json;
}

bool write_report(const std::filesystem::path& path,
                  const std::string_view json,
                  std::string& error) {
  auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
  if (!out.is_open()) {
    error = "cannot open report file '" + path.string() + "'";
    return false;
  }
  out << json << '\n';
  out.flush();
  if (!out.good()) {
    error = "failed writing report file '" + path.string() + "'";
    return false;
  }
  return true;
}

}  // namespace remit::execution
