#include "config/settings.hpp"

#include <algorithm>
#include <stdexcept>

#include "util/atomic_file.hpp"

namespace x1memo::config {

namespace {

std::string Trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

}  // namespace

std::optional<std::string> UserSettings::CustomRpcEndpoint() const {
  if (rpc_selection != RpcSelection::kCustom) {
    return std::nullopt;
  }
  auto trimmed = Trim(custom_rpc_url);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

double UserSettings::CuBufferMultiplier() const {
  if (compute_unit_buffer_percentage == 0) {
    return 1.0;
  }
  const auto percent = std::min<std::uint32_t>(compute_unit_buffer_percentage, 100);
  return 1.0 + static_cast<double>(percent) / 100.0;
}

std::optional<std::uint64_t> UserSettings::CuPriceMicroLamports() const {
  if (compute_unit_price_micro_lamports == 0) {
    return std::nullopt;
  }
  return compute_unit_price_micro_lamports;
}

nlohmann::json SettingsToJson(const UserSettings& settings) {
  nlohmann::json value;
  value["rpc_selection"] = settings.rpc_selection == RpcSelection::kCustom ? "Custom" : "Default";
  value["custom_rpc_url"] = settings.custom_rpc_url;
  value["compute_unit_buffer_percentage"] = settings.compute_unit_buffer_percentage;
  value["compute_unit_price_micro_lamports"] = settings.compute_unit_price_micro_lamports;
  return value;
}

UserSettings SettingsFromJson(const nlohmann::json& value) {
  UserSettings settings;
  if (!value.is_object()) {
    throw std::runtime_error("settings entry must be a JSON object");
  }
  if (value.contains("rpc_selection")) {
    const auto selection = value.at("rpc_selection").get<std::string>();
    if (selection == "Default") {
      settings.rpc_selection = RpcSelection::kDefault;
    } else if (selection == "Custom") {
      settings.rpc_selection = RpcSelection::kCustom;
    } else {
      throw std::runtime_error("unknown rpc_selection '" + selection + "'");
    }
  }
  if (value.contains("custom_rpc_url")) {
    settings.custom_rpc_url = value.at("custom_rpc_url").get<std::string>();
  }
  if (value.contains("compute_unit_buffer_percentage")) {
    settings.compute_unit_buffer_percentage =
        value.at("compute_unit_buffer_percentage").get<std::uint32_t>();
  }
  if (value.contains("compute_unit_price_micro_lamports")) {
    settings.compute_unit_price_micro_lamports =
        value.at("compute_unit_price_micro_lamports").get<std::uint64_t>();
  }
  return settings;
}

std::optional<UserSettings> LoadUserSettings(const std::filesystem::path& path,
                                             NetworkType network) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  std::string text;
  std::string error;
  if (!util::ReadTextFile(path, &text, &error)) {
    throw std::runtime_error("failed to load settings: " + error);
  }
  const auto document = nlohmann::json::parse(text);
  const std::string key(NetworkName(network));
  if (!document.is_object() || !document.contains(key)) {
    return std::nullopt;
  }
  return SettingsFromJson(document.at(key));
}

void SaveUserSettings(const std::filesystem::path& path, NetworkType network,
                      const UserSettings& settings) {
  nlohmann::json document = nlohmann::json::object();
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    std::string text;
    std::string error;
    if (!util::ReadTextFile(path, &text, &error)) {
      throw std::runtime_error("failed to read settings: " + error);
    }
    document = nlohmann::json::parse(text);
    if (!document.is_object()) {
      throw std::runtime_error("settings file " + path.string() + " is not a JSON object");
    }
  }
  document[std::string(NetworkName(network))] = SettingsToJson(settings);
  std::string error;
  if (!util::AtomicWriteText(path, document.dump(2) + "\n", &error)) {
    throw std::runtime_error("failed to save settings: " + error);
  }
}

}  // namespace x1memo::config
