#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

#include "config/network.hpp"

namespace x1memo::config {

enum class RpcSelection {
  kDefault,
  kCustom,
};

// Per-network user preferences. The client reads them; it never writes them.
struct UserSettings {
  RpcSelection rpc_selection{RpcSelection::kDefault};
  std::string custom_rpc_url;
  // Percentage added on top of simulated compute units, capped at 100.
  std::uint32_t compute_unit_buffer_percentage{1};
  // 0 disables the priority fee instruction.
  std::uint64_t compute_unit_price_micro_lamports{0};

  // Trimmed custom URL when the custom endpoint is selected and non-empty.
  std::optional<std::string> CustomRpcEndpoint() const;
  double CuBufferMultiplier() const;
  std::optional<std::uint64_t> CuPriceMicroLamports() const;
};

nlohmann::json SettingsToJson(const UserSettings& settings);
// Missing keys keep their defaults. Throws nlohmann::json::exception on
// wrongly typed values and std::runtime_error on unknown rpc_selection.
UserSettings SettingsFromJson(const nlohmann::json& value);

// The settings file holds one object per network keyed by NetworkName().
// Returns nullopt when the file or the network entry is absent.
std::optional<UserSettings> LoadUserSettings(const std::filesystem::path& path,
                                             NetworkType network);
// Replaces the entry for |network|, keeping the other networks' entries.
// Throws std::runtime_error on I/O failure.
void SaveUserSettings(const std::filesystem::path& path, NetworkType network,
                      const UserSettings& settings);

}  // namespace x1memo::config
