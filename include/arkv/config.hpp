// config.hpp - the destination registry (~/.config/arkv/config.json)
//
// {
//   "ssh_key_path": "~/.ssh/id_ed25519",
//   "destinations": [
//     { "name": "nas", "host": "10.0.0.2", "port": 22, "username": "me",
//       "remote_path": "/volume1/backups", "password": "optional" }
//   ]
// }

#pragma once

#include "common.hpp"
#include "destination.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arkv
{

    struct destination_entry
    {
        std::string name;
        std::string host;
        std::uint16_t port{constants::default_ssh_port};
        std::string username;
        std::string remote_path;
        std::optional<std::string> password; // key auth when absent
    };

    struct app_config
    {
        std::filesystem::path ssh_key_path;
        std::vector<destination_entry> destinations;

        [[nodiscard]] auto find(std::string_view name) const noexcept -> destination_entry const *;
    };

    // $HOME/.config/arkv/config.json
    [[nodiscard]] auto default_config_path() -> result<std::filesystem::path>;

    // "~" and "~/..." expand to $HOME
    [[nodiscard]] auto expand_home(std::filesystem::path const &path) -> std::filesystem::path;

    [[nodiscard]] auto parse_config(std::string_view json) -> result<app_config>;

    // nullopt when the file does not exist
    [[nodiscard]] auto load_config(std::filesystem::path const &path) -> result<std::optional<app_config>>;

    [[nodiscard]] auto resolve_destination(app_config const &config, destination_entry const &entry)
        -> destination_context;

    // every destination when names is empty; destination_unknown for a name not in the registry
    [[nodiscard]] auto select_destinations(app_config const &config, std::vector<std::string> const &names)
        -> result<std::vector<destination_context>>;

} // namespace arkv
