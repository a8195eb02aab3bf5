// config.cpp - destination registry loading with jsoncpp

#include "arkv/config.hpp"
#include "arkv/log.hpp"

#include <json/json.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>

namespace arkv
{

    namespace
    {

        [[nodiscard]] auto required_string(Json::Value const &object, char const *key) -> std::optional<std::string>
        {
            auto const &value = object[key];
            if (!value.isString() || value.asString().empty())
            {
                return std::nullopt;
            }
            return value.asString();
        }

        [[nodiscard]] auto parse_destination(Json::Value const &node, std::size_t const position)
            -> result<destination_entry>
        {
            if (!node.isObject())
            {
                log::get()->error("destination #{} is not an object", position);
                return std::unexpected{error_code::config_invalid};
            }

            destination_entry entry;

            auto name = required_string(node, "name");
            auto host = required_string(node, "host");
            auto username = required_string(node, "username");
            auto remote_path = required_string(node, "remote_path");
            if (!name || !host || !username || !remote_path)
            {
                log::get()->error("destination #{} needs name, host, username and remote_path", position);
                return std::unexpected{error_code::config_invalid};
            }
            entry.name = std::move(*name);
            entry.host = std::move(*host);
            entry.username = std::move(*username);
            entry.remote_path = std::move(*remote_path);

            if (node.isMember("port"))
            {
                auto const &port = node["port"];
                if (!port.isIntegral() || port.asInt64() < 1 || port.asInt64() > 65535)
                {
                    log::get()->error("destination '{}' has an invalid port", entry.name);
                    return std::unexpected{error_code::config_invalid};
                }
                entry.port = static_cast<std::uint16_t>(port.asUInt());
            }

            if (node.isMember("password") && !node["password"].isNull())
            {
                if (!node["password"].isString())
                {
                    log::get()->error("destination '{}' has a non-string password", entry.name);
                    return std::unexpected{error_code::config_invalid};
                }
                entry.password = node["password"].asString();
            }

            return entry;
        }

    } // namespace

    auto app_config::find(std::string_view const name) const noexcept -> destination_entry const *
    {
        auto const it = std::find_if(destinations.begin(), destinations.end(),
                                     [name](destination_entry const &d) { return d.name == name; });
        return it == destinations.end() ? nullptr : &*it;
    }

    auto default_config_path() -> result<std::filesystem::path>
    {
        auto const *home = std::getenv("HOME");
        if (home == nullptr || *home == '\0')
        {
            return std::unexpected{error_code::config_unreadable};
        }
        return std::filesystem::path{home} / ".config" / "arkv" / "config.json";
    }

    auto expand_home(std::filesystem::path const &path) -> std::filesystem::path
    {
        auto const text = path.string();
        if (text.empty() || text.front() != '~' || (text.size() > 1 && text[1] != '/'))
        {
            return path;
        }

        auto const *home = std::getenv("HOME");
        if (home == nullptr || *home == '\0')
        {
            return path;
        }
        return std::filesystem::path{home + text.substr(1)};
    }

    auto parse_config(std::string_view const json) -> result<app_config>
    {
        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        std::unique_ptr<Json::CharReader> const reader{builder.newCharReader()};

        Json::Value root;
        std::string errors;
        if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors))
        {
            log::get()->error("config is not valid JSON: {}", errors);
            return std::unexpected{error_code::config_invalid};
        }
        if (!root.isObject())
        {
            return std::unexpected{error_code::config_invalid};
        }

        app_config config;

        if (root.isMember("ssh_key_path"))
        {
            if (!root["ssh_key_path"].isString())
            {
                return std::unexpected{error_code::config_invalid};
            }
            config.ssh_key_path = expand_home(root["ssh_key_path"].asString());
        }

        auto const &destinations = root["destinations"];
        if (!destinations.isNull() && !destinations.isArray())
        {
            return std::unexpected{error_code::config_invalid};
        }

        for (Json::ArrayIndex i = 0; i < destinations.size(); ++i)
        {
            auto entry = parse_destination(destinations[i], i);
            if (!entry.has_value())
            {
                return std::unexpected{entry.error()};
            }
            if (config.find(entry->name) != nullptr)
            {
                log::get()->error("destination '{}' is defined twice", entry->name);
                return std::unexpected{error_code::config_invalid};
            }
            config.destinations.push_back(std::move(*entry));
        }

        return config;
    }

    auto load_config(std::filesystem::path const &path) -> result<std::optional<app_config>>
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            if (ec)
            {
                return std::unexpected{error_code::config_unreadable};
            }
            return std::optional<app_config>{};
        }
        if (std::filesystem::is_directory(path, ec))
        {
            return std::unexpected{error_code::config_unreadable};
        }

        std::ifstream file{path};
        if (!file)
        {
            return std::unexpected{error_code::config_unreadable};
        }

        std::ostringstream content;
        content << file.rdbuf();
        if (file.bad())
        {
            return std::unexpected{error_code::config_unreadable};
        }

        auto config = parse_config(content.str());
        if (!config.has_value())
        {
            return std::unexpected{config.error()};
        }
        return std::optional<app_config>{std::move(*config)};
    }

    auto resolve_destination(app_config const &config, destination_entry const &entry) -> destination_context
    {
        destination_context ctx;
        ctx.name = entry.name;
        ctx.host = entry.host;
        ctx.port = entry.port;
        ctx.username = entry.username;
        ctx.remote_base = entry.remote_path;
        if (entry.password.has_value())
        {
            ctx.auth = password_auth{*entry.password};
        }
        else
        {
            ctx.auth = key_auth{config.ssh_key_path, {}};
        }
        return ctx;
    }

    auto select_destinations(app_config const &config, std::vector<std::string> const &names)
        -> result<std::vector<destination_context>>
    {
        std::vector<destination_context> selected;

        if (names.empty())
        {
            for (auto const &entry : config.destinations)
            {
                selected.push_back(resolve_destination(config, entry));
            }
            return selected;
        }

        for (auto const &name : names)
        {
            auto const *entry = config.find(name);
            if (entry == nullptr)
            {
                log::get()->error("unknown destination '{}'", name);
                return std::unexpected{error_code::destination_unknown};
            }
            selected.push_back(resolve_destination(config, *entry));
        }
        return selected;
    }

} // namespace arkv
