#include "approf/profile_json.hpp"

#include <algorithm>  // for find
#include <array>      // for array
#include <cstdint>    // for int32_t, uint32_t
#include <utility>    // for pair

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using MiscFlag = bool approf::Profile::*;

// "disable" is the document name of freeze
constexpr std::array<std::pair<std::string_view, MiscFlag>, 6> MISC_FLAGS{{
    {"disable"sv, &approf::Profile::freeze},
    {"force_stop"sv, &approf::Profile::force_stop},
    {"clear_cache"sv, &approf::Profile::clear_cache},
    {"clear_data"sv, &approf::Profile::clear_data},
    {"block_trackers"sv, &approf::Profile::block_trackers},
    {"save_apk"sv, &approf::Profile::save_apk},
}};

auto parse_string_array(const rapidjson::Value& doc, const char* key) noexcept
    -> std::expected<std::optional<std::vector<std::string>>, std::string> {
    if (!doc.HasMember(key)) {
        return std::nullopt;
    }
    if (!doc[key].IsArray()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be an array"), key));
    }

    std::vector<std::string> values{};
    for (const auto& value : doc[key].GetArray()) {
        if (!value.IsString()) {
            return std::unexpected(fmt::format(FMT_COMPILE("'{}' must only contain strings"), key));
        }
        values.emplace_back(value.GetString(), value.GetStringLength());
    }
    return values;
}

auto parse_int_array(const rapidjson::Value& doc, const char* key) noexcept
    -> std::expected<std::optional<std::vector<std::int32_t>>, std::string> {
    if (!doc.HasMember(key)) {
        return std::nullopt;
    }
    if (!doc[key].IsArray()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be an array"), key));
    }

    std::vector<std::int32_t> values{};
    for (const auto& value : doc[key].GetArray()) {
        if (!value.IsInt()) {
            return std::unexpected(fmt::format(FMT_COMPILE("'{}' must only contain integers"), key));
        }
        values.push_back(value.GetInt());
    }
    return values;
}

template <typename Writer>
void write_string_array(Writer& writer, const char* key, const std::vector<std::string>& values) {
    writer.Key(key);
    writer.StartArray();
    for (const auto& value : values) {
        writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
    }
    writer.EndArray();
}

template <typename Writer>
void write_int_array(Writer& writer, const char* key, const std::vector<std::int32_t>& values) {
    writer.Key(key);
    writer.StartArray();
    for (const auto value : values) {
        writer.Int(value);
    }
    writer.EndArray();
}

}  // namespace

namespace approf {

auto parse_profile(std::string_view json_content, std::string_view fallback_id) noexcept
    -> std::expected<Profile, std::string> {
    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}: {}"),
            doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    Profile profile{};

    // Parse name (required)
    if (!doc.HasMember("name") || !doc["name"].IsString()) {
        return std::unexpected("'name' field is required and must be a string");
    }
    profile.name = doc["name"].GetString();

    // Parse id (optional, falls back to the file name)
    if (doc.HasMember("id")) {
        if (!doc["id"].IsString()) {
            return std::unexpected("'id' must be a string");
        }
        profile.profile_id = doc["id"].GetString();
    } else {
        profile.profile_id = fallback_id;
    }

    if (doc.HasMember("type")) {
        if (!doc["type"].IsInt()) {
            return std::unexpected("'type' must be an integer");
        }
        profile.type = doc["type"].GetInt();
    }
    if (doc.HasMember("version")) {
        if (!doc["version"].IsInt()) {
            return std::unexpected("'version' must be an integer");
        }
        profile.version = doc["version"].GetInt();
    }
    if (doc.HasMember("allow_routine")) {
        if (!doc["allow_routine"].IsBool()) {
            return std::unexpected("'allow_routine' must be a boolean");
        }
        profile.allow_routine = doc["allow_routine"].GetBool();
    }
    if (doc.HasMember("comment")) {
        if (!doc["comment"].IsString()) {
            return std::unexpected("'comment' must be a string");
        }
        profile.comment = doc["comment"].GetString();
    }

    // Parse state (optional, any value is kept)
    if (doc.HasMember("state")) {
        if (!doc["state"].IsString()) {
            return std::unexpected("'state' must be a string");
        }
        profile.state = doc["state"].GetString();
    }

    // Parse packages (required)
    auto packages = parse_string_array(doc, "packages");
    if (!packages) {
        return std::unexpected(packages.error());
    }
    if (!packages->has_value()) {
        return std::unexpected("'packages' field is required and must be an array");
    }
    profile.packages = std::move(**packages);

    auto users = parse_int_array(doc, "users");
    if (!users) {
        return std::unexpected(users.error());
    }
    profile.users = std::move(*users);

    auto components = parse_string_array(doc, "components");
    if (!components) {
        return std::unexpected(components.error());
    }
    profile.components = std::move(*components);

    auto app_ops = parse_int_array(doc, "app_ops");
    if (!app_ops) {
        return std::unexpected(app_ops.error());
    }
    profile.app_ops = std::move(*app_ops);

    auto permissions = parse_string_array(doc, "permissions");
    if (!permissions) {
        return std::unexpected(permissions.error());
    }
    profile.permissions = std::move(*permissions);

    if (doc.HasMember("export_rules")) {
        if (!doc["export_rules"].IsInt()) {
            return std::unexpected("'export_rules' must be an integer");
        }
        profile.export_rules = doc["export_rules"].GetInt();
    }

    // Parse backup_data (optional)
    if (doc.HasMember("backup_data")) {
        const auto& backup_value = doc["backup_data"];
        if (!backup_value.IsObject()) {
            return std::unexpected("'backup_data' must be an object");
        }
        if (!backup_value.HasMember("flags") || !backup_value["flags"].IsUint()) {
            return std::unexpected("Backup 'flags' is required and must be a non-negative integer");
        }

        BackupInfo backup_info{.flags = backup_value["flags"].GetUint()};
        if (backup_value.HasMember("name")) {
            if (!backup_value["name"].IsString()) {
                return std::unexpected("Backup 'name' must be a string");
            }
            backup_info.name = backup_value["name"].GetString();
        }
        profile.backup_data = std::move(backup_info);
    }

    // Parse misc toggles (optional)
    auto misc = parse_string_array(doc, "misc");
    if (!misc) {
        return std::unexpected(misc.error());
    }
    if (misc->has_value()) {
        for (const auto& misc_name : **misc) {
            const auto misc_flag = std::ranges::find(MISC_FLAGS, std::string_view{misc_name}, &std::pair<std::string_view, MiscFlag>::first);
            if (misc_flag == MISC_FLAGS.end()) {
                spdlog::warn("[PROFILE] '{}': ignoring unknown misc entry '{}'", profile.name, misc_name);
                continue;
            }
            profile.*(misc_flag->second) = true;
        }
    }

    return profile;
}

auto serialize_profile(const Profile& profile) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();
    writer.Key("id");
    writer.String(profile.profile_id.c_str());
    writer.Key("name");
    writer.String(profile.name.c_str());
    writer.Key("type");
    writer.Int(profile.type);
    writer.Key("version");
    writer.Int(profile.version);
    writer.Key("allow_routine");
    writer.Bool(profile.allow_routine);
    writer.Key("state");
    writer.String(profile.state.c_str());
    if (profile.users) {
        write_int_array(writer, "users", *profile.users);
    }
    if (profile.comment) {
        writer.Key("comment");
        writer.String(profile.comment->c_str());
    }
    write_string_array(writer, "packages", profile.packages);
    if (profile.components) {
        write_string_array(writer, "components", *profile.components);
    }
    if (profile.app_ops) {
        write_int_array(writer, "app_ops", *profile.app_ops);
    }
    if (profile.permissions) {
        write_string_array(writer, "permissions", *profile.permissions);
    }
    if (profile.backup_data) {
        writer.Key("backup_data");
        writer.StartObject();
        writer.Key("flags");
        writer.Uint(profile.backup_data->flags);
        if (profile.backup_data->name) {
            writer.Key("name");
            writer.String(profile.backup_data->name->c_str());
        }
        writer.EndObject();
    }
    if (profile.export_rules) {
        writer.Key("export_rules");
        writer.Int(*profile.export_rules);
    }

    std::vector<std::string> misc{};
    for (const auto& [misc_name, misc_flag] : MISC_FLAGS) {
        if (profile.*misc_flag) {
            misc.emplace_back(misc_name);
        }
    }
    if (!misc.empty()) {
        write_string_array(writer, "misc", misc);
    }
    writer.EndObject();

    return std::string{buffer.GetString(), buffer.GetSize()};
}

}  // namespace approf
