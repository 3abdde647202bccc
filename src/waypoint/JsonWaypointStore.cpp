#include "JsonWaypointStore.hpp"
#include "WaypointColors.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace claimpoints
{

namespace
{

json toJson(const Waypoint& wp)
{
    return json{ { "id", wp.id },       { "x", wp.x },         { "z", wp.z },           { "name", wp.label },
                 { "alias", wp.alias }, { "color", wp.color }, { "visible", wp.visible } };
}

/// Helper: Read a coordinate, rejecting values that do not fit in 32 bits
std::optional<std::int32_t> readCoordinate(const json& value)
{
    if (value.is_number_unsigned())
    {
        const auto v = value.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max()))
            return std::nullopt;
        return static_cast<std::int32_t>(v);
    }
    if (!value.is_number_integer())
        return std::nullopt;
    const auto v = value.get<std::int64_t>();
    if (v < std::numeric_limits<std::int32_t>::min() || v > std::numeric_limits<std::int32_t>::max())
        return std::nullopt;
    return static_cast<std::int32_t>(v);
}

/// Helper: Parse one waypoint entry. Entries without coordinates, or with a
/// field of the wrong type, are rejected as a whole.
std::optional<Waypoint> parseWaypoint(const json& entry)
{
    if (!entry.is_object() || !entry.contains("x") || !entry.contains("z"))
        return std::nullopt;

    auto x = readCoordinate(entry["x"]);
    auto z = readCoordinate(entry["z"]);
    if (!x || !z)
        return std::nullopt;

    auto wrong_type = [&entry](const char* key, bool (json::*check)() const noexcept) {
        return entry.contains(key) && !(entry[key].*check)();
    };
    if (wrong_type("id", &json::is_number_unsigned) || wrong_type("name", &json::is_string) ||
        wrong_type("alias", &json::is_string) || wrong_type("color", &json::is_number_integer) ||
        wrong_type("visible", &json::is_boolean))
        return std::nullopt;

    Waypoint wp;
    wp.id = entry.value("id", WaypointId{ 0 });
    wp.x = *x;
    wp.z = *z;
    wp.label = entry.value("name", std::string());
    wp.alias = entry.value("alias", std::string());
    wp.color = entry.value("color", 0);
    wp.visible = entry.value("visible", true);

    if (colorName(wp.color).empty())
        wp.color = 0;

    return wp;
}

} // namespace

JsonWaypointStore::JsonWaypointStore(std::string path)
    : path_(std::move(path))
{
}

bool JsonWaypointStore::load()
{
    waypoints_.clear();
    next_id_ = 1;
    dirty_ = false;
    read_only_ = false;
    last_error_.clear();

    if (path_.empty())
        return true;

    std::ifstream file(path_);
    if (!file.is_open())
    {
        PLOG_INFO << "JsonWaypointStore: No waypoint file at " << path_ << ", starting empty";
        return true;
    }

    try
    {
        json root = json::parse(file);
        std::size_t skipped = 0;
        WaypointId max_id = 0;

        if (root.contains("waypoints") && root["waypoints"].is_array())
        {
            for (const auto& entry : root["waypoints"])
            {
                auto wp = parseWaypoint(entry);
                if (!wp)
                {
                    ++skipped;
                    continue;
                }
                waypoints_.push_back(std::move(*wp));
                max_id = std::max(max_id, waypoints_.back().id);
            }
        }

        next_id_ = std::max<WaypointId>(root.value("next_id", WaypointId{ 1 }), max_id + 1);

        // Entries written without an id get fresh ones.
        for (auto& wp : waypoints_)
        {
            if (wp.id == 0)
            {
                wp.id = next_id_++;
                dirty_ = true;
            }
        }

        PLOG_INFO << "JsonWaypointStore: Loaded " << waypoints_.size() << " waypoints from " << path_;
        if (skipped > 0)
        {
            PLOG_WARNING << "JsonWaypointStore: Skipped " << skipped << " malformed entries";
        }
        return true;
    }
    catch (const json::exception& e)
    {
        last_error_ = std::string("waypoint file parse error: ") + e.what();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Waypoints, "Waypoint file could not be read",
                                          last_error_ + "\nFile: " + path_);
        waypoints_.clear();
        next_id_ = 1;
        read_only_ = true;
        return false;
    }
}

bool JsonWaypointStore::save()
{
    last_error_.clear();
    if (path_.empty())
    {
        dirty_ = false;
        return true;
    }
    if (read_only_)
    {
        // The file on disk holds waypoints this store could not read.
        last_error_ = "Not saving over unreadable waypoint file " + path_;
        return false;
    }

    json root;
    root["next_id"] = next_id_;
    root["waypoints"] = json::array();
    for (const auto& wp : waypoints_)
    {
        root["waypoints"].push_back(toJson(wp));
    }

    std::error_code ec;
    const fs::path target(path_);
    if (target.has_parent_path())
    {
        fs::create_directories(target.parent_path(), ec);
        if (ec)
        {
            last_error_ = "Failed to create directory: " + ec.message();
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Waypoints, "Failed to save waypoints",
                                              last_error_);
            return false;
        }
    }

    std::string tmp = path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "Failed to open temp file for writing";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Waypoints, "Failed to save waypoints",
                                              "Could not create temporary file for writing: " + tmp);
            return false;
        }
        try
        {
            ofs << root.dump(2) << '\n';
        }
        catch (const json::exception& e)
        {
            ofs.close();
            fs::remove(tmp, ec);
            last_error_ = std::string("waypoint serialization error: ") + e.what();
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Waypoints, "Failed to save waypoints",
                                              last_error_);
            return false;
        }
        ofs.flush();
        if (!ofs)
        {
            last_error_ = "Failed to write temp file";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Waypoints, "Failed to save waypoints",
                                              "Write to temporary file failed: " + tmp);
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec)
    {
        last_error_ = std::string("Failed to rename: ") + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Waypoints, "Failed to save waypoints",
                                          "Could not rename temporary file: " + ec.message());
        return false;
    }

    dirty_ = false;
    PLOG_DEBUG << "JsonWaypointStore: Saved " << waypoints_.size() << " waypoints to " << path_;
    return true;
}

WaypointId JsonWaypointStore::create(std::int32_t x, std::int32_t z, const std::string& label,
                                     const std::string& alias, int color)
{
    Waypoint wp;
    wp.id = next_id_++;
    wp.x = x;
    wp.z = z;
    wp.label = label;
    wp.alias = alias;
    wp.color = color;
    waypoints_.push_back(std::move(wp));
    dirty_ = true;
    return waypoints_.back().id;
}

bool JsonWaypointStore::remove(WaypointId id)
{
    auto it = std::find_if(waypoints_.begin(), waypoints_.end(), [id](const Waypoint& wp) { return wp.id == id; });
    if (it == waypoints_.end())
        return false;
    waypoints_.erase(it);
    dirty_ = true;
    return true;
}

bool JsonWaypointStore::relabel(WaypointId id, const std::string& label)
{
    Waypoint* wp = find(id);
    if (!wp)
        return false;
    wp->label = label;
    dirty_ = true;
    return true;
}

bool JsonWaypointStore::setVisible(WaypointId id, bool visible)
{
    Waypoint* wp = find(id);
    if (!wp)
        return false;
    wp->visible = visible;
    dirty_ = true;
    return true;
}

bool JsonWaypointStore::setAlias(WaypointId id, const std::string& alias)
{
    Waypoint* wp = find(id);
    if (!wp)
        return false;
    wp->alias = alias;
    dirty_ = true;
    return true;
}

bool JsonWaypointStore::setColor(WaypointId id, int color)
{
    Waypoint* wp = find(id);
    if (!wp)
        return false;
    wp->color = color;
    dirty_ = true;
    return true;
}

Waypoint* JsonWaypointStore::find(WaypointId id)
{
    auto it = std::find_if(waypoints_.begin(), waypoints_.end(), [id](const Waypoint& wp) { return wp.id == id; });
    return it == waypoints_.end() ? nullptr : &*it;
}

} // namespace claimpoints
