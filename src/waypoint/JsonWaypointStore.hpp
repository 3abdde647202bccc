#pragma once

#include "IWaypointStore.hpp"

#include <string>
#include <vector>

namespace claimpoints
{

/// In-memory waypoint store, optionally backed by a JSON file.
/// Changes stay in memory until save() is called.
class JsonWaypointStore : public IWaypointStore
{
public:
    JsonWaypointStore() = default;
    explicit JsonWaypointStore(std::string path);
    ~JsonWaypointStore() override = default;

    /// Load the backing file. A missing file is an empty store, and malformed
    /// entries are skipped. Returns false on read or parse errors (logged to
    /// plog); the store is then left empty and read-only until the next
    /// successful load().
    bool load();

    /// Write to a temp file next to the target, then rename over it.
    /// Refused while the store is read-only.
    bool save();

    bool dirty() const { return dirty_; }
    bool readOnly() const { return read_only_; }
    const std::string& path() const { return path_; }
    const std::string& lastError() const { return last_error_; }

    std::vector<Waypoint> list() const override { return waypoints_; }
    WaypointId create(std::int32_t x, std::int32_t z, const std::string& label, const std::string& alias,
                      int color) override;
    bool remove(WaypointId id) override;
    bool relabel(WaypointId id, const std::string& label) override;
    bool setVisible(WaypointId id, bool visible) override;
    bool setAlias(WaypointId id, const std::string& alias) override;
    bool setColor(WaypointId id, int color) override;
    std::size_t count() const override { return waypoints_.size(); }

private:
    Waypoint* find(WaypointId id);

    std::string path_;
    std::string last_error_;
    std::vector<Waypoint> waypoints_;
    WaypointId next_id_ = 1;
    bool dirty_ = false;
    bool read_only_ = false;
};

} // namespace claimpoints
