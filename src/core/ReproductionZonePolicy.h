#pragma once

#include "Vector2.h"

#include <optional>
#include <string>
#include <vector>

namespace EvoSim {

struct ZoneValidationRequest {
    Vector2i parentA;
    Vector2i parentB;
    std::optional<Vector2i> spawn;
};

struct ZoneDecision {
    bool allowed = true;
    std::string reason;
};

/**
 * Restricts where pairs may mate and where offspring may appear.
 */
class ReproductionZonePolicy {
public:
    virtual ~ReproductionZonePolicy() = default;

    virtual bool hasActiveZones() const = 0;

    virtual ZoneDecision validateArea(const ZoneValidationRequest& request) const = 0;

    /**
     * @brief Keep the candidates inside the active zones.
     * A non-empty list is never filtered down to nothing; the input is returned instead.
     */
    virtual std::vector<Vector2i> filterSpawnCandidates(
        const std::vector<Vector2i>& candidates) const = 0;
};

class AllowAllZonePolicy : public ReproductionZonePolicy {
public:
    bool hasActiveZones() const override { return false; }
    ZoneDecision validateArea(const ZoneValidationRequest& request) const override;
    std::vector<Vector2i> filterSpawnCandidates(
        const std::vector<Vector2i>& candidates) const override;
};

// Inclusive-exclusive rectangle in grid coordinates; x/width are columns.
struct ZoneRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool contains(const Vector2i& pos) const
    {
        return pos.x >= x && pos.x < x + width && pos.y >= y && pos.y < y + height;
    }
};

/**
 * Confines mating and spawning to a set of rectangles. With no rectangles every request is
 * allowed.
 */
class RectZonePolicy : public ReproductionZonePolicy {
public:
    void addZone(const ZoneRect& zone);
    void clearZones();
    const std::vector<ZoneRect>& getZones() const { return zones_; }

    bool isInActiveZone(const Vector2i& pos) const;

    bool hasActiveZones() const override { return !zones_.empty(); }
    ZoneDecision validateArea(const ZoneValidationRequest& request) const override;
    std::vector<Vector2i> filterSpawnCandidates(
        const std::vector<Vector2i>& candidates) const override;

private:
    std::vector<ZoneRect> zones_;
};

} // namespace EvoSim
