#include "ReproductionZonePolicy.h"

#include <algorithm>
#include <iterator>

namespace EvoSim {

ZoneDecision AllowAllZonePolicy::validateArea(const ZoneValidationRequest& /*request*/) const
{
    return ZoneDecision{};
}

std::vector<Vector2i> AllowAllZonePolicy::filterSpawnCandidates(
    const std::vector<Vector2i>& candidates) const
{
    return candidates;
}

void RectZonePolicy::addZone(const ZoneRect& zone)
{
    if (zone.width <= 0 || zone.height <= 0) {
        return;
    }
    zones_.push_back(zone);
}

void RectZonePolicy::clearZones()
{
    zones_.clear();
}

bool RectZonePolicy::isInActiveZone(const Vector2i& pos) const
{
    return std::any_of(
        zones_.begin(), zones_.end(), [&pos](const ZoneRect& zone) { return zone.contains(pos); });
}

ZoneDecision RectZonePolicy::validateArea(const ZoneValidationRequest& request) const
{
    if (zones_.empty()) {
        return ZoneDecision{};
    }

    if (!isInActiveZone(request.parentA)) {
        return { false, "parent A outside reproduction zones" };
    }
    if (!isInActiveZone(request.parentB)) {
        return { false, "parent B outside reproduction zones" };
    }
    if (request.spawn && !isInActiveZone(*request.spawn)) {
        return { false, "spawn site outside reproduction zones" };
    }
    return ZoneDecision{};
}

std::vector<Vector2i> RectZonePolicy::filterSpawnCandidates(
    const std::vector<Vector2i>& candidates) const
{
    if (candidates.empty() || zones_.empty()) {
        return candidates;
    }

    std::vector<Vector2i> filtered;
    filtered.reserve(candidates.size());
    std::copy_if(
        candidates.begin(),
        candidates.end(),
        std::back_inserter(filtered),
        [this](const Vector2i& pos) { return isInActiveZone(pos); });

    return filtered.empty() ? candidates : filtered;
}

} // namespace EvoSim
