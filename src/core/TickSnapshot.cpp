#include "TickSnapshot.h"
#include "ReflectSerializer.h"

namespace EvoSim {

void to_json(nlohmann::json& j, const SnapshotEntry& entry)
{
    j = ReflectSerializer::to_json(entry);
}

void from_json(const nlohmann::json& j, SnapshotEntry& entry)
{
    ReflectSerializer::merge(j, entry);
}

void to_json(nlohmann::json& j, const TickSnapshot& snapshot)
{
    j = ReflectSerializer::to_json(snapshot);
}

void from_json(const nlohmann::json& j, TickSnapshot& snapshot)
{
    ReflectSerializer::merge(j, snapshot);
}

} // namespace EvoSim
