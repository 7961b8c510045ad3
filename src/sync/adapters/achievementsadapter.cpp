#include "achievementsadapter.h"

namespace Stash {

AchievementsAdapter::AchievementsAdapter()
    : FieldMappedAdapter("achievements", "achievements",
                         {
                             {"achievementId", "achievement_id"},
                             {"unlockedAt", "unlocked_at"},
                         },
                         "unlocked_at", "user_id", {"child_profile_id"})
{
}

CollectionSchema AchievementsAdapter::schema() const
{
    CollectionSchema schema = FieldMappedAdapter::schema();
    schema.timestampFields.prepend("unlockedAt");
    return schema;
}

QString AchievementsAdapter::recordName(const QJsonObject &record) const
{
    return record.value("achievementId").toString(Records::idOf(record));
}

} // namespace Stash
