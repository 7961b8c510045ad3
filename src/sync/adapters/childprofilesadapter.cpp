#include "childprofilesadapter.h"

namespace Stash {

ChildProfilesAdapter::ChildProfilesAdapter()
    : FieldMappedAdapter("childrenProfiles", "children_profiles",
                         {
                             {"name", "name"},
                             {"age", "age"},
                             {"gender", "gender"},
                             {"avatarUrl", "avatar_url"},
                             {"settings", "settings"},
                             {"updatedAt", "updated_at"},
                         },
                         "updated_at", "parent_user_id")
{
}

QString ChildProfilesAdapter::recordName(const QJsonObject &record) const
{
    return record.value("name").toString(Records::idOf(record));
}

} // namespace Stash
