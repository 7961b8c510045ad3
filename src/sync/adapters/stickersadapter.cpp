#include "stickersadapter.h"

namespace Stash {

StickersAdapter::StickersAdapter()
    : FieldMappedAdapter("stickers", "stickers",
                         {
                             {"stickerId", "sticker_id"},
                             {"unlockedAt", "unlocked_at"},
                         },
                         "unlocked_at", "user_id", {"child_profile_id"})
{
}

CollectionSchema StickersAdapter::schema() const
{
    CollectionSchema schema = FieldMappedAdapter::schema();
    schema.timestampFields.prepend("unlockedAt");
    return schema;
}

QString StickersAdapter::recordName(const QJsonObject &record) const
{
    return record.value("stickerId").toString(Records::idOf(record));
}

} // namespace Stash
