#include "drawingsadapter.h"

namespace Stash {

DrawingsAdapter::DrawingsAdapter()
    : FieldMappedAdapter("drawings", "drawings",
                         {
                             {"title", "title"},
                             {"imageData", "image_data"},
                             {"createdAt", "created_at"},
                             {"updatedAt", "updated_at"},
                         },
                         "updated_at", "user_id", {"child_profile_id"})
{
}

QString DrawingsAdapter::recordName(const QJsonObject &record) const
{
    const QString title = record.value("title").toString();
    return title.isEmpty() ? QString("Untitled drawing") : title;
}

} // namespace Stash
