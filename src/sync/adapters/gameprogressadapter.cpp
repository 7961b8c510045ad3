#include "gameprogressadapter.h"

namespace Stash {

GameProgressAdapter::GameProgressAdapter()
    : FieldMappedAdapter("gameProgress", "game_progress",
                         {
                             {"score", "score"},
                             {"activitiesCompleted", "activities_completed"},
                             {"currentTheme", "current_theme"},
                             {"lastActivity", "last_activity"},
                             {"updatedAt", "updated_at"},
                         },
                         "updated_at", "user_id", {"child_profile_id"})
{
}

QString GameProgressAdapter::recordName(const QJsonObject &record) const
{
    const QString theme = record.value("currentTheme").toString();
    return theme.isEmpty() ? displayName() : QString("%1 (%2)").arg(displayName(), theme);
}

} // namespace Stash
