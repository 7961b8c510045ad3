#ifndef ACHIEVEMENTSADAPTER_H
#define ACHIEVEMENTSADAPTER_H

#include "../collectionadapter.h"

namespace Stash {

/**
 * @brief Adapter for unlocked achievements ("achievements" on both sides)
 */
class AchievementsAdapter : public FieldMappedAdapter
{
public:
    AchievementsAdapter();

    QString displayName() const override { return "Achievements"; }
    int priority() const override { return 3; }
    CollectionSchema schema() const override;
    QString recordName(const QJsonObject &record) const override;
};

} // namespace Stash

#endif // ACHIEVEMENTSADAPTER_H
