#ifndef CHILDPROFILESADAPTER_H
#define CHILDPROFILESADAPTER_H

#include "../collectionadapter.h"

namespace Stash {

/**
 * @brief Adapter for child profiles
 *
 * Local collection "childrenProfiles", remote table "children_profiles".
 * Rows belong to the parent account (parent_user_id). Profiles are pushed
 * first since other rows may refer to them.
 */
class ChildProfilesAdapter : public FieldMappedAdapter
{
public:
    ChildProfilesAdapter();

    QString displayName() const override { return "Child Profiles"; }
    int priority() const override { return 5; }
    QString recordName(const QJsonObject &record) const override;
};

} // namespace Stash

#endif // CHILDPROFILESADAPTER_H
