#ifndef STICKERSADAPTER_H
#define STICKERSADAPTER_H

#include "../collectionadapter.h"

namespace Stash {

/**
 * @brief Adapter for the sticker collection ("stickers" on both sides)
 */
class StickersAdapter : public FieldMappedAdapter
{
public:
    StickersAdapter();

    QString displayName() const override { return "Stickers"; }
    int priority() const override { return 3; }
    CollectionSchema schema() const override;
    QString recordName(const QJsonObject &record) const override;
};

} // namespace Stash

#endif // STICKERSADAPTER_H
