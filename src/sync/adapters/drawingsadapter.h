#ifndef DRAWINGSADAPTER_H
#define DRAWINGSADAPTER_H

#include "../collectionadapter.h"

namespace Stash {

/**
 * @brief Adapter for saved drawings
 *
 * Drawings carry their image inline, so they go last.
 */
class DrawingsAdapter : public FieldMappedAdapter
{
public:
    DrawingsAdapter();

    QString displayName() const override { return "Drawings"; }
    int priority() const override { return 2; }
    QString recordName(const QJsonObject &record) const override;
};

} // namespace Stash

#endif // DRAWINGSADAPTER_H
