#ifndef GAMEPROGRESSADAPTER_H
#define GAMEPROGRESSADAPTER_H

#include "../collectionadapter.h"

namespace Stash {

/**
 * @brief Adapter for the player's game progress
 *
 * Local collection "gameProgress", remote table "game_progress". The
 * remote keeps one current row per user, so a pull fetches only the newest
 * row and always pulls in full.
 */
class GameProgressAdapter : public FieldMappedAdapter
{
public:
    GameProgressAdapter();

    QString displayName() const override { return "Game Progress"; }
    int priority() const override { return 4; }
    bool supportsIncrementalPull() const override { return false; }
    QString recordName(const QJsonObject &record) const override;

protected:
    int pullLimit() const override { return 1; }
};

} // namespace Stash

#endif // GAMEPROGRESSADAPTER_H
