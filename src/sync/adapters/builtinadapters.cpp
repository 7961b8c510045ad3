#include "builtinadapters.h"
#include "gameprogressadapter.h"
#include "achievementsadapter.h"
#include "drawingsadapter.h"
#include "stickersadapter.h"
#include "childprofilesadapter.h"

namespace Stash {

QList<CollectionAdapter*> createBuiltinAdapters()
{
    return {
        new ChildProfilesAdapter(),
        new GameProgressAdapter(),
        new AchievementsAdapter(),
        new StickersAdapter(),
        new DrawingsAdapter(),
    };
}

} // namespace Stash
