#ifndef BUILTINADAPTERS_H
#define BUILTINADAPTERS_H

#include <QList>

namespace Stash {

class CollectionAdapter;

/**
 * @brief Fresh instances of every shipped collection adapter
 *
 * Ownership passes to the caller, normally straight into
 * SyncEngine::registerAdapter().
 */
QList<CollectionAdapter*> createBuiltinAdapters();

} // namespace Stash

#endif // BUILTINADAPTERS_H
