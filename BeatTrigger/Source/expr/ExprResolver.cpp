
#include <JuceHeader.h>

#include "../util/Trace.h"

#include "ExprBinding.h"
#include "ExprCatalog.h"
#include "ExprResolver.h"

ExprResolver::ExprResolver(ExprCatalog* c)
{
    catalog = c;
}

ExprResolver::~ExprResolver()
{
}

const ExprBindingSet* ExprResolver::resolve(ExprStandardKind kind)
{
    return resolve(juce::String(ExprStandardKindName(kind)));
}

const ExprBindingSet* ExprResolver::resolve(juce::String kind)
{
    const juce::ScopedLock lock (cacheLock);
    juce::StringArray path;
    return flatten(kind, path);
}

/**
 * Inherited kinds are merged in list order so a later one wins a name
 * collision, then the kind's own bindings go in last and win over
 * everything inherited.
 *
 * The catalog rejects inheritance cycles before anything is resolved
 * but the path check keeps a catalog that was never finished from
 * recursing forever.
 */
ExprBindingSet* ExprResolver::flatten(const juce::String& kindName, juce::StringArray& path)
{
    ExprBindingSet* set = cache[kindName];
    if (set != nullptr)
      return set;

    set = new ExprBindingSet();
    set->kind = kindName;

    ExprKind* kind = (catalog != nullptr) ? catalog->getKind(kindName) : nullptr;
    if (kind == nullptr) {
        Trace(1, "ExprResolver: Unknown kind %s", kindName.toUTF8());
    }
    else if (path.contains(kindName)) {
        Trace(1, "ExprResolver: Inheritance cycle at %s", kindName.toUTF8());
        // not cached, the partial result would be wrong for other paths
        sets.add(set);
        return set;
    }
    else {
        path.add(kindName);
        for (auto inherited : kind->inherits) {
            ExprBindingSet* base = flatten(inherited, path);
            for (auto name : base->getNames())
              set->put(base->get(name));
        }
        for (auto b : kind->bindings)
          set->put(b);
        path.removeString(kindName);
    }

    sets.add(set);
    cache.set(kindName, set);
    return set;
}
