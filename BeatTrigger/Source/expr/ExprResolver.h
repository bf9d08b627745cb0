/**
 * Flattens catalog inheritance into the set of bindings available
 * to one kind of event.
 *
 * Resolution is a pure function of the catalog and the kind so results
 * are cached.  The cache is shared by the editors on the UI thread and
 * by compilations started from anywhere else so access is locked.
 * The sets returned are owned by the resolver and stay valid as long
 * as it does.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprBinding.h"
#include "ExprCatalog.h"

class ExprResolver
{
  public:

    ExprResolver(ExprCatalog* c);
    ~ExprResolver();

    /**
     * The bindings available to a kind.  An unknown kind resolves
     * to an empty set.
     */
    const ExprBindingSet* resolve(juce::String kind);
    const ExprBindingSet* resolve(ExprStandardKind kind);

  private:

    ExprCatalog* catalog = nullptr;

    juce::CriticalSection cacheLock;
    juce::OwnedArray<ExprBindingSet> sets;
    juce::HashMap<juce::String, ExprBindingSet*> cache;

    ExprBindingSet* flatten(const juce::String& kind, juce::StringArray& path);
};
