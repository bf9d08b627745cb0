/**
 * The kinds and bindings built into every environment, and the
 * helper functions their generators call.
 *
 * The helpers are ordinary expression source loaded into the workspace
 * as shared definitions when the environment starts, so they can be
 * called from user code too.  The finder symbols they use are nil until
 * the application installs the real lookup objects.
 */

#pragma once

#include <JuceHeader.h>

class ExprStandardCatalog
{
  public:

    /**
     * Add the standard kinds and bindings to a catalog.
     * The catalog is not finished so extensions may still be added.
     */
    static void populate(class ExprCatalog* catalog);

    /**
     * Source of the helper definitions.
     */
    static juce::String getPrelude();

    // the names the finder objects are installed under
    static const char* MetadataFinder;
    static const char* TimeFinder;
    static const char* BeatGridFinder;
    static const char* VirtualCdj;
};
