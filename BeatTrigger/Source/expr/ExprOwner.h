/**
 * The thing an expression belongs to, a trigger or a show cue.
 *
 * Each owner has a locals atom that its expressions share and that
 * survives from one invocation to the next, so a setup expression
 * can leave something for the beat expression to find.  The owner
 * reaches the expression as the trigger-data map:
 *
 *     {:locals <atom> :name "Trigger 3" ...extras}
 *
 * Owners are used from several device threads at once.  The map is
 * rebuilt under a lock when extras change and the atom does its own
 * locking.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"

class ExprOwner
{
  public:

    ExprOwner(juce::String name);
    ~ExprOwner();

    juce::String getName() {return name;}

    // the locals atom
    ExprValue getLocals() {return locals;}

    // the current value of the locals atom
    ExprValue derefLocals();

    // start over with an empty map, used when the owner is reset
    void resetLocals();

    /**
     * Add an identifying entry under a keyword.
     * :locals and :name are reserved.
     */
    void setExtra(juce::String key, const ExprValue& value);

    /**
     * The trigger-data map passed to invocations.
     */
    ExprValue toValue();

  private:

    juce::String name;
    ExprValue locals;

    juce::CriticalSection lock;
    ExprValue extras;
    ExprValue cached;

    void rebuild();
};
