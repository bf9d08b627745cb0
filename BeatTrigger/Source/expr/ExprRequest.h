/**
 * What the application passes to the compiler.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprConstants.h"

class ExprRequest
{
  public:

    ExprRequest() {}
    ~ExprRequest() {}

    // text as typed in the editor
    juce::String source;

    // identifies the snippet in errors and logs, typically the
    // owner name and the slot, "Trigger 3 Beat Expression"
    juce::String title;

    // expression or shared definitions
    ExprSourceKind kind = ExprSourceExpression;

    // the bindings the expression may reference, from the resolver
    // nullptr is the same as an empty set
    const class ExprBindingSet* bindings = nullptr;

    // true when the expression may be called without an event
    bool nilGuarded = false;

    // true when there is no owner and locals is not available
    bool noOwnerLocals = false;
};
