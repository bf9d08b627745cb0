/**
 * Finds the catalog bindings an expression refers to.
 *
 * The scanner walks the macro expanded body and collects every symbol
 * whose name is one of the bindings available to the expression's kind.
 * Position doesn't matter, a symbol inside a vector or a map value
 * counts as much as one in function position.  Quoted forms are data
 * and are skipped.
 *
 * The scan is conservative.  A local that shadows a binding name still
 * causes the binding to be generated, which costs a little time when
 * the expression runs but is never wrong.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"

class ExprScanner
{
  public:

    /**
     * Names from the set referenced anywhere in the form, sorted.
     */
    static juce::StringArray scan(const ExprValue& form, const class ExprBindingSet* bindings);

  private:

    static void walk(const ExprValue& form, const class ExprBindingSet* bindings,
                     juce::StringArray& found);
};
