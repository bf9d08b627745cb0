/**
 * Generates the function an expression compiles into.
 *
 *     (fn expression [status trigger-data globals]
 *       (let [event status
 *             {:keys [locals]} trigger-data
 *             binding generator
 *             ...]
 *         body))
 *
 * The locals destructure is left out for expressions that run
 * without an owner, a reference to locals then fails to link.
 * Nothing here evaluates anything, the result is a form handed back
 * to the compiler.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"

class ExprBuilder
{
  public:

    /**
     * Wrap a body in the expression function.
     * The body is a single form, the compiler wraps multiple top level
     * forms in a do before it gets here.
     */
    static ExprValue build(const ExprValue& body, const class ExprPlan& plan, bool noOwnerLocals);

    /**
     * Parameter names of the generated function.
     */
    static juce::StringArray getParameters();

  private:

    static ExprValue sym(const char* name);
};
