/**
 * What came back from a compilation or a shared definition load.
 *
 * On success an expression compile has the compiled expression and
 * no errors.  A load never has an expression, it has the names that
 * were defined.  On failure there is at least one error and the
 * expression is null.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprError.h"
#include "ExprExpression.h"

class ExprResult
{
  public:

    ExprResult() {}
    ~ExprResult() {}

    ExprExpression::Ptr expression;

    juce::Array<ExprError> errors;

    // names defined by a load, in the order the forms ran
    juce::StringArray definitions;

    // number of top level forms evaluated by a load before it
    // finished or failed
    int evaluated = 0;

    bool isSuccess() const {return errors.size() == 0;}

    // the first error, which is the only one for a compile
    ExprError getError() const {
        return (errors.size() > 0) ? errors[0] : ExprError();
    }
};
