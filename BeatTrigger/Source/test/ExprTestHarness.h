/**
 * Shared scaffolding for the expression tests.
 *
 * A harness owns a workspace and runs source through the real
 * compiler as an expression with no bindings and no owner, which is
 * the quickest way to get a value out of a snippet.  Failures leave
 * their text in lastError and return nil.
 */

#pragma once

#include <JuceHeader.h>

#include "../expr/ExprValue.h"
#include "../expr/ExprError.h"
#include "../expr/ExprParser.h"
#include "../expr/ExprWorkspace.h"
#include "../expr/ExprCompiler.h"
#include "../expr/ExprExpression.h"

class ExprTestHarness
{
  public:

    ExprTestHarness() {}
    ~ExprTestHarness() {}

    ExprWorkspace workspace;
    ExprCompiler compiler {&workspace};

    juce::String lastError;

    ExprValue run(juce::String source) {
        lastError = "";
        ExprValue value;
        ExprResult result = compiler.compileExpression(source, nullptr, true, true, "test");
        if (!result.isSuccess()) {
            lastError = result.getError().toString();
        }
        else {
            ExprInvocation invocation = result.expression->invoke(ExprValue(), ExprValue());
            if (invocation.isSuccess())
              value = invocation.value;
            else
              lastError = invocation.error.toString();
        }
        return value;
    }

    // printed form of the value, or the error text
    juce::String print(juce::String source) {
        ExprValue value = run(source);
        return (lastError.length() > 0) ? lastError : value.print();
    }

    bool load(juce::String source) {
        ExprResult result = compiler.loadShared(source, "test definitions");
        lastError = result.isSuccess() ? juce::String() : result.getError().toString();
        return result.isSuccess();
    }

    static ExprValue read(juce::String source) {
        ExprParser parser;
        ExprValue form;
        (void)parser.parseOne(source, form);
        return form;
    }
};
