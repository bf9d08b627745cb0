/**
 * A compiled expression and the result of running one.
 *
 * An expression is the closure the compiler got from evaluating the
 * generated function, plus what is needed to explain it later: the
 * title and source it came from, the prelude names and the generated
 * form.  It never changes after compilation so any number of device
 * threads may invoke it at once.
 *
 * Expressions are reference counted.  Whoever edits the source holds
 * one, a listener thread in the middle of an invocation holds another,
 * and the last one out deletes it.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"
#include "ExprError.h"

/**
 * What one invocation produced.  If the expression failed the value
 * is nil and the error describes what happened.
 */
class ExprInvocation
{
  public:

    ExprValue value;
    bool failed = false;
    ExprError error;

    bool isSuccess() const {return !failed;}
};

class ExprExpression : public juce::ReferenceCountedObject
{
  public:

    typedef juce::ReferenceCountedObjectPtr<ExprExpression> Ptr;

    ExprExpression(class ExprWorkspace* ws, juce::String title, juce::String source);
    ~ExprExpression();

    juce::String getTitle() {return title;}
    juce::String getSource() {return source;}

    // binding names in the order they are bound
    juce::StringArray getPrelude() {return prelude;}

    // the generated function form after expansion
    ExprValue getForm() {return form;}

    // the closure
    ExprValue getFunction() {return function;}

    /**
     * Run the expression.  Event may be nil.  Trigger data is the owner
     * map, or nil for expressions without an owner.  If globals is nil
     * the workspace globals are used.
     *
     * This is the error boundary, nothing thrown inside escapes.
     */
    ExprInvocation invoke(const ExprValue& event, const ExprValue& triggerData,
                          const ExprValue& globals = ExprValue());

    ExprInvocation invoke(const ExprValue& event, class ExprOwner* owner,
                          const ExprValue& globals = ExprValue());

    void dump(class StructureDumper& d);

  protected:

    friend class ExprCompiler;

    void setPrelude(juce::StringArray names) {prelude = names;}
    void setForm(const ExprValue& f) {form = f;}
    void setFunction(const ExprValue& f) {function = f;}

  private:

    class ExprWorkspace* workspace = nullptr;
    juce::String title;
    juce::String source;
    juce::StringArray prelude;
    ExprValue form;
    ExprValue function;

    // number of invocations that failed, for the dump
    juce::Atomic<int> failures;

    void fail(ExprInvocation& result, const ExprError& error);
};
