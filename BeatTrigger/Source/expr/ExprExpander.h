/**
 * The macro expander.
 *
 * Runs over forms after reading and before linking and evaluation,
 * replacing every macro call with its expansion until nothing but
 * special forms and function calls remain.  The scanner depends on this,
 * a binding referenced only from inside a user macro's expansion must
 * be visible as an ordinary symbol when the prelude is planned.
 *
 * There are two kinds of macro.  The ones every expression can use
 * (defn, when, cond, and, ->, ...) are implemented here in C++.
 * Macros defined with defmacro live in the workspace as closures
 * flagged as macros and are called with the unevaluated argument forms.
 *
 * Special forms are walked structurally so binding names and parameter
 * vectors are never mistaken for calls.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"

class ExprExpander
{
  public:

    ExprExpander(class ExprWorkspace* ws, class ExprEvaluator* ev);
    ~ExprExpander();

    /**
     * Expand every macro call anywhere in the form.
     */
    ExprValue expandAll(const ExprValue& form);

    /**
     * Expand the form once if it is a macro call.
     * Returns false and leaves result alone if it isn't.
     */
    bool expandOnce(const ExprValue& form, ExprValue& result);

    /**
     * True for the macros implemented here.
     */
    static bool isBuiltinMacro(const juce::String& name);

  private:

    class ExprWorkspace* workspace = nullptr;
    class ExprEvaluator* evaluator = nullptr;

    ExprValue expandList(const ExprValue& form);
    ExprValue expandItems(const ExprValue& form, int start);
    ExprValue expandBindingForm(const ExprValue& form);
    ExprValue expandFn(const ExprValue& form, int start);
    ExprValue expandDef(const ExprValue& form);
    ExprValue expandTry(const ExprValue& form);

    bool findUserMacro(const juce::String& name, ExprValue& macro);
    ExprValue expandBuiltin(const juce::String& name, const ExprValue& form);

    ExprValue expandDefn(const ExprValue& form);
    ExprValue expandWhen(const ExprValue& form, bool negate);
    ExprValue expandIfNot(const ExprValue& form);
    ExprValue expandConditionalLet(const ExprValue& form, bool isWhen);
    ExprValue expandCond(const ExprValue& form);
    ExprValue expandCase(const ExprValue& form);
    ExprValue expandAnd(const ExprValue& form);
    ExprValue expandOr(const ExprValue& form);
    ExprValue expandThread(const ExprValue& form, bool last);
    ExprValue expandDeclare(const ExprValue& form);
    ExprValue expandDotimes(const ExprValue& form);
    ExprValue expandDoseq(const ExprValue& form);
};
