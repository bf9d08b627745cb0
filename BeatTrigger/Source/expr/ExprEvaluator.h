/**
 * The tree walking evaluator.
 *
 * Forms arrive here after macro expansion and linking, so the only
 * lists with special meaning are the special forms:
 *
 *     quote if do let loop recur fn def defmacro try throw
 *
 * plus method calls on host objects, (.method target args...).
 * Everything else is a function call.
 *
 * An evaluator carries no shared state beyond the workspace pointer.
 * A new one is made for each compilation and each invocation, which is
 * what lets compiled expressions run on several device threads at once.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"
#include "ExprScope.h"

/**
 * Thrown by recur and caught by the nearest loop or function.
 * Not an ExprException so try/catch in user code never sees it.
 */
class ExprRecur
{
  public:
    juce::Array<ExprValue> args;
};

/**
 * A function created by fn, defn or defmacro.
 */
class ExprClosure : public ExprFunction
{
  public:

    /**
     * One parameter list and the body that goes with it.
     */
    class Arity
    {
      public:
        juce::Array<ExprValue> params;
        ExprValue restParam;
        bool variadic = false;
        juce::Array<ExprValue> body;
    };

    ExprClosure() {}
    ~ExprClosure() {}

    ExprValue call(class ExprEvaluator* ev, const juce::Array<ExprValue>& args) override;

    juce::OwnedArray<Arity> arities;
    ExprScope::Ptr scope;

    // true if the function was named in the fn form and may call itself
    bool selfNamed = false;

  private:

    Arity* findArity(int count);
    void bindArgs(class ExprEvaluator* ev, Arity* arity, const juce::Array<ExprValue>& args, ExprScope* dest);
};

class ExprEvaluator
{
  public:

    ExprEvaluator(class ExprWorkspace* ws);
    ~ExprEvaluator();

    class ExprWorkspace* getWorkspace() {return workspace;}

    ExprValue eval(const ExprValue& form, ExprScope* scope);

    // evaluate forms from start in order, returning the last value
    ExprValue evalBody(const juce::Array<ExprValue>& forms, int start, ExprScope* scope);

    // call anything callable, functions, keywords, maps and vectors
    ExprValue apply(const ExprValue& f, const juce::Array<ExprValue>& args);

    // bind a symbol or destructuring pattern
    void bindPattern(const ExprValue& pattern, const ExprValue& value, ExprScope* scope);

    // call a method on a value
    ExprValue invokeMethod(const juce::String& method, const ExprValue& target,
                           const juce::Array<ExprValue>& args);

    // build a closure from the parts of a fn form after the fn symbol
    ExprValue makeClosure(const ExprValue& form, int start, ExprScope* scope);

    /**
     * The items of anything that can be walked as a sequence.
     * nil is empty, strings are characters, maps are [key value] entries.
     * Throws for anything else.
     */
    static juce::Array<ExprValue> toItems(const ExprValue& value);

    static bool isSpecialForm(const juce::String& name);
    static bool isMethodName(const juce::String& name);

  private:

    class ExprWorkspace* workspace = nullptr;
    int depth = 0;

    ExprValue evalSymbol(const ExprValue& form, ExprScope* scope);
    ExprValue evalList(const ExprValue& form, ExprScope* scope);
    ExprValue evalIf(const ExprValue& form, ExprScope* scope);
    ExprValue evalLet(const ExprValue& form, ExprScope* scope);
    ExprValue evalLoop(const ExprValue& form, ExprScope* scope);
    ExprValue evalRecur(const ExprValue& form, ExprScope* scope);
    ExprValue evalDef(const ExprValue& form, ExprScope* scope);
    ExprValue evalDefmacro(const ExprValue& form, ExprScope* scope);
    ExprValue evalTry(const ExprValue& form, ExprScope* scope);
    ExprValue evalThrow(const ExprValue& form, ExprScope* scope);
    ExprValue evalMethod(const ExprValue& form, ExprScope* scope);

    void checkBindings(const ExprValue& form, const ExprValue& bindings);
    void bindMap(const ExprValue& pattern, const ExprValue& value, ExprScope* scope);
    void bindSequence(const ExprValue& pattern, const ExprValue& value, ExprScope* scope);
    ExprClosure::Arity* parseArity(const ExprValue& params, const ExprValue& form, int bodyStart);

    ExprValue invokeBuiltinMethod(const juce::String& method, const ExprValue& target,
                                  const juce::Array<ExprValue>& args, bool& found);
};
