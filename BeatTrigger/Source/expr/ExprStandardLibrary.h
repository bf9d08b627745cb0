/**
 * The functions every expression can call without defining them.
 *
 * Like the script library this is a static table of definitions, each
 * a name and a C++ function, installed into the workspace when it
 * is created.  Argument counts are checked before the function is called
 * so the implementations can index args without looking.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"

typedef ExprValue (*ExprNative)(class ExprEvaluator* ev, const juce::Array<ExprValue>& args);

class ExprLibraryDefinition
{
  public:
    const char* name;
    ExprNative function;
    int minArgs;
    // -1 for any number
    int maxArgs;
};

extern ExprLibraryDefinition ExprLibraryDefinitions[];

/**
 * A library function as a value.
 */
class ExprNativeFunction : public ExprFunction
{
  public:

    ExprNativeFunction(ExprLibraryDefinition* def);
    ~ExprNativeFunction() {}

    ExprValue call(class ExprEvaluator* ev, const juce::Array<ExprValue>& args) override;

  private:

    ExprLibraryDefinition* definition = nullptr;
};

class ExprStandardLibrary
{
  public:

    /**
     * Find a definition by name.
     */
    static ExprLibraryDefinition* find(juce::String name);

    /**
     * Define every library function in the workspace.
     * Functions in the string namespace are defined twice, as
     * str/join and clojure.string/join.
     */
    static void install(class ExprWorkspace* ws);

    /**
     * Ordering used by sort, <, and friends.
     * Throws if the values can't be compared.
     */
    static int compare(const ExprValue& a, const ExprValue& b);

    /**
     * The printf-like formatting behind the format function.
     */
    static juce::String format(const juce::String& pattern, const juce::Array<ExprValue>& args, int start);
};
