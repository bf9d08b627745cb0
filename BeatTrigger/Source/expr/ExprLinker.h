/**
 * Utility class used by the compiler to resolve references in
 * expanded forms before they are evaluated.
 *
 * Evaluation would find an unresolved symbol eventually, but only if
 * the branch it was in happened to run.  An expression that misspells
 * a binding name in a rarely taken branch should fail when it is saved,
 * not hours later when that branch finally runs during a show.
 *
 * The linker also rejects recur anywhere but the tail of a loop or fn.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"

class ExprLinker
{
  public:

    ExprLinker(class ExprWorkspace* ws);
    ~ExprLinker() {}

    /**
     * Check one expanded form.  Names in locals are visible to it,
     * for expressions these are the generated function parameters.
     * Throws ExprException on the first problem.
     */
    void link(const ExprValue& form, const juce::StringArray& locals);

    /**
     * Add the names a binding pattern introduces.
     */
    static void addPatternNames(const ExprValue& pattern, juce::StringArray& names);

  private:

    class ExprWorkspace* workspace = nullptr;

    // names in scope at the current point of the walk
    juce::StringArray locals;

    // names def'd earlier in this unit that may not exist yet
    juce::StringArray declared;

    // number of enclosing loop or fn bodies
    int recurTargets = 0;

    void link(const ExprValue& form, bool tail);
    void linkList(const ExprValue& form, bool tail);
    void linkSymbol(const ExprValue& form);
    void linkBody(const juce::Array<ExprValue>& forms, int start, bool tail);
    void linkBindings(const ExprValue& form, bool isLoop);
    void linkFunction(const ExprValue& form, int start, bool named);
    void linkArity(const ExprValue& params, const juce::Array<ExprValue>& body, int start);
    void linkDef(const ExprValue& form);
    void linkTry(const ExprValue& form);
    void linkRecur(const ExprValue& form, bool tail);
};
