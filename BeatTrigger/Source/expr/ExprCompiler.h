/**
 * Turns source text into something that can run.
 *
 * For an expression the stages are:
 *
 *     read        text to forms, all of them wrapped in a do
 *     expand      macros replaced by their expansions
 *     scan        catalog bindings the body refers to
 *     plan        those bindings with their requirements, in order
 *     build       the generated (fn expression [...] (let [...] body))
 *     link        every symbol resolves, recur only in tail position
 *     evaluate    the fn form, giving the closure
 *
 * Shared definitions skip the middle: each form is expanded, linked
 * and evaluated straight into the workspace, one at a time, so a macro
 * defined by one form is in effect for the next.  A failure stops the
 * load and whatever ran before it stays defined.
 *
 * Nothing is thrown out of here.  Problems come back as errors in the
 * result carrying the title from the request.  All compiles and loads
 * hold the workspace compile lock.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"
#include "ExprRequest.h"
#include "ExprResult.h"

class ExprCompiler
{
  public:

    ExprCompiler(class ExprWorkspace* ws);
    ~ExprCompiler();

    /**
     * When on, each generated function is logged.
     */
    void setDiagnosticMode(bool b) {diagnosticMode = b;}
    bool isDiagnosticMode() {return diagnosticMode;}

    ExprResult compile(const ExprRequest& request);

    ExprResult compileExpression(juce::String source, const class ExprBindingSet* bindings,
                                 bool nilGuarded, bool noOwnerLocals, juce::String title);

    ExprResult loadShared(juce::String source, juce::String title);

  private:

    class ExprWorkspace* workspace = nullptr;
    bool diagnosticMode = false;

    bool parse(const ExprRequest& request, juce::Array<ExprValue>& forms, ExprResult& result);
    void compileForms(const ExprRequest& request, const juce::Array<ExprValue>& forms, ExprResult& result);
    void loadForms(const ExprRequest& request, const juce::Array<ExprValue>& forms, ExprResult& result);
    void addDefinition(const ExprValue& form, ExprResult& result);
};
