/**
 * Orders the bindings an expression uses into the prelude of its
 * generated let.
 *
 * A let binds left to right so a binding that reads another one
 * has to come after it.  The catalog records that as the "requires"
 * name of a binding.  The planner takes what the scanner found, adds
 * anything required that wasn't referenced directly, and emits each
 * name once with its requirement ahead of it.
 *
 * Discovered names are visited in alphabetical order so the same
 * source always produces the same prelude.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"

/**
 * One entry in the prelude.
 */
class ExprPlanStep
{
  public:

    ExprPlanStep() {}
    ExprPlanStep(juce::String n, const ExprValue& g) : name(n), generator(g) {}

    juce::String name;

    // the form that computes the value, nil guarded if requested
    ExprValue generator;
};

class ExprPlan
{
  public:

    juce::Array<ExprPlanStep> steps;

    int size() const {return steps.size();}

    bool contains(const juce::String& name) const {
        for (auto& step : steps) {
            if (step.name == name)
              return true;
        }
        return false;
    }

    juce::StringArray getNames() const {
        juce::StringArray names;
        for (auto& step : steps)
          names.add(step.name);
        return names;
    }
};

class ExprPlanner
{
  public:

    /**
     * Build the prelude for the discovered names.  Names not in the
     * set are ignored.  When nilGuarded each generator is wrapped in
     * (when status ...) so it produces nil if there is no event.
     * Throws ExprException if a requirement can't be satisfied, which
     * a finished catalog prevents.
     */
    static ExprPlan plan(const juce::StringArray& discovered,
                         const class ExprBindingSet* bindings,
                         bool nilGuarded);

    /**
     * The nil guard on its own.
     */
    static ExprValue guard(const ExprValue& generator);

  private:

    static void visit(const juce::String& name, const class ExprBindingSet* bindings,
                      bool nilGuarded, juce::StringArray& visiting, ExprPlan& plan);
};
