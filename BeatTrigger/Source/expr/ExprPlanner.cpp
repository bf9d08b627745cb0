
#include <JuceHeader.h>

#include "../util/Trace.h"

#include "ExprConstants.h"
#include "ExprValue.h"
#include "ExprError.h"
#include "ExprBinding.h"
#include "ExprPlanner.h"

ExprPlan ExprPlanner::plan(const juce::StringArray& discovered,
                           const ExprBindingSet* bindings,
                           bool nilGuarded)
{
    ExprPlan plan;

    if (bindings != nullptr) {
        juce::StringArray ordered = discovered;
        ordered.sort(false);

        for (auto name : ordered) {
            if (bindings->contains(name)) {
                juce::StringArray visiting;
                visit(name, bindings, nilGuarded, visiting, plan);
            }
            else {
                Trace(2, "ExprPlanner: Ignoring %s, not available to kind %s",
                      name.toUTF8(), bindings->kind.toUTF8());
            }
        }
    }

    return plan;
}

void ExprPlanner::visit(const juce::String& name, const ExprBindingSet* bindings,
                        bool nilGuarded, juce::StringArray& visiting, ExprPlan& plan)
{
    if (plan.contains(name))
      return;

    if (visiting.contains(name))
      throw ExprException("Binding " + name + " requires itself through " +
                          visiting.joinIntoString(" -> "));

    const ExprBinding* b = bindings->get(name);
    if (b == nullptr)
      throw ExprException("Binding " + visiting[visiting.size() - 1] + " requires " + name +
                          " which is not available to kind " + bindings->kind);

    visiting.add(name);
    if (b->hasRequired())
      visit(b->required, bindings, nilGuarded, visiting, plan);
    visiting.removeString(name);

    ExprValue generator = b->generator;
    if (nilGuarded)
      generator = guard(generator);

    plan.steps.add(ExprPlanStep(name, generator));
}

ExprValue ExprPlanner::guard(const ExprValue& generator)
{
    juce::Array<ExprValue> items;
    items.add(ExprValue::symbol("when"));
    items.add(ExprValue::symbol(EXPR_PARAM_STATUS));
    items.add(generator);
    return ExprValue::list(items, generator.getLine(), generator.getColumn());
}
