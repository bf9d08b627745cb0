
#include <JuceHeader.h>

#include "ExprConstants.h"
#include "ExprValue.h"
#include "ExprPlanner.h"
#include "ExprBuilder.h"

ExprValue ExprBuilder::sym(const char* name)
{
    return ExprValue::symbol(name);
}

juce::StringArray ExprBuilder::getParameters()
{
    juce::StringArray params;
    params.add(EXPR_PARAM_STATUS);
    params.add(EXPR_PARAM_TRIGGER_DATA);
    params.add(EXPR_PARAM_GLOBALS);
    return params;
}

ExprValue ExprBuilder::build(const ExprValue& body, const ExprPlan& plan, bool noOwnerLocals)
{
    juce::Array<ExprValue> bindings;

    bindings.add(sym(EXPR_PARAM_EVENT));
    bindings.add(sym(EXPR_PARAM_STATUS));

    if (!noOwnerLocals) {
        // {:keys [locals]}
        juce::Array<ExprValue> keys;
        keys.add(sym(EXPR_PARAM_LOCALS));
        juce::Array<ExprValue> pattern;
        pattern.add(ExprValue::keyword("keys"));
        pattern.add(ExprValue::vector(keys));
        bindings.add(ExprValue::map(pattern));
        bindings.add(sym(EXPR_PARAM_TRIGGER_DATA));
    }

    for (auto& step : plan.steps) {
        bindings.add(ExprValue::symbol(step.name));
        bindings.add(step.generator);
    }

    juce::Array<ExprValue> let;
    let.add(sym("let"));
    let.add(ExprValue::vector(bindings));
    let.add(body);

    juce::Array<ExprValue> params;
    for (auto name : getParameters())
      params.add(ExprValue::symbol(name));

    juce::Array<ExprValue> fn;
    fn.add(sym("fn"));
    fn.add(sym(EXPR_FUNCTION_NAME));
    fn.add(ExprValue::vector(params));
    fn.add(ExprValue::list(let, body.getLine(), body.getColumn()));

    return ExprValue::list(fn, body.getLine(), body.getColumn());
}
