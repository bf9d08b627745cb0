
#include <JuceHeader.h>

#include "../util/Trace.h"
#include "../util/StructureDumper.h"

#include "ExprValue.h"
#include "ExprError.h"
#include "ExprWorkspace.h"
#include "ExprEvaluator.h"
#include "ExprOwner.h"
#include "ExprExpression.h"

ExprExpression::ExprExpression(ExprWorkspace* ws, juce::String t, juce::String s)
{
    workspace = ws;
    title = t;
    source = s;
}

ExprExpression::~ExprExpression()
{
}

ExprInvocation ExprExpression::invoke(const ExprValue& event, ExprOwner* owner,
                                      const ExprValue& globals)
{
    ExprValue triggerData;
    if (owner != nullptr)
      triggerData = owner->toValue();
    return invoke(event, triggerData, globals);
}

ExprInvocation ExprExpression::invoke(const ExprValue& event, const ExprValue& triggerData,
                                      const ExprValue& globals)
{
    ExprInvocation result;

    juce::Array<ExprValue> args;
    args.add(event);
    args.add(triggerData);
    args.add(globals.isNil() ? workspace->getGlobals() : globals);

    ExprEvaluator ev (workspace);
    try {
        result.value = ev.apply(function, args);
    }
    catch (ExprException& e) {
        fail(result, ExprError(title, e));
    }
    catch (ExprRecur& r) {
        (void)r;
        fail(result, ExprError(title, "recur outside of loop or fn"));
    }
    catch (std::exception& e) {
        fail(result, ExprError(title, juce::String(e.what())));
    }

    return result;
}

void ExprExpression::fail(ExprInvocation& result, const ExprError& error)
{
    result.value = ExprValue();
    result.failed = true;
    result.error = error;
    ++failures;
    Trace(1, "ExprExpression: %s", error.toString().toUTF8());
}

void ExprExpression::dump(StructureDumper& d)
{
    d.start("Expression");
    d.add("title", title);
    d.add("failures", failures.get());
    d.newline();
    d.inc();
    d.block("source", source);
    d.list("prelude", prelude);
    d.block("form", form.print());
    d.dec();
}
