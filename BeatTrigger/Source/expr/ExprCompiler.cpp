
#include <JuceHeader.h>

#include "../util/Trace.h"
#include "../util/StructureDumper.h"

#include "ExprConstants.h"
#include "ExprValue.h"
#include "ExprError.h"
#include "ExprParser.h"
#include "ExprWorkspace.h"
#include "ExprEvaluator.h"
#include "ExprExpander.h"
#include "ExprLinker.h"
#include "ExprBinding.h"
#include "ExprScanner.h"
#include "ExprPlanner.h"
#include "ExprBuilder.h"
#include "ExprExpression.h"
#include "ExprCompiler.h"

ExprCompiler::ExprCompiler(ExprWorkspace* ws)
{
    workspace = ws;
}

ExprCompiler::~ExprCompiler()
{
}

//////////////////////////////////////////////////////////////////////
//
// Interface
//
//////////////////////////////////////////////////////////////////////

ExprResult ExprCompiler::compileExpression(juce::String source, const ExprBindingSet* bindings,
                                           bool nilGuarded, bool noOwnerLocals, juce::String title)
{
    ExprRequest request;
    request.source = source;
    request.title = title;
    request.kind = ExprSourceExpression;
    request.bindings = bindings;
    request.nilGuarded = nilGuarded;
    request.noOwnerLocals = noOwnerLocals;
    return compile(request);
}

ExprResult ExprCompiler::loadShared(juce::String source, juce::String title)
{
    ExprRequest request;
    request.source = source;
    request.title = title;
    request.kind = ExprSourceShared;
    return compile(request);
}

ExprResult ExprCompiler::compile(const ExprRequest& request)
{
    ExprResult result;

    const juce::ScopedLock lock (workspace->getCompileLock());

    juce::Array<ExprValue> forms;
    if (parse(request, forms, result)) {
        if (request.kind == ExprSourceShared)
          loadForms(request, forms, result);
        else
          compileForms(request, forms, result);
    }

    return result;
}

bool ExprCompiler::parse(const ExprRequest& request, juce::Array<ExprValue>& forms, ExprResult& result)
{
    ExprParser parser;
    if (!parser.parse(request.source, forms)) {
        for (auto error : parser.getErrors()) {
            error.title = request.title;
            result.errors.add(error);
        }
        Trace(2, "ExprCompiler: Parse failed for %s", request.title.toUTF8());
    }
    return result.errors.size() == 0;
}

//////////////////////////////////////////////////////////////////////
//
// Expressions
//
//////////////////////////////////////////////////////////////////////

void ExprCompiler::compileForms(const ExprRequest& request, const juce::Array<ExprValue>& forms,
                                ExprResult& result)
{
    juce::Array<ExprValue> items;
    items.add(ExprValue::symbol("do"));
    items.addArray(forms);
    int line = (forms.size() > 0) ? forms[0].getLine() : 0;
    int column = (forms.size() > 0) ? forms[0].getColumn() : 0;
    ExprValue body = ExprValue::list(items, line, column);

    ExprEvaluator ev (workspace);
    ExprExpander expander (workspace, &ev);

    try {
        ExprValue expanded = expander.expandAll(body);

        juce::StringArray discovered = ExprScanner::scan(expanded, request.bindings);
        ExprPlan plan = ExprPlanner::plan(discovered, request.bindings, request.nilGuarded);

        // generators may use macros of their own, the nil guard does
        ExprValue form = ExprBuilder::build(expanded, plan, request.noOwnerLocals);
        form = expander.expandAll(form);

        ExprLinker linker (workspace);
        linker.link(form, juce::StringArray());

        ExprValue function = ev.eval(form, nullptr);

        ExprExpression* expression = new ExprExpression(workspace, request.title, request.source);
        expression->setPrelude(plan.getNames());
        expression->setForm(form);
        expression->setFunction(function);
        result.expression = expression;

        if (diagnosticMode) {
            StructureDumper d;
            expression->dump(d);
            Tracej("ExprCompiler: Compiled " + request.title + "\n" + d.getText());
        }
    }
    catch (ExprException& e) {
        result.errors.add(ExprError(request.title, e));
        Trace(2, "ExprCompiler: %s: %s", request.title.toUTF8(), e.message.toUTF8());
    }
    catch (ExprRecur& r) {
        (void)r;
        result.errors.add(ExprError(request.title, "recur outside of loop or fn"));
    }
}

//////////////////////////////////////////////////////////////////////
//
// Shared definitions
//
//////////////////////////////////////////////////////////////////////

void ExprCompiler::loadForms(const ExprRequest& request, const juce::Array<ExprValue>& forms,
                             ExprResult& result)
{
    ExprEvaluator ev (workspace);
    ExprExpander expander (workspace, &ev);

    for (auto form : forms) {
        try {
            ExprValue expanded = expander.expandAll(form);

            ExprLinker linker (workspace);
            linker.link(expanded, juce::StringArray());

            (void)ev.eval(expanded, nullptr);

            result.evaluated++;
            addDefinition(expanded, result);
        }
        catch (ExprException& e) {
            result.errors.add(ExprError(request.title, e));
            Trace(1, "ExprCompiler: Loading %s stopped: %s",
                  request.title.toUTF8(), e.message.toUTF8());
        }
        catch (ExprRecur& r) {
            (void)r;
            result.errors.add(ExprError(request.title, "recur outside of loop or fn"));
        }

        if (result.errors.size() > 0)
          break;
    }

    if (diagnosticMode)
      Trace(2, "ExprCompiler: Loaded %s: %s", request.title.toUTF8(),
            result.definitions.joinIntoString(" ").toUTF8());
}

/**
 * Remember what a top level form defined.
 * defn and declare have been expanded so all that's left is def,
 * defmacro and do.
 */
void ExprCompiler::addDefinition(const ExprValue& form, ExprResult& result)
{
    if (form.isList()) {
        ExprValue head = form.first();
        if (head.isSymbol("def") || head.isSymbol("defmacro")) {
            ExprValue name = form.get(1);
            if (name.isSymbol())
              result.definitions.addIfNotAlreadyThere(name.getName());
        }
        else if (head.isSymbol("do")) {
            const juce::Array<ExprValue>& items = form.getItems();
            for (int i = 1 ; i < items.size() ; i++)
              addDefinition(items[i], result);
        }
    }
}
