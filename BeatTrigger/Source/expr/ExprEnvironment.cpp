
#include <JuceHeader.h>

#include "../util/Trace.h"
#include "../util/StructureDumper.h"

#include "ExprValue.h"
#include "ExprError.h"
#include "ExprBinding.h"
#include "ExprCatalog.h"
#include "ExprStandardCatalog.h"
#include "ExprResolver.h"
#include "ExprWorkspace.h"
#include "ExprCompiler.h"
#include "ExprExpression.h"
#include "ExprOwner.h"
#include "ExprConfig.h"
#include "ExprEnvironment.h"

ExprEnvironment::ExprEnvironment()
{
    ExprStandardCatalog::populate(&catalog);
}

ExprEnvironment::~ExprEnvironment()
{
}

bool ExprEnvironment::initialize(ExprConfig* config)
{
    if (ready) {
        Trace(1, "ExprEnvironment: Already initialized");
        return true;
    }

    errors.clear();

    if (config != nullptr) {
        TraceDebugLevel = config->traceLevel;
        compiler.setDiagnosticMode(config->diagnosticMode);
        if (config->getCatalog() != nullptr)
          catalog.parseXml(config->getCatalog());
    }

    if (!catalog.isSealed())
      (void)catalog.finish();

    if (!catalog.isValid()) {
        errors.addArray(catalog.getErrors());
        Trace(1, "ExprEnvironment: Catalog has %ld errors", (long)errors.size());
    }
    else {
        ExprResult result = compiler.loadShared(ExprStandardCatalog::getPrelude(), "Standard Helpers");
        if (result.isSuccess()) {
            Trace(2, "ExprEnvironment: Loaded %ld helper definitions", (long)result.definitions.size());
            ready = true;
        }
        else {
            errors.addArray(result.errors);
        }
    }

    return ready;
}

bool ExprEnvironment::checkReady(juce::String title, ExprResult& result)
{
    if (!ready)
      result.errors.add(ExprError(title, "Expression environment is not initialized"));
    return ready;
}

//////////////////////////////////////////////////////////////////////
//
// Operations
//
//////////////////////////////////////////////////////////////////////

const ExprBindingSet* ExprEnvironment::resolveBindings(juce::String kind)
{
    return resolver.resolve(kind);
}

const ExprBindingSet* ExprEnvironment::resolveBindings(ExprStandardKind kind)
{
    return resolver.resolve(kind);
}

ExprResult ExprEnvironment::compileExpression(juce::String source, const ExprBindingSet* bindings,
                                              bool nilGuarded, bool noOwnerLocals, juce::String title)
{
    ExprResult result;
    if (checkReady(title, result))
      result = compiler.compileExpression(source, bindings, nilGuarded, noOwnerLocals, title);
    return result;
}

ExprResult ExprEnvironment::compileExpression(juce::String source, juce::String kind,
                                              bool nilGuarded, bool noOwnerLocals, juce::String title)
{
    ExprResult result;
    if (checkReady(title, result))
      result = compiler.compileExpression(source, resolver.resolve(kind), nilGuarded, noOwnerLocals, title);
    return result;
}

ExprResult ExprEnvironment::loadSharedDefinitions(juce::String source, juce::String title)
{
    ExprResult result;
    if (checkReady(title, result))
      result = compiler.loadShared(source, title);
    return result;
}

ExprInvocation ExprEnvironment::invoke(ExprExpression* expression, const ExprValue& event,
                                       ExprOwner* owner, const ExprValue& globals)
{
    ExprInvocation result;
    if (expression == nullptr) {
        result.failed = true;
        result.error = ExprError("", "No expression to invoke");
    }
    else {
        result = expression->invoke(event, owner, globals);
    }
    return result;
}

//////////////////////////////////////////////////////////////////////
//
// Workspace
//
//////////////////////////////////////////////////////////////////////

void ExprEnvironment::define(juce::String name, const ExprValue& value)
{
    workspace.define(name, value);
}

ExprValue ExprEnvironment::lookup(juce::String name)
{
    ExprValue value;
    (void)workspace.lookup(name, value);
    return value;
}

juce::String ExprEnvironment::renderHelp(juce::String kind)
{
    return catalog.renderHelp(kind);
}

void ExprEnvironment::dump(StructureDumper& d)
{
    d.start("ExprEnvironment");
    d.addb("ready", ready);
    d.addb("diagnosticMode", compiler.isDiagnosticMode());
    d.newline();
    d.inc();
    catalog.dump(d);
    for (auto error : errors)
      d.line("error", error.toString());
    d.list("definitions", workspace.getNames());
    d.dec();
}
