/**
 * Everything the application needs to use expressions, in one place.
 *
 * The environment owns the binding catalog, the resolver that caches
 * flattened kinds, the shared workspace, and the compiler.  There is
 * normally one of these for the life of the process.
 *
 * Startup is two steps.  The constructor fills the catalog with the
 * standard kinds, the application may then add extension kinds either
 * directly through getCatalog() or with a <Catalog> in the config, and
 * initialize() seals the catalog and loads the helper functions the
 * standard bindings call.  Nothing compiles until initialize succeeds.
 *
 * After that the environment may be used from any thread.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"
#include "ExprError.h"
#include "ExprCatalog.h"
#include "ExprResolver.h"
#include "ExprWorkspace.h"
#include "ExprCompiler.h"
#include "ExprResult.h"
#include "ExprExpression.h"

class ExprEnvironment
{
  public:

    ExprEnvironment();
    ~ExprEnvironment();

    /**
     * Seal the catalog and load the helpers.  Returns false if
     * either went wrong, the reasons are in getErrors.
     */
    bool initialize(class ExprConfig* config = nullptr);

    bool isReady() {return ready;}
    juce::Array<ExprError>& getErrors() {return errors;}

    ExprCatalog* getCatalog() {return &catalog;}
    ExprWorkspace* getWorkspace() {return &workspace;}
    ExprCompiler* getCompiler() {return &compiler;}

    //
    // The operations editors and triggers use
    //

    const ExprBindingSet* resolveBindings(juce::String kind);
    const ExprBindingSet* resolveBindings(ExprStandardKind kind);

    ExprResult compileExpression(juce::String source, const ExprBindingSet* bindings,
                                 bool nilGuarded, bool noOwnerLocals, juce::String title);

    // shorthand that resolves the kind first
    ExprResult compileExpression(juce::String source, juce::String kind,
                                 bool nilGuarded, bool noOwnerLocals, juce::String title);

    ExprResult loadSharedDefinitions(juce::String source, juce::String title);

    ExprInvocation invoke(ExprExpression* expression, const ExprValue& event,
                          class ExprOwner* owner, const ExprValue& globals = ExprValue());

    //
    // Workspace access for the host application
    //

    /**
     * Install something under a name, this is how the network layer
     * provides the finder objects.
     */
    void define(juce::String name, const ExprValue& value);
    ExprValue lookup(juce::String name);

    juce::String renderHelp(juce::String kind);

    void dump(class StructureDumper& d);

  private:

    ExprCatalog catalog;
    ExprResolver resolver {&catalog};
    ExprWorkspace workspace;
    ExprCompiler compiler {&workspace};

    juce::Array<ExprError> errors;
    bool ready = false;

    bool checkReady(juce::String title, ExprResult& result);
};
