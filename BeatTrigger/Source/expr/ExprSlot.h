/**
 * The places an expression can be typed, and the holder for one.
 *
 * Each trigger and each show track has a fixed set of expression slots.
 * A slot definition says which kind of event the expression receives,
 * whether that event may be missing, and whether the expression has an
 * owner with locals.  Shared functions are a slot too, their source is
 * loaded into the workspace rather than compiled into a function.
 *
 * An ExprSlot is one instance of a slot for one owner.  It holds the
 * source, the compiled expression, and the error from the last compile.
 *
 *     Empty -> Compiling -> Installed
 *                        -> Failed
 *     Installed -> Compiling    on recompile
 *     Installed -> Empty        on clear
 *
 * When a recompile fails the previous expression is dropped so a
 * broken edit doesn't leave stale behavior running.  setKeepOnFailure
 * changes that for callers who would rather keep the old one.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprConstants.h"
#include "ExprValue.h"
#include "ExprError.h"
#include "ExprExpression.h"

typedef enum {

    ExprSlotTriggerEnabled,
    ExprSlotTriggerActivation,
    ExprSlotTriggerDeactivation,
    ExprSlotTriggerTracked,
    ExprSlotTriggerBeat,
    ExprSlotTriggerSetup,
    ExprSlotTriggerShutdown,

    ExprSlotShowTrackLoaded,
    ExprSlotShowTrackPlaying,
    ExprSlotShowTrackBeat,
    ExprSlotShowCueEntered,

    ExprSlotGlobalSetup,
    ExprSlotSharedFunctions

} ExprSlotId;

class ExprSlotDefinition
{
  public:

    ExprSlotId id;

    // short name used in configuration files
    const char* name;

    // shown in the editor window title
    const char* title;

    // kind of event passed in, nullptr when there is none
    const char* kind;

    // the event may be nil
    bool nilGuarded;

    // there is no owner so no locals
    bool noOwnerLocals;

    ExprSourceKind sourceKind;

    // one line for the editor
    const char* description;
};

class ExprSlotDefinitions
{
  public:

    static const ExprSlotDefinition* find(ExprSlotId id);
    static const ExprSlotDefinition* find(juce::String name);
    static juce::StringArray getNames();
};

class ExprSlot
{
  public:

    ExprSlot(const ExprSlotDefinition* def, juce::String ownerName = "");
    ~ExprSlot();

    const ExprSlotDefinition* getDefinition() {return definition;}

    // owner name and slot title, used in errors
    juce::String getTitle();

    ExprSlotState getState();
    juce::String getSource();
    ExprExpression::Ptr getExpression();
    ExprError getError();
    bool hasError();

    void setKeepOnFailure(bool b) {keepOnFailure = b;}

    /**
     * Compile new source.  Blank source clears the slot.
     * Returns true if the slot ends up Installed or Empty.
     */
    bool compile(class ExprEnvironment* env, juce::String source);

    void clear();

    /**
     * Run the installed expression.  An empty, failed, or shared slot
     * answers nil without an error.
     */
    ExprInvocation invoke(const ExprValue& event, class ExprOwner* owner,
                          const ExprValue& globals = ExprValue());

    static const char* getStateName(ExprSlotState state);

  private:

    const ExprSlotDefinition* definition = nullptr;
    juce::String ownerName;
    bool keepOnFailure = false;

    juce::CriticalSection lock;
    ExprSlotState state = ExprSlotEmpty;
    juce::String source;
    ExprExpression::Ptr expression;
    ExprError error;
    bool failed = false;
};
