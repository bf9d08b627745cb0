
#include <JuceHeader.h>

#include "../util/Trace.h"

#include "ExprConstants.h"
#include "ExprValue.h"
#include "ExprError.h"
#include "ExprResult.h"
#include "ExprExpression.h"
#include "ExprOwner.h"
#include "ExprEnvironment.h"
#include "ExprSlot.h"

//////////////////////////////////////////////////////////////////////
//
// Definitions
//
//////////////////////////////////////////////////////////////////////

static ExprSlotDefinition SlotDefinitions[] = {

    {ExprSlotTriggerEnabled, "enabled", "Enabled Filter Expression", "status", false, false,
     ExprSourceExpression,
     "Called for each status update to decide whether the trigger is enabled."},

    {ExprSlotTriggerActivation, "activation", "Activation Expression", "status", false, false,
     ExprSourceExpression,
     "Called when the trigger becomes active."},

    {ExprSlotTriggerDeactivation, "deactivation", "Deactivation Expression", "status", true, false,
     ExprSourceExpression,
     "Called when the trigger becomes inactive, the status is nil if the device went away."},

    {ExprSlotTriggerTracked, "tracked", "Tracked Update Expression", "status", false, false,
     ExprSourceExpression,
     "Called for each status update from the tracked player."},

    {ExprSlotTriggerBeat, "beat", "Beat Expression", "Beat", false, false,
     ExprSourceExpression,
     "Called for each beat from the tracked player."},

    {ExprSlotTriggerSetup, "setup", "Setup Expression", nullptr, true, false,
     ExprSourceExpression,
     "Called once when the trigger is created or loaded."},

    {ExprSlotTriggerShutdown, "shutdown", "Shutdown Expression", nullptr, true, false,
     ExprSourceExpression,
     "Called once when the trigger is deleted or the window closes."},

    {ExprSlotShowTrackLoaded, "loaded", "Loaded Expression", "CdjStatus", true, false,
     ExprSourceExpression,
     "Called when the track is loaded by a player."},

    {ExprSlotShowTrackPlaying, "playing", "Playing Expression", "CdjStatus", true, false,
     ExprSourceExpression,
     "Called when a player starts playing the track."},

    {ExprSlotShowTrackBeat, "track-beat", "Track Beat Expression", "beat-tpu", false, false,
     ExprSourceExpression,
     "Called for each beat of the track while it is playing."},

    {ExprSlotShowCueEntered, "cue-entered", "Cue Entered Expression", "status", true, false,
     ExprSourceExpression,
     "Called when the playhead enters a cue."},

    {ExprSlotGlobalSetup, "global-setup", "Global Setup Expression", nullptr, true, true,
     ExprSourceExpression,
     "Called once when the application starts, before any trigger."},

    {ExprSlotSharedFunctions, "shared", "Shared Functions", nullptr, false, true,
     ExprSourceShared,
     "Definitions available to every other expression."}
};

static const int SlotDefinitionCount = sizeof(SlotDefinitions) / sizeof(ExprSlotDefinition);

const ExprSlotDefinition* ExprSlotDefinitions::find(ExprSlotId id)
{
    const ExprSlotDefinition* found = nullptr;
    for (int i = 0 ; i < SlotDefinitionCount ; i++) {
        if (SlotDefinitions[i].id == id) {
            found = &(SlotDefinitions[i]);
            break;
        }
    }
    return found;
}

const ExprSlotDefinition* ExprSlotDefinitions::find(juce::String name)
{
    const ExprSlotDefinition* found = nullptr;
    for (int i = 0 ; i < SlotDefinitionCount ; i++) {
        if (name == SlotDefinitions[i].name) {
            found = &(SlotDefinitions[i]);
            break;
        }
    }
    return found;
}

juce::StringArray ExprSlotDefinitions::getNames()
{
    juce::StringArray names;
    for (int i = 0 ; i < SlotDefinitionCount ; i++)
      names.add(SlotDefinitions[i].name);
    return names;
}

//////////////////////////////////////////////////////////////////////
//
// Slot
//
//////////////////////////////////////////////////////////////////////

ExprSlot::ExprSlot(const ExprSlotDefinition* def, juce::String owner)
{
    definition = def;
    ownerName = owner;
}

ExprSlot::~ExprSlot()
{
}

const char* ExprSlot::getStateName(ExprSlotState s)
{
    const char* name = "?";
    switch (s) {
        case ExprSlotEmpty: name = "Empty"; break;
        case ExprSlotCompiling: name = "Compiling"; break;
        case ExprSlotInstalled: name = "Installed"; break;
        case ExprSlotFailed: name = "Failed"; break;
    }
    return name;
}

juce::String ExprSlot::getTitle()
{
    juce::String title = definition->title;
    if (ownerName.length() > 0)
      title = ownerName + " " + title;
    return title;
}

ExprSlotState ExprSlot::getState()
{
    const juce::ScopedLock sl (lock);
    return state;
}

juce::String ExprSlot::getSource()
{
    const juce::ScopedLock sl (lock);
    return source;
}

ExprExpression::Ptr ExprSlot::getExpression()
{
    const juce::ScopedLock sl (lock);
    return expression;
}

ExprError ExprSlot::getError()
{
    const juce::ScopedLock sl (lock);
    return error;
}

bool ExprSlot::hasError()
{
    const juce::ScopedLock sl (lock);
    return failed;
}

void ExprSlot::clear()
{
    const juce::ScopedLock sl (lock);
    state = ExprSlotEmpty;
    source = "";
    expression = nullptr;
    error = ExprError();
    failed = false;
}

bool ExprSlot::compile(ExprEnvironment* env, juce::String newSource)
{
    if (newSource.trim().length() == 0) {
        clear();
        return true;
    }

    {
        const juce::ScopedLock sl (lock);
        state = ExprSlotCompiling;
        source = newSource;
    }

    ExprResult result;
    if (definition->sourceKind == ExprSourceShared) {
        result = env->loadSharedDefinitions(newSource, getTitle());
    }
    else {
        const ExprBindingSet* bindings = nullptr;
        if (definition->kind != nullptr)
          bindings = env->resolveBindings(juce::String(definition->kind));
        result = env->compileExpression(newSource, bindings, definition->nilGuarded,
                                        definition->noOwnerLocals, getTitle());
    }

    const juce::ScopedLock sl (lock);
    if (result.isSuccess()) {
        state = ExprSlotInstalled;
        expression = result.expression;
        error = ExprError();
        failed = false;
    }
    else {
        state = ExprSlotFailed;
        if (!keepOnFailure)
          expression = nullptr;
        error = result.getError();
        failed = true;
        Trace(2, "ExprSlot: %s", error.toString().toUTF8());
    }

    return !failed;
}

ExprInvocation ExprSlot::invoke(const ExprValue& event, ExprOwner* owner, const ExprValue& globals)
{
    ExprInvocation result;
    ExprExpression::Ptr current = getExpression();
    if (current != nullptr)
      result = current->invoke(event, definition->noOwnerLocals ? nullptr : owner, globals);
    return result;
}
