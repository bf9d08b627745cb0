/**
 * The shared workspace.
 */

#include <JuceHeader.h>

#include "../util/Trace.h"

#include "ExprConstants.h"
#include "ExprValue.h"
#include "ExprObject.h"
#include "ExprStandardLibrary.h"
#include "ExprWorkspace.h"

/**
 * Class symbols every workspace knows about.
 * The device classes are here so instance? tests compile even
 * before the network layer has delivered anything.
 */
static const char* StandardClasses[] = {
    "DeviceUpdate",
    "Beat",
    "CdjStatus",
    "MixerStatus",
    "TrackPositionUpdate",
    "TrackMetadata",
    "CueList",
    "Exception",
    "Throwable",
    "ExceptionInfo",
    "RuntimeException",
    "String",
    "Long",
    "Double",
    "Number",
    "Keyword",
    "Boolean",
    "Object",
    nullptr
};

ExprWorkspace::ExprWorkspace()
{
    ExprStandardLibrary::install(this);

    for (int i = 0 ; StandardClasses[i] != nullptr ; i++)
      defineClass(StandardClasses[i]);

    globals = ExprValue::atom(ExprValue::map());
    define(EXPR_PARAM_GLOBALS, globals);
}

ExprWorkspace::~ExprWorkspace()
{
}

void ExprWorkspace::defineClass(const char* name)
{
    define(name, ExprValue::object(new ExprClass(name)));
}

bool ExprWorkspace::lookup(const juce::String& name, ExprValue& result)
{
    const juce::ScopedReadLock lock (definitionLock);
    bool found = definitions.contains(name);
    if (found)
      result = definitions[name];
    return found;
}

bool ExprWorkspace::isDefined(const juce::String& name)
{
    const juce::ScopedReadLock lock (definitionLock);
    return definitions.contains(name);
}

void ExprWorkspace::define(const juce::String& name, const ExprValue& value)
{
    const juce::ScopedWriteLock lock (definitionLock);
    definitions.set(name, value);
}

juce::StringArray ExprWorkspace::getNames()
{
    juce::StringArray names;
    {
        const juce::ScopedReadLock lock (definitionLock);
        for (juce::HashMap<juce::String, ExprValue>::Iterator it (definitions) ; it.next() ; )
          names.add(it.getKey());
    }
    names.sort(false);
    return names;
}
