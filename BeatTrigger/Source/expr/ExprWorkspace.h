/**
 * The shared workspace.
 *
 * There is one of these per process.  It holds every named definition
 * the expressions can see: the standard library, the class symbols,
 * the domain helper functions, and whatever the user loads as shared
 * definitions.  Later expressions and later loads can reference anything
 * defined here.  Nothing is ever removed, only redefined.
 *
 * Two locks.  Definitions are behind a read/write lock since lookups
 * happen constantly on device threads and writes are rare.  Compilation
 * is serialized by a separate critical section the compiler holds for
 * the duration of a compile or a load, so two loads never interleave
 * their definitions.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"

class ExprWorkspace
{
  public:

    ExprWorkspace();
    ~ExprWorkspace();

    bool lookup(const juce::String& name, ExprValue& result);
    bool isDefined(const juce::String& name);
    void define(const juce::String& name, const ExprValue& value);

    // sorted names of everything defined
    juce::StringArray getNames();

    /**
     * The default globals atom, passed to expressions when the caller
     * has no globals of its own.  Also visible to shared functions
     * under the name globals.
     */
    ExprValue getGlobals() {return globals;}

    juce::CriticalSection& getCompileLock() {return compileLock;}

  private:

    juce::ReadWriteLock definitionLock;
    juce::HashMap<juce::String, ExprValue> definitions;

    juce::CriticalSection compileLock;

    ExprValue globals;

    void defineClass(const char* name);
};
