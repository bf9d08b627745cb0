/**
 * Interface for objects that come from outside the expression language.
 *
 * The network layer hands events to expressions as ExprObjects and
 * the application installs "finder" objects in the workspace to look up
 * track metadata, playback position and beat grids.  Expressions reach
 * them with method calls and class tests:
 *
 *     (.getBeatWithinBar status)
 *     (instance? CdjStatus status)
 *
 * Objects are reference counted so an event can be held by several
 * expressions and dropped whenever the last one lets go.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"

class ExprObject : public juce::ReferenceCountedObject
{
  public:

    virtual ~ExprObject() {}

    /**
     * Name of the most specific class of this object.
     */
    virtual juce::String getClassName() = 0;

    /**
     * True if the object is an instance of the named class or
     * one of its superclasses.
     */
    virtual bool isInstance(juce::String className) = 0;

    /**
     * Call a method.  Return false if the object has no such method,
     * the evaluator turns that into an error.  Objects may throw
     * ExprException for bad arguments.
     */
    virtual bool invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result) = 0;

    /**
     * Text for printing.
     */
    virtual juce::String describe() {
        return "#object[" + getClassName() + "]";
    }
};

/**
 * A class symbol like CdjStatus evaluates to one of these.
 * All it does is carry the name for instance?
 */
class ExprClass : public ExprObject
{
  public:

    ExprClass(juce::String n) : name(n) {}
    ~ExprClass() {}

    juce::String getClassName() override {
        return "Class";
    }

    bool isInstance(juce::String className) override {
        return (className == "Class" || className == "Object");
    }

    bool invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result) override {
        (void)args;
        if (method == "getName" || method == "getSimpleName") {
            result = ExprValue::fromString(name);
            return true;
        }
        return false;
    }

    juce::String describe() override {
        return name;
    }

    juce::String name;
};
