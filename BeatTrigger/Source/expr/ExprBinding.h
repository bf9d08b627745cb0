/**
 * Model for the named convenience values an expression may reference.
 *
 * A binding is a name, the source of a generator form that computes
 * the value from the incoming event, a line of documentation for the
 * editor help, and optionally the name of another binding that has to
 * be bound first.  The generator is parsed once when the catalog is
 * finished and reused by every compilation.
 *
 * A binding set is what a catalog kind resolves to after inheritance
 * has been flattened.  Sets point to bindings owned by the catalog
 * and must not outlive it.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"

class ExprBinding
{
  public:

    ExprBinding() {}
    ~ExprBinding() {}

    juce::String name;
    juce::String source;
    juce::String doc;

    // name of a binding that must be bound before this one, empty if none
    juce::String required;

    // the kind that defined it
    juce::String kind;

    // parsed from source by ExprCatalog::finish
    ExprValue generator;

    bool hasRequired() const {return required.length() > 0;}
};

class ExprBindingSet
{
  public:

    ExprBindingSet() {}
    ~ExprBindingSet() {}

    // the kind this was resolved from
    juce::String kind;

    /**
     * Add a binding replacing any existing one with the same name.
     */
    void put(const ExprBinding* b) {
        if (!bindings.contains(b->name))
          names.add(b->name);
        bindings.set(b->name, b);
    }

    const ExprBinding* get(const juce::String& name) const {
        return bindings[name];
    }

    bool contains(const juce::String& name) const {
        return bindings.contains(name);
    }

    int size() const {return names.size();}
    bool isEmpty() const {return names.size() == 0;}

    /**
     * Names in alphabetical order.
     */
    juce::StringArray getNames() const {
        juce::StringArray sorted = names;
        sorted.sort(false);
        return sorted;
    }

  private:

    juce::HashMap<juce::String, const ExprBinding*> bindings;
    juce::StringArray names;
};
