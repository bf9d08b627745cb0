/**
 * Lexical scope for local bindings.
 *
 * A scope is a short list of names and values with a pointer to the
 * enclosing scope.  Closures hold on to the scope they were created in
 * so scopes are reference counted.  let and loop push a new scope for
 * each binding, which keeps a closure from ever capturing the scope
 * its own name is bound in.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"

class ExprScope : public juce::ReferenceCountedObject
{
  public:

    typedef juce::ReferenceCountedObjectPtr<ExprScope> Ptr;

    ExprScope(ExprScope* p = nullptr) : parent(p) {}
    ~ExprScope() {}

    void bind(const juce::String& name, const ExprValue& value) {
        names.add(name);
        values.add(value);
    }

    /**
     * Search this scope then the enclosing ones.
     * Later bindings in the same scope shadow earlier ones.
     */
    bool lookup(const juce::String& name, ExprValue& result) {
        for (ExprScope* s = this ; s != nullptr ; s = s->parent.get()) {
            for (int i = s->names.size() - 1 ; i >= 0 ; i--) {
                if (s->names[i] == name) {
                    result = s->values[i];
                    return true;
                }
            }
        }
        return false;
    }

    ExprScope* getParent() {return parent.get();}

  private:

    Ptr parent;
    juce::StringArray names;
    juce::Array<ExprValue> values;
};
