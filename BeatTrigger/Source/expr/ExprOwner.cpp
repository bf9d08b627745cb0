
#include <JuceHeader.h>

#include "../util/Trace.h"

#include "ExprConstants.h"
#include "ExprValue.h"
#include "ExprOwner.h"

ExprOwner::ExprOwner(juce::String n)
{
    name = n;
    locals = ExprValue::atom(ExprValue::map());
    extras = ExprValue::map();
    rebuild();
}

ExprOwner::~ExprOwner()
{
}

ExprValue ExprOwner::derefLocals()
{
    return locals.getAtom()->deref();
}

void ExprOwner::resetLocals()
{
    locals.getAtom()->reset(ExprValue::map());
}

void ExprOwner::setExtra(juce::String key, const ExprValue& value)
{
    if (key == EXPR_PARAM_LOCALS || key == "name") {
        Trace(1, "ExprOwner: Attempt to replace reserved entry %s", key.toUTF8());
        return;
    }

    const juce::ScopedLock sl (lock);
    extras = extras.assoc(ExprValue::keyword(key), value);
    rebuild();
}

void ExprOwner::rebuild()
{
    const juce::ScopedLock sl (lock);
    ExprValue map = ExprValue::map();
    map = map.assoc(ExprValue::keyword(EXPR_PARAM_LOCALS), locals);
    map = map.assoc(ExprValue::keyword("name"), ExprValue::fromString(name));

    const juce::Array<ExprValue>& keys = extras.getKeys();
    const juce::Array<ExprValue>& values = extras.getValues();
    for (int i = 0 ; i < keys.size() ; i++)
      map = map.assoc(keys[i], values[i]);

    cached = map;
}

ExprValue ExprOwner::toValue()
{
    const juce::ScopedLock sl (lock);
    return cached;
}
