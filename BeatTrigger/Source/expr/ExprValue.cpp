/**
 * Construction, access, equality and printing of values.
 */

#include <JuceHeader.h>

#include <cmath>
#include <stdio.h>

#include "ExprObject.h"
#include "ExprValue.h"

//////////////////////////////////////////////////////////////////////
//
// Construction
//
//////////////////////////////////////////////////////////////////////

ExprValue ExprValue::fromBool(bool b)
{
    ExprValue v;
    v.type = Bool;
    v.boolValue = b;
    return v;
}

ExprValue ExprValue::fromInt(juce::int64 i)
{
    ExprValue v;
    v.type = Int;
    v.intValue = i;
    return v;
}

ExprValue ExprValue::fromFloat(double d)
{
    ExprValue v;
    v.type = Float;
    v.floatValue = d;
    return v;
}

ExprValue ExprValue::fromString(juce::String s)
{
    ExprValue v;
    v.type = String;
    v.text = s;
    return v;
}

ExprValue ExprValue::keyword(juce::String name)
{
    ExprValue v;
    v.type = Keyword;
    v.text = name;
    return v;
}

ExprValue ExprValue::symbol(juce::String name, int line, int column)
{
    ExprValue v;
    v.type = Symbol;
    v.text = name;
    v.line = line;
    v.column = column;
    return v;
}

ExprValue ExprValue::list(const juce::Array<ExprValue>& items, int line, int column)
{
    ExprValue v;
    v.type = List;
    ExprSeq* seq = new ExprSeq();
    seq->items = items;
    v.cell = seq;
    v.line = line;
    v.column = column;
    return v;
}

ExprValue ExprValue::vector(const juce::Array<ExprValue>& items, int line, int column)
{
    ExprValue v = list(items, line, column);
    v.type = Vector;
    return v;
}

ExprValue ExprValue::map()
{
    ExprValue v;
    v.type = Map;
    v.cell = new ExprMapCell();
    return v;
}

ExprValue ExprValue::map(const juce::Array<ExprValue>& keysAndValues, int line, int column)
{
    ExprValue v;
    v.type = Map;
    ExprMapCell* m = new ExprMapCell();
    for (int i = 0 ; i + 1 < keysAndValues.size() ; i += 2) {
        const ExprValue& key = keysAndValues.getReference(i);
        int index = m->indexOf(key);
        if (index >= 0) {
            m->values.set(index, keysAndValues[i+1]);
        }
        else {
            m->keys.add(key);
            m->values.add(keysAndValues[i+1]);
        }
    }
    v.cell = m;
    v.line = line;
    v.column = column;
    return v;
}

ExprValue ExprValue::function(ExprFunction* f)
{
    ExprValue v;
    if (f != nullptr) {
        v.type = Function;
        v.cell = f;
    }
    return v;
}

ExprValue ExprValue::atom(const ExprValue& initial)
{
    ExprValue v;
    v.type = Atom;
    v.cell = new ExprAtom(initial);
    return v;
}

ExprValue ExprValue::object(ExprObject* o)
{
    ExprValue v;
    if (o != nullptr) {
        v.type = Object;
        v.cell = o;
    }
    return v;
}

void ExprValue::setPosition(int l, int c)
{
    line = l;
    column = c;
}

const char* ExprValue::getTypeName() const
{
    const char* name = "?";
    switch (type) {
        case Nil: name = "nil"; break;
        case Bool: name = "Boolean"; break;
        case Int: name = "Long"; break;
        case Float: name = "Double"; break;
        case String: name = "String"; break;
        case Keyword: name = "Keyword"; break;
        case Symbol: name = "Symbol"; break;
        case List: name = "List"; break;
        case Vector: name = "Vector"; break;
        case Map: name = "Map"; break;
        case Function: name = "Function"; break;
        case Atom: name = "Atom"; break;
        case Object: name = "Object"; break;
    }
    return name;
}

//////////////////////////////////////////////////////////////////////
//
// Access
//
//////////////////////////////////////////////////////////////////////

bool ExprValue::isSymbol(const char* name) const
{
    return (type == Symbol && text == name);
}

bool ExprValue::isTruthy() const
{
    return !(type == Nil || (type == Bool && !boolValue));
}

bool ExprValue::getBool() const
{
    return isTruthy();
}

juce::int64 ExprValue::getInt() const
{
    juce::int64 result = 0;
    if (type == Int)
      result = intValue;
    else if (type == Float)
      result = (juce::int64)floatValue;
    else if (type == Bool)
      result = boolValue ? 1 : 0;
    return result;
}

double ExprValue::getFloat() const
{
    double result = 0.0;
    if (type == Float)
      result = floatValue;
    else if (type == Int)
      result = (double)intValue;
    return result;
}

const juce::Array<ExprValue>& ExprValue::getItems() const
{
    static const juce::Array<ExprValue> empty;
    if (type == List || type == Vector)
      return static_cast<ExprSeq*>(cell.get())->items;
    return empty;
}

int ExprValue::size() const
{
    int result = 0;
    if (type == List || type == Vector)
      result = getItems().size();
    else if (type == Map)
      result = getKeys().size();
    else if (type == String)
      result = text.length();
    return result;
}

ExprValue ExprValue::get(int index) const
{
    const juce::Array<ExprValue>& items = getItems();
    if (index >= 0 && index < items.size())
      return items.getReference(index);
    return ExprValue();
}

ExprValue ExprValue::first() const
{
    return get(0);
}

ExprValue ExprValue::rest() const
{
    juce::Array<ExprValue> remainder;
    const juce::Array<ExprValue>& items = getItems();
    for (int i = 1 ; i < items.size() ; i++)
      remainder.add(items.getReference(i));
    return list(remainder);
}

//////////////////////////////////////////////////////////////////////
//
// Maps
//
//////////////////////////////////////////////////////////////////////

int ExprMapCell::indexOf(const ExprValue& key) const
{
    for (int i = 0 ; i < keys.size() ; i++) {
        if (keys.getReference(i).equals(key))
          return i;
    }
    return -1;
}

const juce::Array<ExprValue>& ExprValue::getKeys() const
{
    static const juce::Array<ExprValue> empty;
    if (type == Map)
      return static_cast<ExprMapCell*>(cell.get())->keys;
    return empty;
}

const juce::Array<ExprValue>& ExprValue::getValues() const
{
    static const juce::Array<ExprValue> empty;
    if (type == Map)
      return static_cast<ExprMapCell*>(cell.get())->values;
    return empty;
}

bool ExprValue::containsKey(const ExprValue& key) const
{
    bool found = false;
    if (type == Map) {
        found = (static_cast<ExprMapCell*>(cell.get())->indexOf(key) >= 0);
    }
    else if (type == Vector && key.isInt()) {
        found = (key.getInt() >= 0 && key.getInt() < size());
    }
    return found;
}

bool ExprValue::lookup(const ExprValue& key, ExprValue& result) const
{
    bool found = false;
    if (type == Map) {
        ExprMapCell* m = static_cast<ExprMapCell*>(cell.get());
        int index = m->indexOf(key);
        if (index >= 0) {
            result = m->values[index];
            found = true;
        }
    }
    else if (type == Vector && key.isInt()) {
        juce::int64 index = key.getInt();
        if (index >= 0 && index < size()) {
            result = get((int)index);
            found = true;
        }
    }
    return found;
}

ExprValue ExprValue::lookup(const ExprValue& key) const
{
    ExprValue result;
    lookup(key, result);
    return result;
}

ExprValue ExprValue::assoc(const ExprValue& key, const ExprValue& value) const
{
    ExprValue result;
    if (type == Vector) {
        juce::Array<ExprValue> items = getItems();
        int index = (int)key.getInt();
        if (index == items.size())
          items.add(value);
        else
          items.set(index, value);
        result = vector(items, line, column);
    }
    else {
        ExprMapCell* m = new ExprMapCell();
        if (type == Map) {
            ExprMapCell* src = static_cast<ExprMapCell*>(cell.get());
            m->keys = src->keys;
            m->values = src->values;
        }
        int index = m->indexOf(key);
        if (index >= 0) {
            m->values.set(index, value);
        }
        else {
            m->keys.add(key);
            m->values.add(value);
        }
        result.type = Map;
        result.cell = m;
    }
    return result;
}

ExprValue ExprValue::dissoc(const ExprValue& key) const
{
    ExprValue result = map();
    if (type == Map) {
        ExprMapCell* src = static_cast<ExprMapCell*>(cell.get());
        ExprMapCell* m = static_cast<ExprMapCell*>(result.cell.get());
        for (int i = 0 ; i < src->keys.size() ; i++) {
            if (!src->keys.getReference(i).equals(key)) {
                m->keys.add(src->keys[i]);
                m->values.add(src->values[i]);
            }
        }
    }
    return result;
}

//////////////////////////////////////////////////////////////////////
//
// Cells
//
//////////////////////////////////////////////////////////////////////

ExprFunction* ExprValue::getFunction() const
{
    return (type == Function) ? static_cast<ExprFunction*>(cell.get()) : nullptr;
}

ExprAtom* ExprValue::getAtom() const
{
    return (type == Atom) ? static_cast<ExprAtom*>(cell.get()) : nullptr;
}

ExprObject* ExprValue::getObject() const
{
    return (type == Object) ? static_cast<ExprObject*>(cell.get()) : nullptr;
}

ExprAtom::ExprAtom(const ExprValue& initial)
{
    value = initial;
}

ExprAtom::~ExprAtom()
{
}

ExprValue ExprAtom::deref()
{
    const juce::ScopedLock sl (lock);
    return value;
}

ExprValue ExprAtom::deref(juce::int64& v)
{
    const juce::ScopedLock sl (lock);
    v = version;
    return value;
}

void ExprAtom::reset(const ExprValue& v)
{
    const juce::ScopedLock sl (lock);
    value = v;
    version++;
}

bool ExprAtom::compareAndSet(juce::int64 expected, const ExprValue& v)
{
    const juce::ScopedLock sl (lock);
    bool set = false;
    if (version == expected) {
        value = v;
        version++;
        set = true;
    }
    return set;
}

//////////////////////////////////////////////////////////////////////
//
// Equality
//
//////////////////////////////////////////////////////////////////////

/**
 * Value equality in the style of =
 * Integers and floats are different things, (= 1 1.0) is false.
 * Lists and vectors with the same items are equal.
 * Functions, atoms and objects are equal only to themselves.
 */
bool ExprValue::equals(const ExprValue& other) const
{
    bool equal = false;

    if (isSequential() && other.isSequential()) {
        const juce::Array<ExprValue>& mine = getItems();
        const juce::Array<ExprValue>& theirs = other.getItems();
        if (mine.size() == theirs.size()) {
            equal = true;
            for (int i = 0 ; i < mine.size() && equal ; i++)
              equal = mine.getReference(i).equals(theirs.getReference(i));
        }
    }
    else if (type == other.type) {
        switch (type) {
            case Nil: equal = true; break;
            case Bool: equal = (boolValue == other.boolValue); break;
            case Int: equal = (intValue == other.intValue); break;
            case Float: equal = (floatValue == other.floatValue); break;
            case String:
            case Keyword:
            case Symbol:
                equal = (text == other.text);
                break;
            case Map: {
                const juce::Array<ExprValue>& keys = getKeys();
                if (keys.size() == other.size()) {
                    equal = true;
                    for (int i = 0 ; i < keys.size() && equal ; i++) {
                        ExprValue theirs;
                        equal = (other.lookup(keys.getReference(i), theirs) &&
                                 getValues().getReference(i).equals(theirs));
                    }
                }
            }
                break;
            case List:
            case Vector:
                // handled above
                break;
            case Function:
            case Atom:
            case Object:
                equal = (cell.get() == other.cell.get());
                break;
        }
    }
    return equal;
}

//////////////////////////////////////////////////////////////////////
//
// Printing
//
//////////////////////////////////////////////////////////////////////

static juce::String formatFloat(double d)
{
    juce::String s;
    if (std::isnan(d)) {
        s = "NaN";
    }
    else if (std::isinf(d)) {
        s = (d > 0) ? "Infinity" : "-Infinity";
    }
    else {
        char buffer[64];
        snprintf(buffer, sizeof(buffer), "%.15g", d);
        s = buffer;
        if (!s.containsAnyOf(".eEn"))
          s += ".0";
    }
    return s;
}

static juce::String escapeString(const juce::String& src)
{
    juce::String s = "\"";
    for (auto p = src.getCharPointer() ; !p.isEmpty() ; ) {
        juce::juce_wchar ch = p.getAndAdvance();
        switch (ch) {
            case '"': s += "\\\""; break;
            case '\\': s += "\\\\"; break;
            case '\n': s += "\\n"; break;
            case '\t': s += "\\t"; break;
            case '\r': s += "\\r"; break;
            default: s += juce::String::charToString(ch); break;
        }
    }
    s += "\"";
    return s;
}

juce::String ExprValue::toString() const
{
    juce::String buffer;
    render(buffer, false);
    return buffer;
}

juce::String ExprValue::print() const
{
    juce::String buffer;
    render(buffer, true);
    return buffer;
}

void ExprValue::render(juce::String& buffer, bool readable) const
{
    switch (type) {
        case Nil:
            // str of nil is empty, pr-str is nil
            if (readable)
              buffer += "nil";
            break;
        case Bool:
            buffer += boolValue ? "true" : "false";
            break;
        case Int:
            buffer += juce::String(intValue);
            break;
        case Float:
            buffer += formatFloat(floatValue);
            break;
        case String:
            if (readable)
              buffer += escapeString(text);
            else
              buffer += text;
            break;
        case Keyword:
            buffer += ":" + text;
            break;
        case Symbol:
            buffer += text;
            break;
        case List:
        case Vector: {
            buffer += (type == List) ? "(" : "[";
            const juce::Array<ExprValue>& items = getItems();
            for (int i = 0 ; i < items.size() ; i++) {
                if (i > 0) buffer += " ";
                // nested values always print readably
                items.getReference(i).render(buffer, true);
            }
            buffer += (type == List) ? ")" : "]";
        }
            break;
        case Map: {
            buffer += "{";
            const juce::Array<ExprValue>& keys = getKeys();
            const juce::Array<ExprValue>& values = getValues();
            for (int i = 0 ; i < keys.size() ; i++) {
                if (i > 0) buffer += ", ";
                keys.getReference(i).render(buffer, true);
                buffer += " ";
                values.getReference(i).render(buffer, true);
            }
            buffer += "}";
        }
            break;
        case Function: {
            ExprFunction* f = getFunction();
            juce::String name = f->name;
            if (name.length() == 0) name = "fn";
            buffer += (f->macro ? "#macro[" : "#function[") + name + "]";
        }
            break;
        case Atom:
            buffer += "#atom[";
            getAtom()->deref().render(buffer, true);
            buffer += "]";
            break;
        case Object:
            buffer += getObject()->describe();
            break;
    }
}
