/**
 * The universal value of the expression language.
 *
 * An ExprValue is a small copyable object.  Scalars (nil, booleans,
 * numbers) live inline, strings, keywords and symbols share a juce::String,
 * and everything larger (lists, vectors, maps, functions, atoms, and
 * objects from the host application) is a reference counted cell.
 * Collections are immutable once built so values may be copied freely
 * and handed between threads, the only mutable thing is an atom.
 *
 * Forms produced by the reader are ExprValues too.  Symbols, lists,
 * vectors and maps remember the line and column where they were read
 * so errors found later can point back into the source text.
 */

#pragma once

#include <JuceHeader.h>

class ExprValue
{
  public:

    enum Type {
        Nil,
        Bool,
        Int,
        Float,
        String,
        Keyword,
        Symbol,
        List,
        Vector,
        Map,
        Function,
        Atom,
        Object
    };

    ExprValue() {}
    ~ExprValue() {}

    static ExprValue fromBool(bool b);
    static ExprValue fromInt(juce::int64 i);
    static ExprValue fromFloat(double d);
    static ExprValue fromString(juce::String s);
    static ExprValue keyword(juce::String name);
    static ExprValue symbol(juce::String name, int line = 0, int column = 0);
    static ExprValue list(const juce::Array<ExprValue>& items, int line = 0, int column = 0);
    static ExprValue vector(const juce::Array<ExprValue>& items, int line = 0, int column = 0);
    // an empty map
    static ExprValue map();
    // a map from alternating keys and values, a later duplicate key wins
    static ExprValue map(const juce::Array<ExprValue>& keysAndValues, int line = 0, int column = 0);
    static ExprValue function(class ExprFunction* f);
    static ExprValue atom(const ExprValue& initial);
    static ExprValue object(class ExprObject* o);

    Type getType() const {return type;}
    const char* getTypeName() const;

    bool isNil() const {return type == Nil;}
    bool isBool() const {return type == Bool;}
    bool isInt() const {return type == Int;}
    bool isFloat() const {return type == Float;}
    bool isNumber() const {return (type == Int || type == Float);}
    bool isString() const {return type == String;}
    bool isKeyword() const {return type == Keyword;}
    bool isSymbol() const {return type == Symbol;}
    bool isSymbol(const char* name) const;
    bool isList() const {return type == List;}
    bool isVector() const {return type == Vector;}
    bool isSequential() const {return (type == List || type == Vector);}
    bool isMap() const {return type == Map;}
    bool isFunction() const {return type == Function;}
    bool isAtom() const {return type == Atom;}
    bool isObject() const {return type == Object;}

    // everything except nil and false
    bool isTruthy() const;

    bool getBool() const;
    juce::int64 getInt() const;
    double getFloat() const;
    // text of a string, keyword or symbol
    const juce::String& getName() const {return text;}

    //
    // Sequences
    //

    // items of a list or vector, empty for anything else
    const juce::Array<ExprValue>& getItems() const;

    // number of items, map entries, or string characters
    int size() const;
    bool isEmpty() const {return size() == 0;}

    // nil when out of range
    ExprValue get(int index) const;
    ExprValue first() const;
    // the items after the first as a list
    ExprValue rest() const;

    //
    // Maps
    //

    const juce::Array<ExprValue>& getKeys() const;
    const juce::Array<ExprValue>& getValues() const;
    bool containsKey(const ExprValue& key) const;
    bool lookup(const ExprValue& key, ExprValue& result) const;
    ExprValue lookup(const ExprValue& key) const;
    ExprValue assoc(const ExprValue& key, const ExprValue& value) const;
    ExprValue dissoc(const ExprValue& key) const;

    //
    // Cells
    //

    class ExprFunction* getFunction() const;
    class ExprAtom* getAtom() const;
    class ExprObject* getObject() const;

    int getLine() const {return line;}
    int getColumn() const {return column;}
    void setPosition(int l, int c);
    bool hasPosition() const {return line > 0;}

    bool equals(const ExprValue& other) const;
    bool operator==(const ExprValue& other) const {return equals(other);}
    bool operator!=(const ExprValue& other) const {return !equals(other);}

    // the text str would produce, strings are not quoted
    juce::String toString() const;
    // the text pr-str would produce, strings are quoted and escaped
    juce::String print() const;

  private:

    void render(juce::String& buffer, bool readable) const;

    Type type = Nil;
    bool boolValue = false;
    juce::int64 intValue = 0;
    double floatValue = 0.0;
    juce::String text;
    juce::ReferenceCountedObjectPtr<juce::ReferenceCountedObject> cell;
    int line = 0;
    int column = 0;
};

/**
 * Storage for lists and vectors.
 */
class ExprSeq : public juce::ReferenceCountedObject
{
  public:
    juce::Array<ExprValue> items;
};

/**
 * Storage for maps.  Entries stay in insertion order which is what
 * people expect when a small map is printed.  Expression maps are tiny
 * so linear search is fine.
 */
class ExprMapCell : public juce::ReferenceCountedObject
{
  public:
    juce::Array<ExprValue> keys;
    juce::Array<ExprValue> values;

    int indexOf(const ExprValue& key) const;
};

/**
 * Anything that may be called.
 * Native library functions and closures created by fn are the two
 * implementations.  A macro is a function flagged to be called by the
 * expander with unevaluated forms.
 */
class ExprFunction : public juce::ReferenceCountedObject
{
  public:

    ExprFunction() {}
    virtual ~ExprFunction() {}

    virtual ExprValue call(class ExprEvaluator* ev, const juce::Array<ExprValue>& args) = 0;

    juce::String name;
    bool macro = false;
};

/**
 * The one mutable thing.
 *
 * Used for the per-owner locals and the shared globals which are touched
 * from several device threads at once.  Reads and writes are done under
 * a lock.  swap! uses compareAndSet so the update function can run outside
 * the lock and be retried when someone else got there first.
 */
class ExprAtom : public juce::ReferenceCountedObject
{
  public:

    ExprAtom(const ExprValue& initial);
    ~ExprAtom();

    ExprValue deref();
    // read the value and the version it had
    ExprValue deref(juce::int64& version);
    void reset(const ExprValue& v);
    // install v only if the atom has not changed since version was read
    bool compareAndSet(juce::int64 version, const ExprValue& v);

  private:

    juce::CriticalSection lock;
    ExprValue value;
    juce::int64 version = 0;
};
