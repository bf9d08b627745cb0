
#include <JuceHeader.h>

#include "../util/Trace.h"

#include "ExprValue.h"
#include "ExprError.h"
#include "ExprWorkspace.h"
#include "ExprEvaluator.h"
#include "ExprLinker.h"

/**
 * Restores the local name list when a scope ends, including
 * when an error unwinds through it.
 */
class ExprLocalMark
{
  public:
    ExprLocalMark(juce::StringArray& l) : locals(l), size(l.size()) {}
    ~ExprLocalMark() {locals.removeRange(size, locals.size() - size);}
  private:
    juce::StringArray& locals;
    int size;
};

ExprLinker::ExprLinker(ExprWorkspace* ws)
{
    workspace = ws;
}

void ExprLinker::link(const ExprValue& form, const juce::StringArray& initialLocals)
{
    locals = initialLocals;
    recurTargets = 0;
    link(form, false);
}

void ExprLinker::addPatternNames(const ExprValue& pattern, juce::StringArray& names)
{
    if (pattern.isSymbol()) {
        if (pattern.getName() != "&")
          names.add(pattern.getName());
    }
    else if (pattern.isVector()) {
        const juce::Array<ExprValue>& items = pattern.getItems();
        for (int i = 0 ; i < items.size() ; i++) {
            if (items[i].isKeyword() && items[i].getName() == "as") {
                addPatternNames(items[i + 1], names);
                i++;
            }
            else {
                addPatternNames(items[i], names);
            }
        }
    }
    else if (pattern.isMap()) {
        const juce::Array<ExprValue>& keys = pattern.getKeys();
        const juce::Array<ExprValue>& values = pattern.getValues();
        for (int i = 0 ; i < keys.size() ; i++) {
            const ExprValue& key = keys[i];
            if (key.isKeyword()) {
                const juce::String& option = key.getName();
                if (option == "keys" || option == "strs" || option == "syms") {
                    for (auto name : values[i].getItems())
                      names.add(name.getName());
                }
                else if (option == "as") {
                    addPatternNames(values[i], names);
                }
                // :or supplies defaults for names bound elsewhere
            }
            else {
                addPatternNames(key, names);
            }
        }
    }
}

//////////////////////////////////////////////////////////////////////
//
// Walk
//
//////////////////////////////////////////////////////////////////////

void ExprLinker::link(const ExprValue& form, bool tail)
{
    switch (form.getType()) {
        case ExprValue::Symbol:
            linkSymbol(form);
            break;
        case ExprValue::List:
            if (!form.isEmpty()) {
                try {
                    linkList(form, tail);
                }
                catch (ExprException& e) {
                    e.locate(form);
                    throw;
                }
            }
            break;
        case ExprValue::Vector:
            for (auto item : form.getItems())
              link(item, false);
            break;
        case ExprValue::Map:
            for (auto key : form.getKeys())
              link(key, false);
            for (auto value : form.getValues())
              link(value, false);
            break;
        default:
            break;
    }
}

void ExprLinker::linkSymbol(const ExprValue& form)
{
    const juce::String& name = form.getName();
    bool resolved = (locals.contains(name) ||
                     declared.contains(name) ||
                     (workspace != nullptr && workspace->isDefined(name)));
    if (!resolved)
      throw ExprException("Unable to resolve symbol: " + name + " in this context", form);
}

void ExprLinker::linkBody(const juce::Array<ExprValue>& forms, int start, bool tail)
{
    for (int i = start ; i < forms.size() ; i++)
      link(forms[i], tail && (i == forms.size() - 1));
}

void ExprLinker::linkList(const ExprValue& form, bool tail)
{
    ExprValue head = form.first();
    const juce::Array<ExprValue>& items = form.getItems();

    if (head.isSymbol()) {
        const juce::String& name = head.getName();
        if (name == "quote") {
            return;
        }
        else if (name == "if") {
            link(form.get(1), false);
            for (int i = 2 ; i < items.size() ; i++)
              link(items[i], tail);
            return;
        }
        else if (name == "do") {
            linkBody(items, 1, tail);
            return;
        }
        else if (name == "let") {
            linkBindings(form, false);
            return;
        }
        else if (name == "loop") {
            linkBindings(form, true);
            return;
        }
        else if (name == "recur") {
            linkRecur(form, tail);
            return;
        }
        else if (name == "fn") {
            linkFunction(form, 1, true);
            return;
        }
        else if (name == "def") {
            linkDef(form);
            return;
        }
        else if (name == "defmacro") {
            if (form.get(1).isSymbol())
              declared.add(form.get(1).getName());
            linkFunction(form, 2, false);
            return;
        }
        else if (name == "try") {
            linkTry(form);
            return;
        }
        else if (name == "throw") {
            linkBody(items, 1, false);
            return;
        }
        else if (ExprEvaluator::isMethodName(name)) {
            linkBody(items, 1, false);
            return;
        }
    }

    linkBody(items, 0, false);
}

/**
 * Each value sees the names bound before it.
 */
void ExprLinker::linkBindings(const ExprValue& form, bool isLoop)
{
    ExprValue bindings = form.get(1);
    if (!bindings.isVector())
      throw ExprException(form.first().getName() + " requires a vector for its binding", form);
    if ((bindings.size() % 2) != 0)
      throw ExprException(form.first().getName() + " requires an even number of forms in binding vector", bindings);

    ExprLocalMark mark (locals);
    const juce::Array<ExprValue>& pairs = bindings.getItems();
    for (int i = 0 ; i < pairs.size() ; i += 2) {
        link(pairs[i + 1], false);
        addPatternNames(pairs[i], locals);
    }

    if (isLoop) {
        recurTargets++;
        try {
            linkBody(form.getItems(), 2, true);
        }
        catch (ExprException&) {
            recurTargets--;
            throw;
        }
        recurTargets--;
    }
    else {
        linkBody(form.getItems(), 2, true);
    }
}

/**
 * (fn name? [params] body...) or (fn name? ([params] body...)...)
 * For defmacro start is past the name and named is false.
 */
void ExprLinker::linkFunction(const ExprValue& form, int start, bool named)
{
    ExprLocalMark mark (locals);
    const juce::Array<ExprValue>& items = form.getItems();
    int index = start;

    if (named && form.get(index).isSymbol()) {
        locals.add(form.get(index).getName());
        index++;
    }
    // defmacro docstring
    if (!named && form.get(index).isString() && form.size() > index + 1)
      index++;

    ExprValue first = form.get(index);
    if (first.isVector()) {
        linkArity(first, items, index + 1);
    }
    else {
        for (int i = index ; i < items.size() ; i++) {
            const ExprValue& clause = items[i];
            if (clause.isList() && clause.first().isVector())
              linkArity(clause.first(), clause.getItems(), 1);
            else
              throw ExprException("Expected a ([params] body...) clause in fn", form);
        }
    }
}

void ExprLinker::linkArity(const ExprValue& params, const juce::Array<ExprValue>& body, int start)
{
    ExprLocalMark mark (locals);
    for (auto p : params.getItems())
      addPatternNames(p, locals);

    // a fn body is its own recur target, enclosing loops don't count
    int saved = recurTargets;
    recurTargets = 1;
    try {
        linkBody(body, start, true);
    }
    catch (ExprException&) {
        recurTargets = saved;
        throw;
    }
    recurTargets = saved;
}

/**
 * The name is visible to the value so recursive functions work.
 */
void ExprLinker::linkDef(const ExprValue& form)
{
    ExprValue name = form.get(1);
    if (!name.isSymbol())
      throw ExprException("First argument to def must be a Symbol", form);
    declared.addIfNotAlreadyThere(name.getName());
    if (form.size() > 2)
      link(form.get(form.size() - 1), false);
}

/**
 * recur may not cross a try so nothing inside is in tail position.
 */
void ExprLinker::linkTry(const ExprValue& form)
{
    const juce::Array<ExprValue>& items = form.getItems();
    for (int i = 1 ; i < items.size() ; i++) {
        const ExprValue& item = items[i];
        if (item.isList() && item.first().isSymbol("catch")) {
            ExprLocalMark mark (locals);
            if (item.get(2).isSymbol())
              locals.add(item.get(2).getName());
            linkBody(item.getItems(), 3, false);
        }
        else if (item.isList() && item.first().isSymbol("finally")) {
            linkBody(item.getItems(), 1, false);
        }
        else {
            link(item, false);
        }
    }
}

void ExprLinker::linkRecur(const ExprValue& form, bool tail)
{
    if (recurTargets == 0)
      throw ExprException("recur outside of loop or fn", form);
    if (!tail)
      throw ExprException("Can only recur from tail position", form);
    linkBody(form.getItems(), 1, false);
}
