/**
 * Evaluation of forms.
 *
 * Errors are thrown as ExprException.  When one passes up through a
 * list form that has a position and the exception doesn't have one yet,
 * the position of that form is attached so the innermost form with
 * a known location is what gets reported.
 */

#include <JuceHeader.h>

#include "../util/Trace.h"

#include "ExprConstants.h"
#include "ExprValue.h"
#include "ExprObject.h"
#include "ExprError.h"
#include "ExprScope.h"
#include "ExprWorkspace.h"
#include "ExprEvaluator.h"

static const char* SpecialForms[] = {
    "quote",
    "if",
    "do",
    "let",
    "loop",
    "recur",
    "fn",
    "def",
    "defmacro",
    "try",
    "throw",
    nullptr
};

bool ExprEvaluator::isSpecialForm(const juce::String& name)
{
    for (int i = 0 ; SpecialForms[i] != nullptr ; i++) {
        if (name == SpecialForms[i])
          return true;
    }
    return false;
}

/**
 * .getBeatNumber is a method, . and .. are not.
 */
bool ExprEvaluator::isMethodName(const juce::String& name)
{
    return (name.length() > 1 && name.startsWithChar('.') && name[1] != '.');
}

ExprEvaluator::ExprEvaluator(ExprWorkspace* ws)
{
    workspace = ws;
}

ExprEvaluator::~ExprEvaluator()
{
}

/**
 * Keeps the depth counter honest when exceptions unwind.
 */
class ExprDepthGuard
{
  public:
    ExprDepthGuard(int& d) : depth(d) {depth++;}
    ~ExprDepthGuard() {depth--;}
  private:
    int& depth;
};

//////////////////////////////////////////////////////////////////////
//
// Eval
//
//////////////////////////////////////////////////////////////////////

ExprValue ExprEvaluator::eval(const ExprValue& form, ExprScope* scope)
{
    ExprValue result;

    switch (form.getType()) {

        case ExprValue::Symbol:
            result = evalSymbol(form, scope);
            break;

        case ExprValue::List:
            if (form.isEmpty()) {
                result = form;
            }
            else {
                ExprDepthGuard guard (depth);
                if (depth > ExprMaxEvalDepth)
                  throw ExprException("Stack overflow, expressions nested or recursing too deeply", form);
                try {
                    result = evalList(form, scope);
                }
                catch (ExprException& e) {
                    e.locate(form);
                    throw;
                }
            }
            break;

        case ExprValue::Vector: {
            juce::Array<ExprValue> items;
            for (auto item : form.getItems())
              items.add(eval(item, scope));
            result = ExprValue::vector(items);
        }
            break;

        case ExprValue::Map: {
            juce::Array<ExprValue> items;
            const juce::Array<ExprValue>& keys = form.getKeys();
            const juce::Array<ExprValue>& values = form.getValues();
            for (int i = 0 ; i < keys.size() ; i++) {
                items.add(eval(keys[i], scope));
                items.add(eval(values[i], scope));
            }
            result = ExprValue::map(items);
        }
            break;

        default:
            result = form;
            break;
    }

    return result;
}

ExprValue ExprEvaluator::evalBody(const juce::Array<ExprValue>& forms, int start, ExprScope* scope)
{
    ExprValue result;
    for (int i = start ; i < forms.size() ; i++)
      result = eval(forms.getReference(i), scope);
    return result;
}

ExprValue ExprEvaluator::evalSymbol(const ExprValue& form, ExprScope* scope)
{
    ExprValue result;
    const juce::String& name = form.getName();
    bool found = false;

    if (scope != nullptr)
      found = scope->lookup(name, result);

    if (!found && workspace != nullptr)
      found = workspace->lookup(name, result);

    if (!found)
      throw ExprException("Unable to resolve symbol: " + name + " in this context", form);

    return result;
}

ExprValue ExprEvaluator::evalList(const ExprValue& form, ExprScope* scope)
{
    ExprValue head = form.first();

    if (head.isSymbol()) {
        const juce::String& name = head.getName();
        if (name == "quote") {
            return form.get(1);
        }
        else if (name == "if") {
            return evalIf(form, scope);
        }
        else if (name == "do") {
            return evalBody(form.getItems(), 1, scope);
        }
        else if (name == "let") {
            return evalLet(form, scope);
        }
        else if (name == "loop") {
            return evalLoop(form, scope);
        }
        else if (name == "recur") {
            return evalRecur(form, scope);
        }
        else if (name == "fn") {
            return makeClosure(form, 1, scope);
        }
        else if (name == "def") {
            return evalDef(form, scope);
        }
        else if (name == "defmacro") {
            return evalDefmacro(form, scope);
        }
        else if (name == "try") {
            return evalTry(form, scope);
        }
        else if (name == "throw") {
            return evalThrow(form, scope);
        }
        else if (isMethodName(name)) {
            return evalMethod(form, scope);
        }
    }

    ExprValue function = eval(head, scope);

    juce::Array<ExprValue> args;
    const juce::Array<ExprValue>& items = form.getItems();
    for (int i = 1 ; i < items.size() ; i++)
      args.add(eval(items.getReference(i), scope));

    return apply(function, args);
}

//////////////////////////////////////////////////////////////////////
//
// Apply
//
//////////////////////////////////////////////////////////////////////

ExprValue ExprEvaluator::apply(const ExprValue& f, const juce::Array<ExprValue>& args)
{
    ExprValue result;

    switch (f.getType()) {

        case ExprValue::Function: {
            ExprDepthGuard guard (depth);
            if (depth > ExprMaxEvalDepth)
              throw ExprException("Stack overflow calling " + f.print());
            result = f.getFunction()->call(this, args);
        }
            break;

        case ExprValue::Keyword:
            // (:key map) and (:key map default)
            if (args.size() < 1 || args.size() > 2)
              throw ExprException("Wrong number of args (" + juce::String(args.size()) + ") passed to: " + f.print());
            if (!args[0].lookup(f, result) && args.size() > 1)
              result = args[1];
            break;

        case ExprValue::Map:
        case ExprValue::Vector:
            if (args.size() < 1 || args.size() > 2)
              throw ExprException("Wrong number of args (" + juce::String(args.size()) + ") passed to: " + f.print());
            if (!f.lookup(args[0], result)) {
                if (args.size() > 1)
                  result = args[1];
                else if (f.isVector())
                  throw ExprException("Index out of bounds: " + args[0].print());
            }
            break;

        default:
            throw ExprException(juce::String(f.getTypeName()) + " " + f.print() + " cannot be called as a function");
    }

    return result;
}

//////////////////////////////////////////////////////////////////////
//
// Special forms
//
//////////////////////////////////////////////////////////////////////

ExprValue ExprEvaluator::evalIf(const ExprValue& form, ExprScope* scope)
{
    if (form.size() < 3)
      throw ExprException("Too few arguments to if", form);
    if (form.size() > 4)
      throw ExprException("Too many arguments to if", form);

    ExprValue test = eval(form.get(1), scope);
    if (test.isTruthy())
      return eval(form.get(2), scope);
    return eval(form.get(3), scope);
}

void ExprEvaluator::checkBindings(const ExprValue& form, const ExprValue& bindings)
{
    juce::String name = form.first().getName();
    if (!bindings.isVector())
      throw ExprException(name + " requires a vector for its binding", form);
    if ((bindings.size() % 2) != 0)
      throw ExprException(name + " requires an even number of forms in binding vector", bindings);
}

ExprValue ExprEvaluator::evalLet(const ExprValue& form, ExprScope* scope)
{
    ExprValue bindings = form.get(1);
    checkBindings(form, bindings);

    ExprScope::Ptr current = scope;
    const juce::Array<ExprValue>& items = bindings.getItems();
    for (int i = 0 ; i < items.size() ; i += 2) {
        ExprValue value = eval(items.getReference(i + 1), current.get());
        ExprScope::Ptr next = new ExprScope(current.get());
        bindPattern(items.getReference(i), value, next.get());
        current = next;
    }

    return evalBody(form.getItems(), 2, current.get());
}

ExprValue ExprEvaluator::evalLoop(const ExprValue& form, ExprScope* scope)
{
    ExprValue bindings = form.get(1);
    checkBindings(form, bindings);

    juce::Array<ExprValue> patterns;
    ExprScope::Ptr current = scope;
    const juce::Array<ExprValue>& items = bindings.getItems();
    for (int i = 0 ; i < items.size() ; i += 2) {
        ExprValue value = eval(items.getReference(i + 1), current.get());
        ExprScope::Ptr next = new ExprScope(current.get());
        bindPattern(items.getReference(i), value, next.get());
        patterns.add(items.getReference(i));
        current = next;
    }

    while (true) {
        juce::Array<ExprValue> recurArgs;
        try {
            return evalBody(form.getItems(), 2, current.get());
        }
        catch (ExprRecur& r) {
            recurArgs = r.args;
        }

        if (recurArgs.size() != patterns.size())
          throw ExprException("Mismatched argument count to recur, expected: " + juce::String(patterns.size()) +
                              " args, got: " + juce::String(recurArgs.size()), form);

        current = new ExprScope(scope);
        for (int i = 0 ; i < patterns.size() ; i++)
          bindPattern(patterns[i], recurArgs[i], current.get());
    }
}

ExprValue ExprEvaluator::evalRecur(const ExprValue& form, ExprScope* scope)
{
    ExprRecur recur;
    const juce::Array<ExprValue>& items = form.getItems();
    for (int i = 1 ; i < items.size() ; i++)
      recur.args.add(eval(items.getReference(i), scope));
    throw recur;
}

/**
 * (def name) (def name value) (def name "doc" value)
 * Returns the var-ish symbol #'name the way a REPL would show it.
 */
ExprValue ExprEvaluator::evalDef(const ExprValue& form, ExprScope* scope)
{
    ExprValue name = form.get(1);
    if (!name.isSymbol())
      throw ExprException("First argument to def must be a Symbol", form);
    if (form.size() > 4)
      throw ExprException("Too many arguments to def", form);

    if (form.size() == 2) {
        // like declare, only establishes the name
        if (!workspace->isDefined(name.getName()))
          workspace->define(name.getName(), ExprValue());
    }
    else {
        ExprValue init = form.get(form.size() - 1);
        ExprValue value;
        if (init.isList() && init.first().isSymbol("fn")) {
            // name only a closure made here, an existing function may be shared
            value = makeClosure(init, 1, scope);
            ExprFunction* f = value.getFunction();
            if (f->name.length() == 0)
              f->name = name.getName();
        }
        else {
            value = eval(init, scope);
        }
        workspace->define(name.getName(), value);
        Trace(3, "ExprEvaluator: Defined %s", name.getName().toUTF8());
    }

    return ExprValue::symbol("#'" + name.getName());
}

/**
 * (defmacro name "doc"? [params] body...)
 */
ExprValue ExprEvaluator::evalDefmacro(const ExprValue& form, ExprScope* scope)
{
    ExprValue name = form.get(1);
    if (!name.isSymbol())
      throw ExprException("First argument to defmacro must be a Symbol", form);

    int start = 2;
    if (form.get(start).isString() && form.size() > start + 1)
      start++;

    ExprValue macro = makeClosure(form, start, scope);
    ExprFunction* f = macro.getFunction();
    f->name = name.getName();
    f->macro = true;
    workspace->define(name.getName(), macro);

    return ExprValue::symbol("#'" + name.getName());
}

/**
 * (try body... (catch Class e handler...)... (finally cleanup...))
 *
 * The class in a catch clause may be any of the exception classes,
 * every failure is an Exception so the first catch clause whose class
 * matches the thrown value wins.
 */
ExprValue ExprEvaluator::evalTry(const ExprValue& form, ExprScope* scope)
{
    juce::Array<ExprValue> body;
    juce::Array<ExprValue> catches;
    ExprValue finally;

    const juce::Array<ExprValue>& items = form.getItems();
    for (int i = 1 ; i < items.size() ; i++) {
        const ExprValue& item = items.getReference(i);
        if (item.isList() && item.first().isSymbol("catch")) {
            if (item.size() < 3 || !item.get(2).isSymbol())
              throw ExprException("Malformed catch clause, expecting (catch Class name body...)", item);
            catches.add(item);
        }
        else if (item.isList() && item.first().isSymbol("finally")) {
            finally = item;
        }
        else {
            if (catches.size() > 0 || !finally.isNil())
              throw ExprException("Only catch or finally clause can follow catch in try expression", item);
            body.add(item);
        }
    }

    ExprValue result;
    try {
        try {
            result = evalBody(body, 0, scope);
        }
        catch (ExprException& e) {
            ExprThrowable* thrown = new ExprThrowable(e);
            ExprValue thrownValue = ExprValue::object(thrown);

            ExprValue handler;
            for (auto clause : catches) {
                juce::String className = clause.get(1).getName();
                if (thrown->isInstance(className)) {
                    handler = clause;
                    break;
                }
            }

            if (handler.isNil())
              throw;

            ExprScope::Ptr handlerScope = new ExprScope(scope);
            handlerScope->bind(handler.get(2).getName(), thrownValue);
            result = evalBody(handler.getItems(), 3, handlerScope.get());
        }
    }
    catch (...) {
        // run the cleanup for anything passing through, including recur
        if (!finally.isNil())
          (void)evalBody(finally.getItems(), 1, scope);
        throw;
    }

    if (!finally.isNil())
      (void)evalBody(finally.getItems(), 1, scope);

    return result;
}

ExprValue ExprEvaluator::evalThrow(const ExprValue& form, ExprScope* scope)
{
    if (form.size() != 2)
      throw ExprException("throw requires exactly one argument", form);

    ExprValue value = eval(form.get(1), scope);
    ExprObject* obj = value.getObject();
    ExprThrowable* thrown = dynamic_cast<ExprThrowable*>(obj);
    if (thrown != nullptr) {
        ExprException ex = thrown->toException();
        ex.locate(form);
        throw ex;
    }
    else if (value.isString()) {
        throw ExprException(value.getName(), form);
    }

    throw ExprException("Cannot throw " + value.print() + ", use ex-info to make an exception", form);
}

//////////////////////////////////////////////////////////////////////
//
// Functions
//
//////////////////////////////////////////////////////////////////////

ExprClosure::Arity* ExprEvaluator::parseArity(const ExprValue& params, const ExprValue& form, int bodyStart)
{
    if (!params.isVector())
      throw ExprException("Parameter declaration must be a vector", form);

    ExprClosure::Arity* arity = new ExprClosure::Arity();
    const juce::Array<ExprValue>& items = params.getItems();
    for (int i = 0 ; i < items.size() ; i++) {
        const ExprValue& p = items.getReference(i);
        if (p.isSymbol("&")) {
            if (i + 2 != items.size()) {
                delete arity;
                throw ExprException("Exactly one parameter may follow & in a parameter list", params);
            }
            arity->variadic = true;
            arity->restParam = items.getReference(i + 1);
            break;
        }
        arity->params.add(p);
    }

    const juce::Array<ExprValue>& formItems = form.getItems();
    for (int i = bodyStart ; i < formItems.size() ; i++)
      arity->body.add(formItems.getReference(i));

    return arity;
}

/**
 * The parts of a fn form starting at start:
 *
 *     name? [params] body...
 *     name? ([params] body...) ([params] body...)
 */
ExprValue ExprEvaluator::makeClosure(const ExprValue& form, int start, ExprScope* scope)
{
    ExprClosure* closure = new ExprClosure();
    // owned by the value from here on so an exception cleans it up
    ExprValue result = ExprValue::function(closure);
    closure->scope = scope;

    int index = start;
    ExprValue first = form.get(index);
    if (first.isSymbol()) {
        closure->name = first.getName();
        closure->selfNamed = true;
        index++;
        first = form.get(index);
    }

    if (first.isVector()) {
        closure->arities.add(parseArity(first, form, index + 1));
    }
    else if (first.isList()) {
        const juce::Array<ExprValue>& items = form.getItems();
        for (int i = index ; i < items.size() ; i++) {
            const ExprValue& clause = items.getReference(i);
            if (!clause.isList())
              throw ExprException("Expected a ([params] body...) clause in fn", form);
            closure->arities.add(parseArity(clause.first(), clause, 1));
        }
    }
    else {
        throw ExprException("fn requires a parameter vector", form);
    }

    return result;
}

ExprClosure::Arity* ExprClosure::findArity(int count)
{
    Arity* found = nullptr;
    // exact fixed arities win over variadic ones
    for (auto arity : arities) {
        if (!arity->variadic && arity->params.size() == count) {
            found = arity;
            break;
        }
    }
    if (found == nullptr) {
        for (auto arity : arities) {
            if (arity->variadic && count >= arity->params.size()) {
                found = arity;
                break;
            }
        }
    }
    return found;
}

void ExprClosure::bindArgs(ExprEvaluator* ev, Arity* arity, const juce::Array<ExprValue>& args, ExprScope* dest)
{
    for (int i = 0 ; i < arity->params.size() ; i++)
      ev->bindPattern(arity->params[i], args[i], dest);

    if (arity->variadic) {
        ExprValue rest;
        if (args.size() > arity->params.size()) {
            juce::Array<ExprValue> remainder;
            for (int i = arity->params.size() ; i < args.size() ; i++)
              remainder.add(args[i]);
            rest = ExprValue::list(remainder);
        }
        ev->bindPattern(arity->restParam, rest, dest);
    }
}

ExprValue ExprClosure::call(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    Arity* arity = findArity(args.size());
    if (arity == nullptr) {
        juce::String fname = (name.length() > 0) ? name : juce::String("fn");
        throw ExprException("Wrong number of args (" + juce::String(args.size()) + ") passed to: " + fname);
    }

    ExprScope::Ptr callScope = new ExprScope(scope.get());
    if (selfNamed)
      callScope->bind(name, ExprValue::function(this));
    bindArgs(ev, arity, args, callScope.get());

    while (true) {
        juce::Array<ExprValue> recurArgs;
        try {
            return ev->evalBody(arity->body, 0, callScope.get());
        }
        catch (ExprRecur& r) {
            recurArgs = r.args;
        }

        // recur in a variadic function passes the rest sequence directly
        int expected = arity->params.size() + (arity->variadic ? 1 : 0);
        if (recurArgs.size() != expected)
          throw ExprException("Mismatched argument count to recur, expected: " + juce::String(expected) +
                              " args, got: " + juce::String(recurArgs.size()));

        callScope = new ExprScope(scope.get());
        if (selfNamed)
          callScope->bind(name, ExprValue::function(this));
        for (int i = 0 ; i < arity->params.size() ; i++)
          ev->bindPattern(arity->params[i], recurArgs[i], callScope.get());
        if (arity->variadic)
          ev->bindPattern(arity->restParam, recurArgs[expected - 1], callScope.get());
    }
}

//////////////////////////////////////////////////////////////////////
//
// Destructuring
//
//////////////////////////////////////////////////////////////////////

juce::Array<ExprValue> ExprEvaluator::toItems(const ExprValue& value)
{
    juce::Array<ExprValue> items;
    switch (value.getType()) {
        case ExprValue::Nil:
            break;
        case ExprValue::List:
        case ExprValue::Vector:
            items = value.getItems();
            break;
        case ExprValue::String: {
            juce::String s = value.getName();
            for (auto p = s.getCharPointer() ; !p.isEmpty() ; )
              items.add(ExprValue::fromString(juce::String::charToString(p.getAndAdvance())));
        }
            break;
        case ExprValue::Map: {
            const juce::Array<ExprValue>& keys = value.getKeys();
            const juce::Array<ExprValue>& values = value.getValues();
            for (int i = 0 ; i < keys.size() ; i++) {
                juce::Array<ExprValue> entry;
                entry.add(keys[i]);
                entry.add(values[i]);
                items.add(ExprValue::vector(entry));
            }
        }
            break;
        default:
            throw ExprException("Don't know how to create a sequence from: " + juce::String(value.getTypeName()));
    }
    return items;
}

void ExprEvaluator::bindPattern(const ExprValue& pattern, const ExprValue& value, ExprScope* scope)
{
    if (pattern.isSymbol()) {
        scope->bind(pattern.getName(), value);
    }
    else if (pattern.isVector()) {
        bindSequence(pattern, value, scope);
    }
    else if (pattern.isMap()) {
        bindMap(pattern, value, scope);
    }
    else {
        throw ExprException("Unsupported binding form: " + pattern.print(), pattern);
    }
}

/**
 * [a b & more :as all]
 */
void ExprEvaluator::bindSequence(const ExprValue& pattern, const ExprValue& value, ExprScope* scope)
{
    juce::Array<ExprValue> items = toItems(value);
    const juce::Array<ExprValue>& parts = pattern.getItems();
    int position = 0;

    for (int i = 0 ; i < parts.size() ; i++) {
        const ExprValue& part = parts.getReference(i);
        if (part.isSymbol("&")) {
            ExprValue rest;
            if (position < items.size()) {
                juce::Array<ExprValue> remainder;
                for (int j = position ; j < items.size() ; j++)
                  remainder.add(items[j]);
                rest = ExprValue::list(remainder);
            }
            bindPattern(parts[i + 1], rest, scope);
            i++;
        }
        else if (part.isKeyword() && part.getName() == "as") {
            bindPattern(parts[i + 1], value, scope);
            i++;
        }
        else {
            bindPattern(part, (position < items.size()) ? items[position] : ExprValue(), scope);
            position++;
        }
    }
}

/**
 * {:keys [a b] :strs [c] :or {a 1} :as m  sym :key}
 */
void ExprEvaluator::bindMap(const ExprValue& pattern, const ExprValue& value, ExprScope* scope)
{
    ExprValue source = value;
    if (value.isSequential()) {
        // keyword arguments arriving as a rest sequence
        source = ExprValue::map(value.getItems());
    }

    ExprValue defaults = pattern.lookup(ExprValue::keyword("or"));

    const juce::Array<ExprValue>& keys = pattern.getKeys();
    const juce::Array<ExprValue>& values = pattern.getValues();

    for (int i = 0 ; i < keys.size() ; i++) {
        const ExprValue& key = keys.getReference(i);
        const ExprValue& target = values.getReference(i);

        if (key.isKeyword() && (key.getName() == "keys" || key.getName() == "strs")) {
            bool strings = (key.getName() == "strs");
            for (auto sym : target.getItems()) {
                juce::String name = sym.getName();
                // namespaced keys bind the unqualified name
                juce::String local = name.fromLastOccurrenceOf("/", false, false);
                ExprValue lookupKey = strings ? ExprValue::fromString(name) : ExprValue::keyword(name);
                ExprValue found;
                if (!source.lookup(lookupKey, found)) {
                    ExprValue fallback;
                    if (defaults.lookup(ExprValue::symbol(local), fallback))
                      found = eval(fallback, scope);
                }
                scope->bind(local, found);
            }
        }
        else if (key.isKeyword() && key.getName() == "as") {
            bindPattern(target, value, scope);
        }
        else if (key.isKeyword() && key.getName() == "or") {
            // consulted above
        }
        else {
            ExprValue found;
            if (!source.lookup(target, found) && key.isSymbol()) {
                ExprValue fallback;
                if (defaults.lookup(key, fallback))
                  found = eval(fallback, scope);
            }
            bindPattern(key, found, scope);
        }
    }
}

//////////////////////////////////////////////////////////////////////
//
// Methods
//
//////////////////////////////////////////////////////////////////////

ExprValue ExprEvaluator::evalMethod(const ExprValue& form, ExprScope* scope)
{
    if (form.size() < 2)
      throw ExprException("Malformed member expression, expecting (.member target ...)", form);

    juce::String method = form.first().getName().substring(1);
    ExprValue target = eval(form.get(1), scope);

    juce::Array<ExprValue> args;
    const juce::Array<ExprValue>& items = form.getItems();
    for (int i = 2 ; i < items.size() ; i++)
      args.add(eval(items.getReference(i), scope));

    return invokeMethod(method, target, args);
}

ExprValue ExprEvaluator::invokeMethod(const juce::String& method, const ExprValue& target,
                                      const juce::Array<ExprValue>& args)
{
    ExprValue result;
    bool found = false;

    if (target.isNil())
      throw ExprException("Cannot invoke method ." + method + " on nil");

    ExprObject* obj = target.getObject();
    if (obj != nullptr) {
        found = obj->invoke(method, args, result);
        if (!found)
          throw ExprException("No method ." + method + " found for class " + obj->getClassName());
    }
    else {
        result = invokeBuiltinMethod(method, target, args, found);
        if (!found)
          throw ExprException("No method ." + method + " found for " + juce::String(target.getTypeName()));
    }

    return result;
}

/**
 * The handful of methods people reach for on ordinary values
 * out of habit.
 */
ExprValue ExprEvaluator::invokeBuiltinMethod(const juce::String& method, const ExprValue& target,
                                             const juce::Array<ExprValue>& args, bool& found)
{
    ExprValue result;
    found = true;

    if (target.isString()) {
        const juce::String& s = target.getName();
        juce::String arg = args.size() > 0 ? args[0].toString() : juce::String();
        if (method == "length") result = ExprValue::fromInt(s.length());
        else if (method == "toUpperCase") result = ExprValue::fromString(s.toUpperCase());
        else if (method == "toLowerCase") result = ExprValue::fromString(s.toLowerCase());
        else if (method == "trim") result = ExprValue::fromString(s.trim());
        else if (method == "isEmpty") result = ExprValue::fromBool(s.isEmpty());
        else if (method == "contains") result = ExprValue::fromBool(s.contains(arg));
        else if (method == "startsWith") result = ExprValue::fromBool(s.startsWith(arg));
        else if (method == "endsWith") result = ExprValue::fromBool(s.endsWith(arg));
        else if (method == "indexOf") result = ExprValue::fromInt(s.indexOf(arg));
        else if (method == "equals") result = ExprValue::fromBool(args.size() > 0 && target.equals(args[0]));
        else if (method == "substring" && args.size() == 1)
          result = ExprValue::fromString(s.substring((int)args[0].getInt()));
        else if (method == "substring" && args.size() == 2)
          result = ExprValue::fromString(s.substring((int)args[0].getInt(), (int)args[1].getInt()));
        else found = false;
    }
    else if (target.isNumber()) {
        if (method == "intValue" || method == "longValue") result = ExprValue::fromInt(target.getInt());
        else if (method == "doubleValue" || method == "floatValue") result = ExprValue::fromFloat(target.getFloat());
        else found = false;
    }
    else if (target.isSequential() || target.isMap()) {
        if (method == "size") result = ExprValue::fromInt(target.size());
        else if (method == "isEmpty") result = ExprValue::fromBool(target.isEmpty());
        else if (method == "get" && args.size() == 1) result = target.lookup(args[0]);
        else found = false;
    }
    else if (target.isAtom()) {
        if (method == "deref" || method == "get") result = target.getAtom()->deref();
        else found = false;
    }
    else if (target.isKeyword() || target.isSymbol()) {
        if (method == "getName") result = ExprValue::fromString(target.getName());
        else found = false;
    }
    else {
        found = false;
    }
    return result;
}
