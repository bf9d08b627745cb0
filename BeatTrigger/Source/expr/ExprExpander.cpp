/**
 * Macro expansion.
 *
 * The generated forms are given the position of the macro call they
 * replace so errors raised while evaluating them still point at
 * something the user wrote.
 */

#include <JuceHeader.h>

#include <initializer_list>

#include "../util/Trace.h"

#include "ExprConstants.h"
#include "ExprValue.h"
#include "ExprError.h"
#include "ExprParser.h"
#include "ExprWorkspace.h"
#include "ExprEvaluator.h"
#include "ExprExpander.h"

static const char* BuiltinMacros[] = {
    "defn",
    "defn-",
    "when",
    "when-not",
    "when-let",
    "if-let",
    "if-not",
    "cond",
    "case",
    "and",
    "or",
    "->",
    "->>",
    "declare",
    "comment",
    "dotimes",
    "doseq",
    nullptr
};

bool ExprExpander::isBuiltinMacro(const juce::String& name)
{
    for (int i = 0 ; BuiltinMacros[i] != nullptr ; i++) {
        if (name == BuiltinMacros[i])
          return true;
    }
    return false;
}

ExprExpander::ExprExpander(ExprWorkspace* ws, ExprEvaluator* ev)
{
    workspace = ws;
    evaluator = ev;
}

ExprExpander::~ExprExpander()
{
}

//////////////////////////////////////////////////////////////////////
//
// Form construction
//
//////////////////////////////////////////////////////////////////////

static ExprValue sym(const char* name)
{
    return ExprValue::symbol(name);
}

/**
 * A list positioned where the macro call was.
 */
static ExprValue listAt(const ExprValue& origin, std::initializer_list<ExprValue> items)
{
    juce::Array<ExprValue> array;
    for (auto& item : items)
      array.add(item);
    return ExprValue::list(array, origin.getLine(), origin.getColumn());
}

static ExprValue listAt(const ExprValue& origin, const juce::Array<ExprValue>& items)
{
    return ExprValue::list(items, origin.getLine(), origin.getColumn());
}

static ExprValue vectorOf(std::initializer_list<ExprValue> items)
{
    juce::Array<ExprValue> array;
    for (auto& item : items)
      array.add(item);
    return ExprValue::vector(array);
}

/**
 * (do forms...) from the items of form starting at start
 */
static ExprValue doBody(const ExprValue& form, int start)
{
    juce::Array<ExprValue> items;
    items.add(sym("do"));
    const juce::Array<ExprValue>& all = form.getItems();
    for (int i = start ; i < all.size() ; i++)
      items.add(all[i]);
    return listAt(form, items);
}

static ExprValue gensym(const char* prefix)
{
    return ExprValue::symbol(ExprParser::gensym(prefix));
}

static void requireArgs(const ExprValue& form, int min, const char* usage)
{
    if (form.size() < min)
      throw ExprException("Wrong number of args passed to macro " + form.first().getName() +
                          ", expecting " + usage, form);
}

//////////////////////////////////////////////////////////////////////
//
// Walking
//
//////////////////////////////////////////////////////////////////////

ExprValue ExprExpander::expandAll(const ExprValue& form)
{
    ExprValue result;
    switch (form.getType()) {
        case ExprValue::List:
            result = expandList(form);
            break;

        case ExprValue::Vector: {
            juce::Array<ExprValue> items;
            for (auto item : form.getItems())
              items.add(expandAll(item));
            result = ExprValue::vector(items, form.getLine(), form.getColumn());
        }
            break;

        case ExprValue::Map: {
            juce::Array<ExprValue> items;
            const juce::Array<ExprValue>& keys = form.getKeys();
            const juce::Array<ExprValue>& values = form.getValues();
            for (int i = 0 ; i < keys.size() ; i++) {
                items.add(expandAll(keys[i]));
                items.add(expandAll(values[i]));
            }
            result = ExprValue::map(items, form.getLine(), form.getColumn());
        }
            break;

        default:
            result = form;
            break;
    }
    return result;
}

ExprValue ExprExpander::expandList(const ExprValue& form)
{
    if (form.isEmpty())
      return form;

    ExprValue current = form;
    ExprValue expanded;
    int count = 0;
    while (expandOnce(current, expanded)) {
        count++;
        if (count > ExprMaxExpansions)
          throw ExprException("Macro expansion of " + form.first().getName() + " did not terminate", form);
        current = expanded;
        if (!current.isList() || current.isEmpty())
          return expandAll(current);
    }

    ExprValue head = current.first();
    if (head.isSymbol()) {
        const juce::String& name = head.getName();
        if (name == "quote")
          return current;
        else if (name == "let" || name == "loop")
          return expandBindingForm(current);
        else if (name == "fn")
          return expandFn(current, 1);
        else if (name == "defmacro")
          return expandFn(current, 1);
        else if (name == "def")
          return expandDef(current);
        else if (name == "try")
          return expandTry(current);
    }

    return expandItems(current, 0);
}

/**
 * Expand the items from start on, keeping the ones before it.
 */
ExprValue ExprExpander::expandItems(const ExprValue& form, int start)
{
    juce::Array<ExprValue> items;
    const juce::Array<ExprValue>& all = form.getItems();
    for (int i = 0 ; i < all.size() ; i++)
      items.add((i < start) ? all[i] : expandAll(all[i]));
    return ExprValue::list(items, form.getLine(), form.getColumn());
}

/**
 * (let [pattern value ...] body...)
 * Only the value positions and the body are expanded.
 */
ExprValue ExprExpander::expandBindingForm(const ExprValue& form)
{
    ExprValue bindings = form.get(1);
    if (!bindings.isVector())
      return expandItems(form, 2);

    juce::Array<ExprValue> expandedBindings;
    const juce::Array<ExprValue>& pairs = bindings.getItems();
    for (int i = 0 ; i < pairs.size() ; i++)
      expandedBindings.add(((i % 2) == 0) ? pairs[i] : expandAll(pairs[i]));

    juce::Array<ExprValue> items;
    items.add(form.first());
    items.add(ExprValue::vector(expandedBindings, bindings.getLine(), bindings.getColumn()));
    const juce::Array<ExprValue>& all = form.getItems();
    for (int i = 2 ; i < all.size() ; i++)
      items.add(expandAll(all[i]));
    return ExprValue::list(items, form.getLine(), form.getColumn());
}

/**
 * (fn name? [params] body...) and (fn name? ([params] body...)...)
 * also the tail of defmacro which has the same shape after the name.
 */
ExprValue ExprExpander::expandFn(const ExprValue& form, int start)
{
    juce::Array<ExprValue> items;
    const juce::Array<ExprValue>& all = form.getItems();
    int i = 0;
    for ( ; i < all.size() && i < start ; i++)
      items.add(all[i]);

    // name and docstring pass through
    while (i < all.size() && (all[i].isSymbol() || all[i].isString())) {
        items.add(all[i]);
        i++;
    }

    if (i < all.size() && all[i].isVector()) {
        items.add(all[i]);
        for (i++ ; i < all.size() ; i++)
          items.add(expandAll(all[i]));
    }
    else {
        for ( ; i < all.size() ; i++) {
            const ExprValue& clause = all[i];
            if (clause.isList() && clause.size() > 0)
              items.add(expandItems(clause, 1));
            else
              items.add(clause);
        }
    }
    return ExprValue::list(items, form.getLine(), form.getColumn());
}

/**
 * (def name value) leaves the name alone
 */
ExprValue ExprExpander::expandDef(const ExprValue& form)
{
    return expandItems(form, 2);
}

/**
 * The class and name of a catch clause are left alone.
 */
ExprValue ExprExpander::expandTry(const ExprValue& form)
{
    juce::Array<ExprValue> items;
    const juce::Array<ExprValue>& all = form.getItems();
    items.add(all[0]);
    for (int i = 1 ; i < all.size() ; i++) {
        const ExprValue& item = all[i];
        if (item.isList() && item.first().isSymbol("catch"))
          items.add(expandItems(item, 3));
        else if (item.isList() && item.first().isSymbol("finally"))
          items.add(expandItems(item, 1));
        else
          items.add(expandAll(item));
    }
    return ExprValue::list(items, form.getLine(), form.getColumn());
}

//////////////////////////////////////////////////////////////////////
//
// Expansion
//
//////////////////////////////////////////////////////////////////////

bool ExprExpander::findUserMacro(const juce::String& name, ExprValue& macro)
{
    bool found = false;
    if (workspace != nullptr && workspace->lookup(name, macro)) {
        ExprFunction* f = macro.getFunction();
        found = (f != nullptr && f->macro);
    }
    return found;
}

bool ExprExpander::expandOnce(const ExprValue& form, ExprValue& result)
{
    if (!form.isList() || form.isEmpty() || !form.first().isSymbol())
      return false;

    juce::String name = form.first().getName();
    if (ExprEvaluator::isSpecialForm(name))
      return false;

    ExprValue macro;
    if (findUserMacro(name, macro)) {
        if (evaluator == nullptr)
          throw ExprException("No evaluator available to expand macro " + name, form);

        juce::Array<ExprValue> args;
        const juce::Array<ExprValue>& all = form.getItems();
        for (int i = 1 ; i < all.size() ; i++)
          args.add(all[i]);

        try {
            result = evaluator->apply(macro, args);
        }
        catch (ExprException& e) {
            e.wrap("Unexpected error macroexpanding " + name);
            e.locate(form);
            throw;
        }

        if (result.isList() && !result.hasPosition())
          result.setPosition(form.getLine(), form.getColumn());
        return true;
    }

    if (isBuiltinMacro(name)) {
        result = expandBuiltin(name, form);
        return true;
    }

    return false;
}

ExprValue ExprExpander::expandBuiltin(const juce::String& name, const ExprValue& form)
{
    ExprValue result;
    if (name == "defn" || name == "defn-")
      result = expandDefn(form);
    else if (name == "when")
      result = expandWhen(form, false);
    else if (name == "when-not")
      result = expandWhen(form, true);
    else if (name == "if-not")
      result = expandIfNot(form);
    else if (name == "when-let")
      result = expandConditionalLet(form, true);
    else if (name == "if-let")
      result = expandConditionalLet(form, false);
    else if (name == "cond")
      result = expandCond(form);
    else if (name == "case")
      result = expandCase(form);
    else if (name == "and")
      result = expandAnd(form);
    else if (name == "or")
      result = expandOr(form);
    else if (name == "->")
      result = expandThread(form, false);
    else if (name == "->>")
      result = expandThread(form, true);
    else if (name == "declare")
      result = expandDeclare(form);
    else if (name == "comment")
      result = ExprValue();
    else if (name == "dotimes")
      result = expandDotimes(form);
    else if (name == "doseq")
      result = expandDoseq(form);
    return result;
}

/**
 * (defn name "doc"? {attrs}? [params] body...)
 *   => (def name (fn name [params] body...))
 */
ExprValue ExprExpander::expandDefn(const ExprValue& form)
{
    requireArgs(form, 3, "(defn name [params] body...)");
    ExprValue name = form.get(1);
    if (!name.isSymbol())
      throw ExprException("First argument to defn must be a symbol", form);

    int start = 2;
    if (form.get(start).isString())
      start++;
    if (form.get(start).isMap())
      start++;

    ExprValue tail = form.get(start);
    if (!tail.isVector() && !tail.isList())
      throw ExprException("Parameter declaration missing in defn of " + name.getName(), form);

    juce::Array<ExprValue> fn;
    fn.add(sym("fn"));
    fn.add(name);
    const juce::Array<ExprValue>& all = form.getItems();
    for (int i = start ; i < all.size() ; i++)
      fn.add(all[i]);

    return listAt(form, {sym("def"), name, listAt(form, fn)});
}

/**
 * (when test body...) => (if test (do body...) nil)
 */
ExprValue ExprExpander::expandWhen(const ExprValue& form, bool negate)
{
    requireArgs(form, 2, "(when test body...)");
    ExprValue body = doBody(form, 2);
    if (negate)
      return listAt(form, {sym("if"), form.get(1), ExprValue(), body});
    return listAt(form, {sym("if"), form.get(1), body, ExprValue()});
}

ExprValue ExprExpander::expandIfNot(const ExprValue& form)
{
    requireArgs(form, 3, "(if-not test then else?)");
    return listAt(form, {sym("if"), form.get(1), form.get(3), form.get(2)});
}

/**
 * (when-let [pattern expr] body...)
 *   => (let [temp expr] (if temp (let [pattern temp] (do body...)) nil))
 * if-let is the same with then and else in place of the body.
 */
ExprValue ExprExpander::expandConditionalLet(const ExprValue& form, bool isWhen)
{
    const char* fname = isWhen ? "when-let" : "if-let";
    requireArgs(form, 3, isWhen ? "(when-let [binding expr] body...)" : "(if-let [binding expr] then else?)");
    ExprValue bindings = form.get(1);
    if (!bindings.isVector() || bindings.size() != 2)
      throw ExprException(juce::String(fname) + " requires exactly 2 forms in binding vector", form);

    ExprValue temp = gensym("temp");
    ExprValue then = isWhen ? doBody(form, 2) : form.get(2);
    ExprValue otherwise = isWhen ? ExprValue() : form.get(3);

    ExprValue inner = listAt(form, {sym("let"), vectorOf({bindings.get(0), temp}), then});
    return listAt(form, {sym("let"), vectorOf({temp, bindings.get(1)}),
                         listAt(form, {sym("if"), temp, inner, otherwise})});
}

/**
 * (cond t1 e1 t2 e2) => (if t1 e1 (if t2 e2 nil))
 */
ExprValue ExprExpander::expandCond(const ExprValue& form)
{
    if ((form.size() % 2) == 0)
      throw ExprException("cond requires an even number of forms", form);

    ExprValue result;
    for (int i = form.size() - 2 ; i >= 1 ; i -= 2)
      result = listAt(form, {sym("if"), form.get(i), form.get(i + 1), result});
    return result;
}

/**
 * (case expr k1 r1 (k2 k3) r2 default?)
 *   => (let [g expr] (cond (= g 'k1) r1 (or (= g 'k2) (= g 'k3)) r2 :else default))
 * Without a default a value that matches nothing is an error.
 */
ExprValue ExprExpander::expandCase(const ExprValue& form)
{
    requireArgs(form, 2, "(case expr clauses...)");
    ExprValue g = gensym("case");

    juce::Array<ExprValue> cond;
    cond.add(sym("cond"));

    int clauses = form.size() - 2;
    bool hasDefault = (clauses % 2) == 1;
    int end = hasDefault ? form.size() - 1 : form.size();

    for (int i = 2 ; i < end ; i += 2) {
        ExprValue key = form.get(i);
        if (key.isList()) {
            juce::Array<ExprValue> alternatives;
            alternatives.add(sym("or"));
            for (auto k : key.getItems())
              alternatives.add(listAt(form, {sym("="), g, listAt(form, {sym("quote"), k})}));
            cond.add(listAt(form, alternatives));
        }
        else {
            cond.add(listAt(form, {sym("="), g, listAt(form, {sym("quote"), key})}));
        }
        cond.add(form.get(i + 1));
    }

    cond.add(ExprValue::keyword("else"));
    if (hasDefault) {
        cond.add(form.get(form.size() - 1));
    }
    else {
        ExprValue message = listAt(form, {sym("str"), ExprValue::fromString("No matching clause: "), g});
        cond.add(listAt(form, {sym("throw"), listAt(form, {sym("ex-info"), message, ExprValue::map()})}));
    }

    return listAt(form, {sym("let"), vectorOf({g, form.get(1)}), listAt(form, cond)});
}

/**
 * (and a b) => (let [g a] (if g (and b) g))
 */
ExprValue ExprExpander::expandAnd(const ExprValue& form)
{
    if (form.size() == 1)
      return ExprValue::fromBool(true);
    if (form.size() == 2)
      return form.get(1);

    ExprValue g = gensym("and");
    juce::Array<ExprValue> rest = form.rest().getItems();
    rest.set(0, sym("and"));
    return listAt(form, {sym("let"), vectorOf({g, form.get(1)}),
                         listAt(form, {sym("if"), g, listAt(form, rest), g})});
}

/**
 * (or a b) => (let [g a] (if g g (or b)))
 */
ExprValue ExprExpander::expandOr(const ExprValue& form)
{
    if (form.size() == 1)
      return ExprValue();
    if (form.size() == 2)
      return form.get(1);

    ExprValue g = gensym("or");
    juce::Array<ExprValue> rest = form.rest().getItems();
    rest.set(0, sym("or"));
    return listAt(form, {sym("let"), vectorOf({g, form.get(1)}),
                         listAt(form, {sym("if"), g, g, listAt(form, rest)})});
}

/**
 * (-> x (f a) g) => (g (f x a))
 * (->> x (f a) g) => (g (f a x))
 */
ExprValue ExprExpander::expandThread(const ExprValue& form, bool last)
{
    requireArgs(form, 2, "(-> x forms...)");
    ExprValue result = form.get(1);
    for (int i = 2 ; i < form.size() ; i++) {
        ExprValue step = form.get(i);
        juce::Array<ExprValue> items;
        if (step.isList() && step.size() > 0) {
            items = step.getItems();
            if (last)
              items.add(result);
            else
              items.insert(1, result);
        }
        else {
            items.add(step);
            items.add(result);
        }
        result = ExprValue::list(items, step.hasPosition() ? step.getLine() : form.getLine(),
                                 step.hasPosition() ? step.getColumn() : form.getColumn());
    }
    return result;
}

/**
 * (declare a b) => (do (def a) (def b))
 */
ExprValue ExprExpander::expandDeclare(const ExprValue& form)
{
    juce::Array<ExprValue> items;
    items.add(sym("do"));
    for (int i = 1 ; i < form.size() ; i++) {
        ExprValue name = form.get(i);
        if (!name.isSymbol())
          throw ExprException("declare requires symbols", form);
        items.add(listAt(form, {sym("def"), name}));
    }
    return listAt(form, items);
}

/**
 * (dotimes [i n] body...)
 *   => (let [limit n] (loop [i 0] (when (< i limit) body... (recur (inc i)))))
 */
ExprValue ExprExpander::expandDotimes(const ExprValue& form)
{
    requireArgs(form, 2, "(dotimes [name count] body...)");
    ExprValue bindings = form.get(1);
    if (!bindings.isVector() || bindings.size() != 2 || !bindings.get(0).isSymbol())
      throw ExprException("dotimes requires a vector of a name and a count", form);

    ExprValue i = bindings.get(0);
    ExprValue limit = gensym("limit");

    juce::Array<ExprValue> body;
    body.add(sym("when"));
    body.add(listAt(form, {sym("<"), i, limit}));
    for (int n = 2 ; n < form.size() ; n++)
      body.add(form.get(n));
    body.add(listAt(form, {sym("recur"), listAt(form, {sym("inc"), i})}));

    return listAt(form, {sym("let"), vectorOf({limit, bindings.get(1)}),
                         listAt(form, {sym("loop"), vectorOf({i, ExprValue::fromInt(0)}),
                                       listAt(form, body)})});
}

/**
 * (doseq [x coll] body...)
 *   => (loop [s (seq coll)] (when s (let [x (first s)] body...) (recur (next s))))
 */
ExprValue ExprExpander::expandDoseq(const ExprValue& form)
{
    requireArgs(form, 2, "(doseq [binding coll] body...)");
    ExprValue bindings = form.get(1);
    if (!bindings.isVector() || bindings.size() != 2)
      throw ExprException("doseq requires a vector of a binding and a collection", form);

    ExprValue s = gensym("seq");

    juce::Array<ExprValue> let;
    let.add(sym("let"));
    let.add(vectorOf({bindings.get(0), listAt(form, {sym("first"), s})}));
    for (int n = 2 ; n < form.size() ; n++)
      let.add(form.get(n));

    return listAt(form, {sym("loop"), vectorOf({s, listAt(form, {sym("seq"), bindings.get(1)})}),
                         listAt(form, {sym("when"), s, listAt(form, let),
                                       listAt(form, {sym("recur"), listAt(form, {sym("next"), s})})})});
}
