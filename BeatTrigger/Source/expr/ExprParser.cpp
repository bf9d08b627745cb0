
#include <JuceHeader.h>

#include "../util/Trace.h"

#include "ExprConstants.h"
#include "ExprValue.h"
#include "ExprError.h"
#include "ExprTokenizer.h"
#include "ExprParser.h"

static juce::Atomic<int> GensymCounter;

juce::String ExprParser::gensym(juce::String prefix)
{
    int n = ++GensymCounter;
    return prefix + "__" + juce::String(n) + EXPR_GENSYM_SUFFIX;
}

//////////////////////////////////////////////////////////////////////
//
// Interface
//
//////////////////////////////////////////////////////////////////////

bool ExprParser::parse(juce::String source, juce::Array<ExprValue>& forms)
{
    errors.clear();
    tokenizer.setContent(source);
    inAnonymousFunction = false;
    depth = 0;

    try {
        while (true) {
            ExprToken t = nextToken();
            if (t.isEnd())
              break;
            forms.add(readForm(t));
        }
    }
    catch (ExprException& e) {
        ExprError error ("", e.message, e.line, e.column);
        errors.add(error);
        Trace(2, "ExprParser: %s at line %ld column %ld", e.message.toUTF8(), (long)e.line, (long)e.column);
    }

    return errors.size() == 0;
}

bool ExprParser::parseOne(juce::String source, ExprValue& form)
{
    juce::Array<ExprValue> forms;
    if (parse(source, forms)) {
        if (forms.size() == 1) {
            form = forms[0];
        }
        else {
            ExprError error ("", "Expected exactly one form but found " + juce::String(forms.size()));
            errors.add(error);
        }
    }
    return errors.size() == 0;
}

void ExprParser::errorSyntax(ExprToken& t, juce::String details)
{
    throw ExprException(details, t.line, t.column);
}

/**
 * Called before descending into a nested form, the caller
 * decrements depth when it comes back out.
 */
void ExprParser::enter(ExprToken& t)
{
    if (++depth > ExprMaxReadDepth)
      errorSyntax(t, "Forms nested more than " + juce::String(ExprMaxReadDepth) + " deep");
}

//////////////////////////////////////////////////////////////////////
//
// Reading
//
//////////////////////////////////////////////////////////////////////

/**
 * Get the next token, consuming #_ discards and turning
 * tokenizer errors into exceptions.
 */
ExprToken ExprParser::nextToken()
{
    ExprToken t = tokenizer.next();
    while (t.type == ExprToken::Discard) {
        enter(t);
        (void)read();
        depth--;
        t = tokenizer.next();
    }
    if (t.isError())
      errorSyntax(t, t.value);
    return t;
}

ExprValue ExprParser::read()
{
    ExprToken t = nextToken();
    if (t.isEnd())
      errorSyntax(t, "Unexpected end of input");
    return readForm(t);
}

ExprValue ExprParser::readForm(ExprToken& t)
{
    enter(t);
    ExprValue form;

    switch (t.type) {
        case ExprToken::Open:
            if (t.value == "#(")
              form = readAnonymousFunction(t);
            else
              form = readDelimited(t);
            break;

        case ExprToken::Close:
            errorSyntax(t, "Unmatched delimiter: " + t.value);
            break;

        case ExprToken::String:
        case ExprToken::Char:
            form = ExprValue::fromString(t.value);
            break;

        case ExprToken::Int:
            form = ExprValue::fromInt(t.value.getLargeIntValue());
            break;

        case ExprToken::Float:
            form = ExprValue::fromFloat(t.value.getDoubleValue());
            break;

        case ExprToken::Keyword:
            form = ExprValue::keyword(t.value);
            break;

        case ExprToken::Symbol:
            if (t.value == "nil")
              form = ExprValue();
            else if (t.value == "true")
              form = ExprValue::fromBool(true);
            else if (t.value == "false")
              form = ExprValue::fromBool(false);
            else
              form = ExprValue::symbol(t.value, t.line, t.column);
            break;

        case ExprToken::Quote:
            // #'foo is just foo, there are no vars
            if (t.value == "var")
              form = read();
            else
              form = wrap("quote", t);
            break;

        case ExprToken::SyntaxQuote: {
            juce::StringPairArray gensyms (false);
            ExprValue quoted = read();
            form = syntaxQuote(quoted, gensyms);
        }
            break;

        case ExprToken::Unquote:
            form = wrap("unquote", t);
            break;

        case ExprToken::UnquoteSplicing:
            form = wrap("unquote-splicing", t);
            break;

        case ExprToken::Deref:
            form = wrap("deref", t);
            break;

        case ExprToken::Meta:
            // type hints mean nothing to us, read and toss
            (void)read();
            form = read();
            break;

        case ExprToken::End:
            errorSyntax(t, "Unexpected end of input");
            break;

        case ExprToken::Error:
        case ExprToken::Discard:
            errorSyntax(t, "Unexpected token " + t.value);
            break;
    }

    depth--;
    return form;
}

ExprValue ExprParser::wrap(const char* name, ExprToken& t)
{
    ExprValue inner = read();
    juce::Array<ExprValue> items;
    items.add(ExprValue::symbol(name, t.line, t.column));
    items.add(inner);
    return ExprValue::list(items, t.line, t.column);
}

ExprValue ExprParser::readDelimited(ExprToken& open)
{
    juce::String close = ")";
    if (open.value == "[")
      close = "]";
    else if (open.value == "{")
      close = "}";

    juce::Array<ExprValue> items;
    while (true) {
        ExprToken t = nextToken();
        if (t.isEnd()) {
            errorSyntax(open, "Unexpected end of input, unclosed " + open.value +
                        " starting at line " + juce::String(open.line));
        }
        else if (t.isClose()) {
            if (t.value == close)
              break;
            errorSyntax(t, "Unmatched delimiter: " + t.value + ", expecting " + close);
        }
        else {
            items.add(readForm(t));
        }
    }

    ExprValue form;
    if (open.value == "[") {
        form = ExprValue::vector(items, open.line, open.column);
    }
    else if (open.value == "{") {
        if ((items.size() % 2) != 0)
          errorSyntax(open, "Map literal must contain an even number of forms");
        form = ExprValue::map(items, open.line, open.column);
    }
    else {
        form = ExprValue::list(items, open.line, open.column);
    }
    return form;
}

//////////////////////////////////////////////////////////////////////
//
// Anonymous functions
//
//////////////////////////////////////////////////////////////////////

/**
 * Replace % with %1 and find the highest numbered argument used.
 */
static ExprValue replaceArgs(const ExprValue& form, int& maxArg, bool& rest)
{
    ExprValue result = form;
    if (form.isSymbol()) {
        juce::String name = form.getName();
        if (name == "%") {
            if (maxArg < 1) maxArg = 1;
            result = ExprValue::symbol("%1", form.getLine(), form.getColumn());
        }
        else if (name == "%&") {
            rest = true;
        }
        else if (name.startsWithChar('%') && name.substring(1).containsOnly("0123456789")) {
            int n = name.substring(1).getIntValue();
            if (n > maxArg) maxArg = n;
        }
    }
    else if (form.isSequential()) {
        juce::Array<ExprValue> items;
        for (auto item : form.getItems())
          items.add(replaceArgs(item, maxArg, rest));
        if (form.isList())
          result = ExprValue::list(items, form.getLine(), form.getColumn());
        else
          result = ExprValue::vector(items, form.getLine(), form.getColumn());
    }
    else if (form.isMap()) {
        juce::Array<ExprValue> items;
        const juce::Array<ExprValue>& keys = form.getKeys();
        const juce::Array<ExprValue>& values = form.getValues();
        for (int i = 0 ; i < keys.size() ; i++) {
            items.add(replaceArgs(keys[i], maxArg, rest));
            items.add(replaceArgs(values[i], maxArg, rest));
        }
        result = ExprValue::map(items, form.getLine(), form.getColumn());
    }
    return result;
}

ExprValue ExprParser::readAnonymousFunction(ExprToken& open)
{
    if (inAnonymousFunction)
      errorSyntax(open, "Nested #()s are not allowed");

    inAnonymousFunction = true;
    ExprValue body = readDelimited(open);
    inAnonymousFunction = false;

    int maxArg = 0;
    bool rest = false;
    body = replaceArgs(body, maxArg, rest);

    juce::Array<ExprValue> params;
    for (int i = 1 ; i <= maxArg ; i++)
      params.add(ExprValue::symbol("%" + juce::String(i), open.line, open.column));
    if (rest) {
        params.add(ExprValue::symbol("&", open.line, open.column));
        params.add(ExprValue::symbol("%&", open.line, open.column));
    }

    juce::Array<ExprValue> fn;
    fn.add(ExprValue::symbol("fn", open.line, open.column));
    fn.add(ExprValue::vector(params, open.line, open.column));
    fn.add(body);
    return ExprValue::list(fn, open.line, open.column);
}

//////////////////////////////////////////////////////////////////////
//
// Syntax quote
//
//////////////////////////////////////////////////////////////////////

bool ExprParser::isUnquote(const ExprValue& form, const char* name)
{
    return (form.isList() && form.size() == 2 && form.first().isSymbol(name));
}

static ExprValue makeCall(const char* function, const juce::Array<ExprValue>& args, const ExprValue& where)
{
    juce::Array<ExprValue> items;
    items.add(ExprValue::symbol(function, where.getLine(), where.getColumn()));
    items.addArray(args);
    return ExprValue::list(items, where.getLine(), where.getColumn());
}

/**
 * Expand the body of a syntax quote into code that builds it.
 * Symbols are quoted, x# becomes the same generated symbol everywhere
 * within one syntax quote, ~x is evaluated and ~@x is spliced.
 */
ExprValue ExprParser::syntaxQuote(const ExprValue& form, juce::StringPairArray& gensyms)
{
    ExprValue result = form;

    if (form.isSymbol()) {
        juce::String name = form.getName();
        if (name.length() > 1 && name.endsWithChar('#')) {
            if (!gensyms.containsKey(name))
              gensyms.set(name, gensym(name.dropLastCharacters(1)));
            name = gensyms[name];
        }
        juce::Array<ExprValue> args;
        args.add(ExprValue::symbol(name, form.getLine(), form.getColumn()));
        result = makeCall("quote", args, form);
    }
    else if (form.isList()) {
        if (isUnquote(form, "unquote")) {
            result = form.get(1);
        }
        else if (isUnquote(form, "unquote-splicing")) {
            throw ExprException("Unquote-splicing used outside of a list", form);
        }
        else {
            juce::Array<ExprValue> args;
            args.add(syntaxQuoteItems(form.getItems(), gensyms));
            result = makeCall("seq", args, form);
        }
    }
    else if (form.isVector()) {
        juce::Array<ExprValue> args;
        args.add(ExprValue::symbol("vector", form.getLine(), form.getColumn()));
        args.add(syntaxQuoteItems(form.getItems(), gensyms));
        result = makeCall("apply", args, form);
    }
    else if (form.isMap()) {
        juce::Array<ExprValue> flat;
        const juce::Array<ExprValue>& keys = form.getKeys();
        const juce::Array<ExprValue>& values = form.getValues();
        for (int i = 0 ; i < keys.size() ; i++) {
            flat.add(keys[i]);
            flat.add(values[i]);
        }
        juce::Array<ExprValue> args;
        args.add(ExprValue::symbol("hash-map", form.getLine(), form.getColumn()));
        args.add(syntaxQuoteItems(flat, gensyms));
        result = makeCall("apply", args, form);
    }
    return result;
}

ExprValue ExprParser::syntaxQuoteItems(const juce::Array<ExprValue>& items, juce::StringPairArray& gensyms)
{
    juce::Array<ExprValue> parts;
    for (auto item : items) {
        if (isUnquote(item, "unquote-splicing")) {
            parts.add(item.get(1));
        }
        else {
            juce::Array<ExprValue> args;
            args.add(syntaxQuote(item, gensyms));
            parts.add(makeCall("list", args, item));
        }
    }
    ExprValue where = (items.size() > 0) ? items[0] : ExprValue();
    return makeCall("concat", parts, where);
}
