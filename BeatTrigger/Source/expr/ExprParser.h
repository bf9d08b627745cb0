/**
 * The reader.  Turns source text into forms.
 *
 * Forms are ordinary ExprValues: lists, vectors, maps, symbols and
 * literals.  Collections and symbols carry the line and column where
 * they started.
 *
 * Reader macros are expanded here rather than being left for the
 * evaluator:
 *
 *     'x        (quote x)
 *     @x        (deref x)
 *     `(a ~b)   (seq (concat (list (quote a)) (list b)))
 *     #(+ % 1)  (fn [%1] (+ %1 1))
 *     ^Hint x   x
 *     #_x       nothing
 *
 * Errors are collected in an ExprError list like the other phases do,
 * the parser stops at the first one since there is rarely anything
 * useful to say after an unbalanced bracket.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"
#include "ExprError.h"
#include "ExprTokenizer.h"

class ExprParser
{
  public:

    ExprParser() {}
    ~ExprParser() {}

    /**
     * Read all of the forms in the source.
     * Returns false if there were errors.
     */
    bool parse(juce::String source, juce::Array<ExprValue>& forms);

    /**
     * Read a source that must contain exactly one form.
     * Used for binding generators.
     */
    bool parseOne(juce::String source, ExprValue& form);

    juce::Array<ExprError>& getErrors() {return errors;}
    bool hasErrors() {return errors.size() > 0;}

    /**
     * Make a symbol name nobody will type by accident.
     * Used by syntax quote, the macro expander and the gensym function.
     */
    static juce::String gensym(juce::String prefix);

  private:

    ExprTokenizer tokenizer;
    juce::Array<ExprError> errors;

    // true while reading the body of #()
    bool inAnonymousFunction = false;

    // forms currently open in readForm
    int depth = 0;

    ExprToken nextToken();
    ExprValue read();
    ExprValue readForm(ExprToken& token);
    ExprValue readDelimited(ExprToken& open);
    ExprValue readAnonymousFunction(ExprToken& open);
    ExprValue wrap(const char* name, ExprToken& token);

    ExprValue syntaxQuote(const ExprValue& form, juce::StringPairArray& gensyms);
    ExprValue syntaxQuoteItems(const juce::Array<ExprValue>& items, juce::StringPairArray& gensyms);
    bool isUnquote(const ExprValue& form, const char* name);

    void errorSyntax(ExprToken& t, juce::String details);
    void enter(ExprToken& t);
};
