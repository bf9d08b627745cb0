/**
 * Breaks expression source text into tokens.
 *
 * The language is a Lisp so the lexical structure is small:
 * brackets, strings, numbers, keywords, symbols, and a handful of
 * reader macro characters.  Whitespace, commas and ; comments are skipped.
 * Every token remembers the line and column where it started, both
 * starting from 1, so the parser can report where things went wrong.
 */

#pragma once

#include <JuceHeader.h>

class ExprToken
{
  public:

    enum Type {
        End,
        Error,
        Open,
        Close,
        String,
        Int,
        Float,
        Char,
        Symbol,
        Keyword,
        Quote,
        SyntaxQuote,
        Unquote,
        UnquoteSplicing,
        Deref,
        Meta,
        Discard
    };

    ExprToken() {}
    ExprToken(Type t) {type = t;}
    ~ExprToken() {}

    Type type = End;
    juce::String value;
    int line = 0;
    int column = 0;

    bool isEnd() {return type == End;}
    bool isError() {return type == Error;}
    bool isOpen() {return type == Open;}
    bool isClose() {return type == Close;}
};

class ExprTokenizer
{
  public:

    ExprTokenizer() {}
    ExprTokenizer(juce::String s) {setContent(s);}
    ~ExprTokenizer() {}

    void setContent(juce::String s);

    // false once only whitespace and comments remain
    bool hasNext();
    ExprToken next();

    int getLine() {return line;}
    int getColumn() {return column;}

  private:

    juce::Array<juce::juce_wchar> chars;
    int position = 0;
    int line = 1;
    int column = 1;

    juce::juce_wchar peek(int offset = 0);
    juce::juce_wchar advance();
    void skipWhitespace();

    bool isDelimiter(juce::juce_wchar ch);
    void readString(ExprToken& token);
    void readChar(ExprToken& token);
    void readAtom(ExprToken& token);
    void classifyNumber(ExprToken& token);
};
