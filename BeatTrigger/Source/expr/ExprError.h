/**
 * Objects that describe errors encountered while reading, compiling
 * and evaluating expressions.
 *
 * ExprException is what the interpreter throws.  It is caught at the
 * edges of the engine, compilation and the per-invocation boundary, and
 * converted into an ExprError which is what the application sees.
 *
 * Both carry a message, the line and column in the source text when
 * one is known, and a cause chain.  The chain is ordered outermost first,
 * the message is the outermost cause and the last element of causes is
 * the root.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprValue.h"
#include "ExprObject.h"

/**
 * A single error reported to the application.
 */
class ExprError
{
  public:

    ExprError() {}
    ExprError(juce::String t, juce::String m, int l = 0, int c = 0);
    // convert what the interpreter threw
    ExprError(juce::String t, const class ExprException& e);
    ~ExprError() {}

    // identifies the snippet, supplied by the caller
    juce::String title;

    // what went wrong
    juce::String message;

    // position in the source, zero when unknown
    int line = 0;
    int column = 0;

    // the token at the error position, used by the reader
    juce::String token;

    // underlying causes, outermost first
    juce::StringArray causes;

    bool hasPosition() const {return line > 0;}

    // single line with the position
    juce::String getSummary() const;

    // title, summary and one line per cause
    juce::String toString() const;
};

/**
 * The exception thrown inside the interpreter.
 */
class ExprException : public std::exception
{
  public:

    ExprException(juce::String m);
    ExprException(juce::String m, int l, int c);
    ExprException(juce::String m, const ExprValue& form);
    ~ExprException() {}

    const char* what() const noexcept override;

    // set the position from a form if we don't have one yet
    void locate(const ExprValue& form);

    // push the current message down the cause chain and replace it
    void wrap(juce::String outer);

    juce::String message;
    int line = 0;
    int column = 0;
    juce::StringArray causes;

    // the map passed to ex-info
    ExprValue data;

  private:

    // what() needs something that outlives the call
    std::string whatBuffer;
};

/**
 * An exception as a value.  This is what ex-info returns, what throw
 * accepts, and what a catch clause binds.  (.getMessage e) works on
 * it like people expect.
 */
class ExprThrowable : public ExprObject
{
  public:

    ExprThrowable(juce::String m, const ExprValue& d);
    ExprThrowable(const ExprException& ex);
    ~ExprThrowable() {}

    juce::String getClassName() override;
    bool isInstance(juce::String className) override;
    bool invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result) override;
    juce::String describe() override;

    // build the exception to rethrow
    ExprException toException();

    juce::String message;
    ExprValue data;
    juce::StringArray causes;
    // position of the original failure, kept when rethrown
    int line = 0;
    int column = 0;
};
