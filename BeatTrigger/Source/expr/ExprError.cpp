
#include <JuceHeader.h>

#include "ExprValue.h"
#include "ExprError.h"

//////////////////////////////////////////////////////////////////////
//
// ExprError
//
//////////////////////////////////////////////////////////////////////

ExprError::ExprError(juce::String t, juce::String m, int l, int c)
{
    title = t;
    message = m;
    line = l;
    column = c;
}

ExprError::ExprError(juce::String t, const ExprException& e)
{
    title = t;
    message = e.message;
    line = e.line;
    column = e.column;
    causes = e.causes;
}

juce::String ExprError::getSummary() const
{
    juce::String s = message;
    if (line > 0) {
        s += " (line " + juce::String(line) + ", column " + juce::String(column) + ")";
    }
    return s;
}

juce::String ExprError::toString() const
{
    juce::String s;
    if (title.length() > 0)
      s = title + ": ";
    s += getSummary();
    for (auto cause : causes) {
        s += "\n  Caused by: " + cause;
    }
    return s;
}

//////////////////////////////////////////////////////////////////////
//
// ExprException
//
//////////////////////////////////////////////////////////////////////

ExprException::ExprException(juce::String m)
{
    message = m;
    whatBuffer = m.toStdString();
}

ExprException::ExprException(juce::String m, int l, int c)
{
    message = m;
    line = l;
    column = c;
    whatBuffer = m.toStdString();
}

ExprException::ExprException(juce::String m, const ExprValue& form)
{
    message = m;
    whatBuffer = m.toStdString();
    locate(form);
}

const char* ExprException::what() const noexcept
{
    return whatBuffer.c_str();
}

void ExprException::locate(const ExprValue& form)
{
    if (line == 0 && form.hasPosition()) {
        line = form.getLine();
        column = form.getColumn();
    }
}

void ExprException::wrap(juce::String outer)
{
    causes.insert(0, message);
    message = outer;
    whatBuffer = outer.toStdString();
}

//////////////////////////////////////////////////////////////////////
//
// ExprThrowable
//
//////////////////////////////////////////////////////////////////////

ExprThrowable::ExprThrowable(juce::String m, const ExprValue& d)
{
    message = m;
    data = d;
}

ExprThrowable::ExprThrowable(const ExprException& ex)
{
    message = ex.message;
    data = ex.data;
    causes = ex.causes;
    line = ex.line;
    column = ex.column;
}

juce::String ExprThrowable::getClassName()
{
    return data.isNil() ? "Exception" : "ExceptionInfo";
}

bool ExprThrowable::isInstance(juce::String className)
{
    return (className == "Exception" ||
            className == "Throwable" ||
            className == "RuntimeException" ||
            className == "Object" ||
            (className == "ExceptionInfo" && !data.isNil()));
}

bool ExprThrowable::invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result)
{
    (void)args;
    bool found = true;
    if (method == "getMessage" || method == "getLocalizedMessage") {
        result = ExprValue::fromString(message);
    }
    else if (method == "getData") {
        result = data;
    }
    else if (method == "getCause") {
        if (causes.size() > 0) {
            ExprThrowable* cause = new ExprThrowable(causes[0], ExprValue());
            for (int i = 1 ; i < causes.size() ; i++)
              cause->causes.add(causes[i]);
            result = ExprValue::object(cause);
        }
        else {
            result = ExprValue();
        }
    }
    else {
        found = false;
    }
    return found;
}

juce::String ExprThrowable::describe()
{
    juce::String s = "#error[" + message;
    if (!data.isNil())
      s += " " + data.print();
    s += "]";
    return s;
}

ExprException ExprThrowable::toException()
{
    ExprException ex (message, line, column);
    ex.data = data;
    ex.causes = causes;
    return ex;
}
