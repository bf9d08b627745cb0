#include <JuceHeader.h>

#include "Trace.h"
#include "StructureDumper.h"

/**
 * Everything goes through here so embedded newlines pick
 * up the indentation.
 */
void StructureDumper::append(const juce::String& s)
{
    juce::CharPointer_UTF8 p = s.getCharPointer();
    while (!p.isEmpty()) {
        juce::juce_wchar ch = p.getAndAdvance();
        if (ch == '\n') {
            buffer << "\n";
            atLineStart = true;
        }
        else {
            if (atLineStart) {
                buffer << juce::String::repeatedString("  ", indent);
                atLineStart = false;
            }
            buffer << juce::String::charToString(ch);
        }
    }
}

void StructureDumper::start(juce::String heading)
{
    if (!atLineStart)
      newline();
    append(heading);
}

void StructureDumper::add(juce::String name, juce::String value)
{
    append(" " + name + "=" + value);
}

void StructureDumper::add(juce::String name, int value)
{
    add(name, juce::String(value));
}

void StructureDumper::addb(juce::String name, bool value)
{
    if (value)
      append(" " + name);
}

void StructureDumper::newline()
{
    append("\n");
}

void StructureDumper::line(juce::String s)
{
    start(s.trimCharactersAtEnd("\n"));
    newline();
}

void StructureDumper::line(juce::String name, juce::String value)
{
    line(name + ": " + value);
}

void StructureDumper::list(juce::String name, const juce::StringArray& values)
{
    if (values.size() > 0)
      line(name, values.joinIntoString(", "));
}

void StructureDumper::block(juce::String name, juce::String text)
{
    line(name + ":");
    inc();
    line(text);
    dec();
}

void StructureDumper::trace(int level)
{
    if (level > TraceDebugLevel)
      return;

    for (auto l : juce::StringArray::fromLines(buffer)) {
        if (l.trim().length() > 0)
          Trace(level, "%s", l.toUTF8());
    }
}
