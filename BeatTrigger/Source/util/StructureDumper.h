/**
 * Formats indented diagnostic text for things that nest, like the
 * binding catalog, the workspace, or a compiled expression.
 *
 * Text containing newlines, expression source or an error with its
 * causes, is indented line by line to the current level so a dump
 * stays readable however the parts were written.
 */

#pragma once

#include <JuceHeader.h>

class StructureDumper
{
  public:

    StructureDumper() {}
    ~StructureDumper() {}

    juce::String getText() {return buffer;}

    void inc() {indent++;}
    void dec() {if (indent > 0) indent--;}

    // begin a line with a heading, add attributes, then newline()
    void start(juce::String heading);
    void add(juce::String name, juce::String value);
    void add(juce::String name, int value);
    // adds the name only when true
    void addb(juce::String name, bool value);
    void newline();

    // a complete line
    void line(juce::String s);
    void line(juce::String name, juce::String value);

    // a name followed by a comma list, nothing if the list is empty
    void list(juce::String name, const juce::StringArray& values);

    // a name on its own line with the text indented under it
    void block(juce::String name, juce::String text);

    // send the text through Trace, one record per line
    void trace(int level);

  private:

    juce::String buffer;
    int indent = 0;
    bool atLineStart = true;

    void append(const juce::String& s);
};
