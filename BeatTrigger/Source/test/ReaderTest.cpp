/**
 * Reading source text into forms.
 */

#include <JuceHeader.h>

#include "../expr/ExprConstants.h"
#include "../expr/ExprValue.h"
#include "../expr/ExprError.h"
#include "../expr/ExprParser.h"

#include "ExprTestHarness.h"

class ReaderTest : public juce::UnitTest
{
  public:

    ReaderTest() : juce::UnitTest("Reader", "BeatTrigger") {}

    void runTest() override
    {
        beginTest("Scalars");
        {
            expect(ExprTestHarness::read("nil").isNil());
            expect(ExprTestHarness::read("true").getBool());
            expectEquals(ExprTestHarness::read("42").getInt(), (juce::int64)42);
            expectEquals(ExprTestHarness::read("-7").getInt(), (juce::int64)-7);
            expectEquals(ExprTestHarness::read("2.5").getFloat(), 2.5);
            expect(ExprTestHarness::read(":on-air").isKeyword());
            expectEquals(ExprTestHarness::read(":on-air").getName(), juce::String("on-air"));
            expectEquals(ExprTestHarness::read("\"a\\nb\"").getName(), juce::String("a\nb"));
        }

        beginTest("Collections");
        {
            ExprValue form = ExprTestHarness::read("(foo [1 2] {:a 1, :b 2})");
            expect(form.isList());
            expectEquals(form.size(), 3);
            expect(form.first().isSymbol("foo"));
            expect(form.get(1).isVector());
            expect(form.get(2).isMap());
            expectEquals(form.get(2).size(), 2);
            expectEquals(form.print(), juce::String("(foo [1 2] {:a 1, :b 2})"));
        }

        beginTest("Reader macros");
        {
            expectEquals(ExprTestHarness::read("'x").print(), juce::String("(quote x)"));
            expectEquals(ExprTestHarness::read("@a").print(), juce::String("(deref a)"));
            expectEquals(ExprTestHarness::read("(a #_ b c)").print(), juce::String("(a c)"));
            expectEquals(ExprTestHarness::read("(.isPlaying ^CdjStatus status)").print(),
                         juce::String("(.isPlaying status)"));
            expectEquals(ExprTestHarness::read("(a ; comment\n b)").print(), juce::String("(a b)"));
        }

        beginTest("Positions");
        {
            ExprParser parser;
            juce::Array<ExprValue> forms;
            expect(parser.parse("(a)\n  (b\n   c)", forms));
            expectEquals(forms.size(), 2);
            expectEquals(forms[1].getLine(), 2);
            expectEquals(forms[1].getColumn(), 3);
            expectEquals(forms[1].get(1).getLine(), 3);
            expectEquals(forms[1].get(1).getColumn(), 4);
        }

        beginTest("Errors");
        {
            ExprParser parser;
            juce::Array<ExprValue> forms;
            expect(!parser.parse("(+ 1\n  (foo", forms));
            expectEquals(parser.getErrors().size(), 1);
            ExprError error = parser.getErrors()[0];
            expect(error.message.startsWith("Unexpected end of input"));
            expectEquals(error.line, 2);
            expectEquals(error.column, 3);

            forms.clear();
            expect(!parser.parse("(a ]", forms));
            expect(parser.getErrors()[0].message.contains("Unmatched delimiter"));

            forms.clear();
            expect(!parser.parse("{:a}", forms));
            expect(parser.getErrors()[0].message.contains("even number"));
        }

        beginTest("Nesting depth");
        {
            ExprParser parser;
            juce::Array<ExprValue> forms;
            juce::String deep = juce::String::repeatedString("(", 5000) + juce::String::repeatedString(")", 5000);
            expect(!parser.parse(deep, forms));
            ExprError error = parser.getErrors()[0];
            expect(error.message.contains("nested"), error.message);
            expectEquals(error.line, 1);
            expectEquals(error.column, ExprMaxReadDepth + 1);

            forms.clear();
            juce::String limit = juce::String::repeatedString("[", ExprMaxReadDepth) +
                juce::String::repeatedString("]", ExprMaxReadDepth);
            expect(parser.parse(limit, forms));
            expectEquals(forms.size(), 1);

            forms.clear();
            expect(!parser.parse(juce::String::repeatedString("'", 5000) + "x", forms));
            expect(!parser.parse(juce::String::repeatedString("#_", 5000) + "x", forms));
            expect(!parser.parse("#(" + juce::String::repeatedString("{:k ", 5000), forms));

            ExprTestHarness h;
            expect(h.run("(+ 1 " + deep + ")").isNil());
            expect(h.lastError.contains("nested"), h.lastError);
        }

        beginTest("Syntax quote");
        {
            ExprTestHarness h;
            expectEquals(h.print("(let [b 2 c [3 4]] `(a ~b ~@c))"), juce::String("(a 2 3 4)"));
            expectEquals(h.print("(let [v 1] `[x ~v])"), juce::String("[x 1]"));

            ExprValue pair = h.run("`(x# x#)");
            expect(pair.isList());
            expect(pair.get(0).isSymbol());
            expect(pair.get(0).equals(pair.get(1)));
            expect(pair.get(0).getName() != "x#");
        }

        beginTest("Anonymous functions");
        {
            ExprTestHarness h;
            expectEquals(h.print("(map #(* % 2) [1 2 3])"), juce::String("(2 4 6)"));
            expectEquals(h.print("(#(+ %1 %2) 3 4)"), juce::String("7"));
        }
    }
};

static ReaderTest readerTest;
