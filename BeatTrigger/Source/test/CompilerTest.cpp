/**
 * Scanning, planning, building, and the compiler and loader built on them.
 */

#include <JuceHeader.h>

#include "../expr/ExprValue.h"
#include "../expr/ExprObject.h"
#include "../expr/ExprError.h"
#include "../expr/ExprBinding.h"
#include "../expr/ExprCatalog.h"
#include "../expr/ExprResolver.h"
#include "../expr/ExprWorkspace.h"
#include "../expr/ExprScanner.h"
#include "../expr/ExprPlanner.h"
#include "../expr/ExprBuilder.h"
#include "../expr/ExprCompiler.h"
#include "../expr/ExprExpression.h"
#include "../expr/ExprOwner.h"

#include "ExprTestHarness.h"

/**
 * An event with one field.
 */
class TestEvent : public ExprObject
{
  public:

    TestEvent(int v) : value(v) {}

    juce::String getClassName() override {return "TestEvent";}

    bool isInstance(juce::String className) override {
        return className == "TestEvent";
    }

    bool invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result) override {
        (void)args;
        if (method == "getField") {
            result = ExprValue::fromInt(value);
            return true;
        }
        return false;
    }

    int value = 0;
};

class CompilerTest : public juce::UnitTest
{
  public:

    CompilerTest() : juce::UnitTest("Compiler", "BeatTrigger") {}

    void buildCatalog(ExprCatalog& catalog)
    {
        catalog.addKind("Base");
        catalog.addKind("Child", "Base");
        catalog.addKind("Event");
        catalog.addKind("Chain");
        catalog.addBinding("Base", "x", "(+ 1 1)", "");
        catalog.addBinding("Child", "y", "(* x 10)", "", "x");
        catalog.addBinding("Event", "x", "(.getField event)", "");
        catalog.addBinding("Chain", "a", "1", "");
        catalog.addBinding("Chain", "b", "2", "");
        catalog.addBinding("Chain", "c", "(+ a 100)", "", "a");
        catalog.addBinding("Chain", "d", "(+ c 1000)", "", "c");
        catalog.addBinding("Chain", "unused", "(throw (ex-info \"never bound\" {}))", "");
        expect(catalog.finish());
    }

    void runTest() override
    {
        ExprCatalog catalog;
        buildCatalog(catalog);
        ExprResolver resolver (&catalog);

        beginTest("Scanner");
        {
            const ExprBindingSet* set = resolver.resolve("Chain");
            ExprValue form = ExprTestHarness::read("(foo [b {:k d}] \"a\" :c 'unused (let [z a] z))");
            juce::StringArray found = ExprScanner::scan(form, set);
            expectEquals(found.joinIntoString(","), juce::String("a,b,d"));

            expect(ExprScanner::scan(form, nullptr).isEmpty());
            expect(ExprScanner::scan(ExprTestHarness::read("42"), set).isEmpty());
        }

        beginTest("Planner");
        {
            const ExprBindingSet* set = resolver.resolve("Chain");
            juce::StringArray discovered;
            discovered.add("d");
            discovered.add("b");
            ExprPlan plan = ExprPlanner::plan(discovered, set, false);
            expectEquals(plan.getNames().joinIntoString(","), juce::String("b,a,c,d"));

            juce::StringArray twice;
            twice.add("c");
            twice.add("a");
            twice.add("c");
            plan = ExprPlanner::plan(twice, set, false);
            expectEquals(plan.getNames().joinIntoString(","), juce::String("a,c"));

            juce::StringArray one;
            one.add("a");
            plan = ExprPlanner::plan(one, set, true);
            expectEquals(plan.steps[0].generator.print(), juce::String("(when status 1)"));

            juce::StringArray unknown;
            unknown.add("nope");
            expectEquals(ExprPlanner::plan(unknown, set, false).size(), 0);
        }

        beginTest("Builder");
        {
            ExprPlan empty;
            ExprValue body = ExprValue::fromInt(42);
            expectEquals(ExprBuilder::build(body, empty, false).print(),
                         juce::String("(fn expression [status trigger-data globals] "
                                      "(let [event status {:keys [locals]} trigger-data] 42))"));
            expectEquals(ExprBuilder::build(body, empty, true).print(),
                         juce::String("(fn expression [status trigger-data globals] "
                                      "(let [event status] 42))"));

            ExprPlan plan;
            plan.steps.add(ExprPlanStep("a", ExprValue::fromInt(1)));
            plan.steps.add(ExprPlanStep("c", ExprTestHarness::read("(+ a 100)")));
            expectEquals(ExprBuilder::build(ExprTestHarness::read("c"), plan, true).print(),
                         juce::String("(fn expression [status trigger-data globals] "
                                      "(let [event status a 1 c (+ a 100)] c))"));
        }

        beginTest("Dependent binding is planned first");
        {
            ExprWorkspace ws;
            ExprCompiler compiler (&ws);
            ExprResult result = compiler.compileExpression("y", resolver.resolve("Child"), false, false, "Scenario A");
            expect(result.isSuccess(), result.getError().toString());
            expectEquals(result.expression->getPrelude().joinIntoString(","), juce::String("x,y"));
            ExprInvocation run = result.expression->invoke(ExprValue(), ExprValue());
            expect(run.isSuccess(), run.error.toString());
            expectEquals(run.value.getInt(), (juce::int64)20);
        }

        beginTest("Constant has no prelude");
        {
            ExprWorkspace ws;
            ExprCompiler compiler (&ws);
            ExprResult result = compiler.compileExpression("42", resolver.resolve("Child"), false, false, "Scenario B");
            expect(result.isSuccess());
            expect(result.expression->getPrelude().isEmpty());
            expectEquals(result.expression->invoke(ExprValue(), ExprValue()).value.getInt(), (juce::int64)42);
        }

        beginTest("Nil guard");
        {
            ExprWorkspace ws;
            ExprCompiler compiler (&ws);
            const ExprBindingSet* set = resolver.resolve("Event");

            ExprResult guarded = compiler.compileExpression("x", set, true, false, "Scenario C");
            expect(guarded.isSuccess(), guarded.getError().toString());
            ExprInvocation run = guarded.expression->invoke(ExprValue(), ExprValue());
            expect(run.isSuccess());
            expect(run.value.isNil());

            run = guarded.expression->invoke(ExprValue::object(new TestEvent(7)), ExprValue());
            expectEquals(run.value.getInt(), (juce::int64)7);

            ExprResult unguarded = compiler.compileExpression("x", set, false, false, "Unguarded");
            expect(unguarded.isSuccess());
            run = unguarded.expression->invoke(ExprValue(), ExprValue());
            expect(!run.isSuccess());
            expectEquals(run.error.title, juce::String("Unguarded"));
            expect(run.error.message.contains("on nil"));
        }

        beginTest("Parse errors carry the title");
        {
            ExprWorkspace ws;
            ExprCompiler compiler (&ws);
            ExprResult result = compiler.compileExpression("(foo", resolver.resolve("Child"), false, false, "Scenario D");
            expect(!result.isSuccess());
            expect(result.expression == nullptr);
            ExprError error = result.getError();
            expectEquals(error.title, juce::String("Scenario D"));
            expectEquals(error.line, 1);
            expectEquals(error.column, 1);
        }

        beginTest("Shared definitions");
        {
            ExprWorkspace ws;
            ExprCompiler compiler (&ws);
            ExprResult load = compiler.loadShared("(defn twice [n] (* n 2))", "Shared");
            expect(load.isSuccess(), load.getError().toString());
            expect(load.expression == nullptr);
            expectEquals(load.definitions.joinIntoString(","), juce::String("twice"));

            ExprResult result = compiler.compileExpression("(twice 21)", nullptr, false, false, "Scenario E");
            expect(result.isSuccess(), result.getError().toString());
            expectEquals(result.expression->invoke(ExprValue(), ExprValue()).value.getInt(), (juce::int64)42);
        }

        beginTest("Loader stops at the first failure");
        {
            ExprWorkspace ws;
            ExprCompiler compiler (&ws);
            ExprResult load = compiler.loadShared("(def first-one 1)\n(def second-one (missing-fn))\n(def third-one 3)",
                                                  "Partial");
            expect(!load.isSuccess());
            expectEquals(load.evaluated, 1);
            expectEquals(load.getError().title, juce::String("Partial"));
            expectEquals(load.getError().line, 2);
            expect(load.getError().message.contains("missing-fn"));
            expect(ws.isDefined("first-one"));
            expect(!ws.isDefined("third-one"));

            ExprResult garbage = compiler.loadShared("(def never 1) (", "Garbage");
            expect(!garbage.isSuccess());
            expectEquals(garbage.evaluated, 0);
            expect(!ws.isDefined("never"));
        }

        beginTest("Macros apply to later forms and hide references");
        {
            ExprWorkspace ws;
            ExprCompiler compiler (&ws);
            ExprResult load = compiler.loadShared("(defmacro the-y [] 'y)\n(defn twice-y [] (* 2 (the-y)))", "Macros");
            // y is not a workspace name so the second form fails to link
            expect(!load.isSuccess());
            expect(ws.isDefined("the-y"));

            ExprResult result = compiler.compileExpression("(the-y)", resolver.resolve("Child"), false, false, "Hidden");
            expect(result.isSuccess(), result.getError().toString());
            expectEquals(result.expression->getPrelude().joinIntoString(","), juce::String("x,y"));
            expectEquals(result.expression->invoke(ExprValue(), ExprValue()).value.getInt(), (juce::int64)20);
        }

        beginTest("Minimal closure");
        {
            ExprWorkspace ws;
            ExprCompiler compiler (&ws);
            ExprResult result = compiler.compileExpression("(+ d b)", resolver.resolve("Chain"), false, false, "Closure");
            expect(result.isSuccess(), result.getError().toString());
            juce::StringArray prelude = result.expression->getPrelude();
            expectEquals(prelude.joinIntoString(","), juce::String("b,a,c,d"));
            expect(!prelude.contains("unused"));
            expectEquals(result.expression->invoke(ExprValue(), ExprValue()).value.getInt(), (juce::int64)1103);
        }

        beginTest("Recompiling is idempotent");
        {
            ExprWorkspace ws;
            ExprCompiler compiler (&ws);
            ExprResult first = compiler.compileExpression("(* y 2)", resolver.resolve("Child"), false, false, "Again");
            ExprResult second = compiler.compileExpression("(* y 2)", resolver.resolve("Child"), false, false, "Again");
            expect(first.isSuccess() && second.isSuccess());
            expect(first.expression->getPrelude() == second.expression->getPrelude());
            expectEquals(first.expression->getForm().print(), second.expression->getForm().print());
            expectEquals(first.expression->invoke(ExprValue(), ExprValue()).value.getInt(),
                         second.expression->invoke(ExprValue(), ExprValue()).value.getInt());
        }

        beginTest("Link errors");
        {
            ExprWorkspace ws;
            ExprCompiler compiler (&ws);
            ExprResult result = compiler.compileExpression("(if false\n    (nope 2)\n  1)", nullptr, false, false, "Link");
            expect(!result.isSuccess());
            expect(result.getError().message.contains("Unable to resolve symbol: nope"));
            expectEquals(result.getError().line, 2);

            result = compiler.compileExpression("locals", nullptr, false, true, "No locals");
            expect(!result.isSuccess());
            expect(result.getError().message.contains("locals"));
        }

        beginTest("Owner locals and globals");
        {
            ExprWorkspace ws;
            ExprCompiler compiler (&ws);
            ExprOwner owner ("Trigger 1");

            ExprResult result = compiler.compileExpression("(swap! locals assoc :count (inc (get @locals :count 0)))",
                                                           nullptr, false, false, "Locals");
            expect(result.isSuccess(), result.getError().toString());
            (void)result.expression->invoke(ExprValue(), &owner);
            (void)result.expression->invoke(ExprValue(), &owner);
            expectEquals(owner.derefLocals().lookup(ExprValue::keyword("count")).getInt(), (juce::int64)2);

            result = compiler.compileExpression("(:name trigger-data)", nullptr, false, false, "Name");
            expectEquals(result.expression->invoke(ExprValue(), &owner).value.getName(), juce::String("Trigger 1"));

            result = compiler.compileExpression("(swap! globals assoc :seen true)", nullptr, false, true, "Globals");
            expect(result.isSuccess());
            (void)result.expression->invoke(ExprValue(), ExprValue());
            expect(ws.getGlobals().getAtom()->deref().lookup(ExprValue::keyword("seen")).getBool());

            ExprValue mine = ExprValue::atom(ExprValue::map());
            (void)result.expression->invoke(ExprValue(), ExprValue(), mine);
            expect(mine.getAtom()->deref().containsKey(ExprValue::keyword("seen")));
        }

        beginTest("Runtime errors");
        {
            ExprWorkspace ws;
            ExprCompiler compiler (&ws);
            ExprResult result = compiler.compileExpression("(/ 1 0)", nullptr, false, false, "Divide");
            expect(result.isSuccess());
            ExprInvocation run = result.expression->invoke(ExprValue(), ExprValue());
            expect(!run.isSuccess());
            expect(run.value.isNil());
            expectEquals(run.error.title, juce::String("Divide"));
            expectEquals(run.error.message, juce::String("Divide by zero"));
            expectEquals(run.error.line, 1);

            result = compiler.compileExpression("(throw (ex-info \"outer\" {} (ex-info \"inner\" {})))",
                                                nullptr, false, false, "Causes");
            run = result.expression->invoke(ExprValue(), ExprValue());
            expect(!run.isSuccess());
            expectEquals(run.error.message, juce::String("outer"));
            expect(run.error.causes.contains("inner"));

            // the expression still works after a failure
            run = result.expression->invoke(ExprValue(), ExprValue());
            expect(!run.isSuccess());
        }

        beginTest("Runtime def");
        {
            ExprWorkspace ws;
            ExprCompiler compiler (&ws);
            ExprResult result = compiler.compileExpression("(def counter 5) (inc counter)", nullptr, false, false, "Def");
            expect(result.isSuccess(), result.getError().toString());
            expectEquals(result.expression->invoke(ExprValue(), ExprValue()).value.getInt(), (juce::int64)6);
            expect(ws.isDefined("counter"));
        }
    }
};

static CompilerTest compilerTest;
