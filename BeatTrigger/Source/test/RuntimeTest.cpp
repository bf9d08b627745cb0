/**
 * The pieces that live past compilation: atoms under contention,
 * owners, slots, configuration and the environment as a whole.
 */

#include <JuceHeader.h>

#include "../util/Trace.h"
#include "../util/StructureDumper.h"
#include "../expr/ExprValue.h"
#include "../expr/ExprError.h"
#include "../expr/ExprOwner.h"
#include "../expr/ExprSlot.h"
#include "../expr/ExprConfig.h"
#include "../expr/ExprEnvironment.h"

#include "ExprTestHarness.h"

/**
 * Runs one expression over and over against a shared owner.
 */
class SwapThread : public juce::Thread
{
  public:

    SwapThread(ExprExpression* e, ExprOwner* o, int n) :
        juce::Thread("SwapThread"), expression(e), owner(o), count(n) {}

    void run() override {
        for (int i = 0 ; i < count ; i++) {
            ExprInvocation result = expression->invoke(ExprValue(), owner);
            if (!result.isSuccess())
              failures++;
        }
    }

    ExprExpression::Ptr expression;
    ExprOwner* owner;
    int count;
    int failures = 0;
};

/**
 * Alternates shared definition loads with expression compiles that
 * use what was just defined, the way several editor windows might
 * while triggers are being reconfigured.
 */
class CompileThread : public juce::Thread
{
  public:

    CompileThread(ExprEnvironment* e, int i, int n) :
        juce::Thread("CompileThread"), env(e), id(i), count(n) {}

    void run() override {
        for (int i = 0 ; i < count ; i++) {
            juce::String name = "shared-" + juce::String(id) + "-" + juce::String(i);
            ExprResult loaded = env->loadSharedDefinitions("(def " + name + " " + juce::String(i) + ")",
                                                           "Shared " + juce::String(id));
            if (!loaded.isSuccess() || !loaded.definitions.contains(name)) {
                fail(loaded.getError().toString());
                continue;
            }

            ExprResult compiled = env->compileExpression("(if track-title 0 (+ " + name + " 1))", "status",
                                                         true, true, name);
            if (!compiled.isSuccess()) {
                fail(compiled.getError().toString());
                continue;
            }

            ExprInvocation result = compiled.expression->invoke(ExprValue(), ExprValue());
            if (!result.isSuccess() || result.value.getInt() != i + 1)
              fail(name + " gave " + result.value.print());
        }
    }

    void fail(juce::String msg) {
        if (failures == 0)
          firstFailure = msg;
        failures++;
    }

    ExprEnvironment* env;
    int id;
    int count;
    int failures = 0;
    juce::String firstFailure;
};

/**
 * Collects what the expressions printed.
 */
class TraceCapture : public TraceListener
{
  public:
    void traceEmit(const char* msg) override {
        lines.add(juce::String(msg).trimEnd());
    }
    juce::StringArray lines;
};

class RuntimeTest : public juce::UnitTest
{
  public:

    RuntimeTest() : juce::UnitTest("Runtime", "BeatTrigger") {}

    static const char* ExtensionConfig;
    static const char* BrokenConfig;

    void runTest() override
    {
        int savedTraceLevel = TraceDebugLevel;

        beginTest("Atoms");
        {
            ExprTestHarness h;
            expectEquals(h.print("(let [a (atom 1)] (swap! a + 10) @a)"), juce::String("11"));
            expectEquals(h.print("(let [a (atom 1)] (reset! a 5))"), juce::String("5"));
            expectEquals(h.print("(let [a (atom 1)] [(compare-and-set! a 2 3) (compare-and-set! a 1 3) @a])"),
                         juce::String("[false true 3]"));

            ExprValue atom = ExprValue::atom(ExprValue::fromInt(1));
            juce::int64 version = 0;
            expectEquals(atom.getAtom()->deref(version).getInt(), (juce::int64)1);
            atom.getAtom()->reset(ExprValue::fromInt(2));
            expect(!atom.getAtom()->compareAndSet(version, ExprValue::fromInt(3)));
            expectEquals(atom.getAtom()->deref().getInt(), (juce::int64)2);
        }

        beginTest("Concurrent swap");
        {
            ExprTestHarness h;
            ExprOwner owner ("Busy");
            ExprResult result = h.compiler.compileExpression(
                "(swap! locals (fn [m] (assoc m :n (inc (get m :n 0)))))",
                nullptr, false, false, "Counter");
            expect(result.isSuccess(), result.getError().toString());

            juce::OwnedArray<SwapThread> threads;
            for (int i = 0 ; i < 4 ; i++)
              threads.add(new SwapThread(result.expression.get(), &owner, 250));
            for (auto t : threads)
              t->startThread();
            for (auto t : threads)
              expect(t->waitForThreadToExit(30000));

            int failures = 0;
            for (auto t : threads)
              failures += t->failures;
            expectEquals(failures, 0);
            expectEquals(owner.derefLocals().lookup(ExprValue::keyword("n")).getInt(), (juce::int64)1000);
        }

        beginTest("Printing goes to trace");
        {
            ExprTestHarness h;
            TraceCapture capture;
            GlobalTraceListener = &capture;
            (void)h.run("(println \"hello\" 42) (prn \"quoted\")");
            GlobalTraceListener = nullptr;
            expect(capture.lines.contains("hello 42"));
            expect(capture.lines.contains("\"quoted\""));
        }

        beginTest("Owner");
        {
            ExprOwner owner ("Trigger 2");
            ExprValue data = owner.toValue();
            expectEquals(data.lookup(ExprValue::keyword("name")).getName(), juce::String("Trigger 2"));
            expect(data.lookup(ExprValue::keyword("locals")).isAtom());

            owner.setExtra("index", ExprValue::fromInt(2));
            owner.setExtra("name", ExprValue::fromString("Imposter"));
            data = owner.toValue();
            expectEquals(data.lookup(ExprValue::keyword("index")).getInt(), (juce::int64)2);
            expectEquals(data.lookup(ExprValue::keyword("name")).getName(), juce::String("Trigger 2"));

            owner.getLocals().getAtom()->reset(ExprValue::map().assoc(ExprValue::keyword("x"), ExprValue::fromInt(1)));
            expectEquals(owner.derefLocals().size(), 1);
            owner.resetLocals();
            expect(owner.derefLocals().isEmpty());
        }

        beginTest("Slot definitions");
        {
            expectEquals(ExprSlotDefinitions::getNames().size(), 13);
            const ExprSlotDefinition* def = ExprSlotDefinitions::find("deactivation");
            expect(def != nullptr);
            expect(def->nilGuarded);
            expectEquals(juce::String(def->kind), juce::String("status"));
            expect(ExprSlotDefinitions::find(ExprSlotTriggerBeat) != nullptr);
            expect(ExprSlotDefinitions::find("nope") == nullptr);
            expect(ExprSlotDefinitions::find(ExprSlotGlobalSetup)->noOwnerLocals);
        }

        ExprEnvironment env;
        expect(env.initialize(), env.getErrors().size() > 0 ? env.getErrors()[0].toString() : juce::String());

        beginTest("Slot lifecycle");
        {
            ExprOwner owner ("Trigger 1");
            ExprSlot slot (ExprSlotDefinitions::find(ExprSlotTriggerSetup), "Trigger 1");
            expectEquals(juce::String(ExprSlot::getStateName(slot.getState())), juce::String("Empty"));
            expectEquals(slot.getTitle(), juce::String("Trigger 1 Setup Expression"));
            expect(slot.invoke(ExprValue(), &owner).value.isNil());

            expect(slot.compile(&env, "(swap! locals assoc :ready true) :done"));
            expect(slot.getState() == ExprSlotInstalled);
            ExprInvocation run = slot.invoke(ExprValue(), &owner);
            expectEquals(run.value.print(), juce::String(":done"));
            expect(owner.derefLocals().lookup(ExprValue::keyword("ready")).getBool());

            expect(!slot.compile(&env, "(swap! locals"));
            expect(slot.getState() == ExprSlotFailed);
            expect(slot.hasError());
            expectEquals(slot.getError().title, juce::String("Trigger 1 Setup Expression"));
            expect(slot.getExpression() == nullptr);
            expect(slot.invoke(ExprValue(), &owner).value.isNil());

            expect(slot.compile(&env, "1"));
            expect(!slot.hasError());
            expectEquals(slot.getSource(), juce::String("1"));

            expect(slot.compile(&env, "   "));
            expect(slot.getState() == ExprSlotEmpty);
            expect(slot.getExpression() == nullptr);

            ExprSlot keeper (ExprSlotDefinitions::find(ExprSlotTriggerSetup));
            keeper.setKeepOnFailure(true);
            expect(keeper.compile(&env, "2"));
            expect(!keeper.compile(&env, "(undefined-thing)"));
            expect(keeper.getState() == ExprSlotFailed);
            expectEquals(keeper.invoke(ExprValue(), &owner).value.getInt(), (juce::int64)2);
        }

        beginTest("Shared slot");
        {
            ExprSlot shared (ExprSlotDefinitions::find(ExprSlotSharedFunctions));
            expect(shared.compile(&env, "(defn slot-helper [n] (* n 3))"));
            expect(shared.getState() == ExprSlotInstalled);
            expect(shared.invoke(ExprValue(), nullptr).value.isNil());

            ExprSlot global (ExprSlotDefinitions::find(ExprSlotGlobalSetup));
            expect(global.compile(&env, "(swap! globals assoc :tripled (slot-helper 5))"));
            expect(global.invoke(ExprValue(), nullptr).isSuccess());
            ExprValue globals = env.lookup("globals");
            expectEquals(globals.getAtom()->deref().lookup(ExprValue::keyword("tripled")).getInt(), (juce::int64)15);

            // no owner locals for global setup
            expect(!global.compile(&env, "locals"));
        }

        beginTest("Environment operations");
        {
            ExprResult result = env.compileExpression("(+ 1 2)", "status", false, false, "Sum");
            expect(result.isSuccess());
            ExprOwner owner ("Trigger 9");
            ExprInvocation run = env.invoke(result.expression.get(), ExprValue(), &owner);
            expectEquals(run.value.getInt(), (juce::int64)3);

            run = env.invoke(nullptr, ExprValue(), &owner);
            expect(!run.isSuccess());

            env.define("answer", ExprValue::fromInt(42));
            expectEquals(env.lookup("answer").getInt(), (juce::int64)42);
            expect(env.lookup("never-defined").isNil());

            StructureDumper d;
            env.dump(d);
            expect(d.getText().contains("ExprEnvironment"));

            StructureDumper nested;
            nested.start("Top");
            nested.add("n", 1);
            nested.newline();
            nested.inc();
            nested.block("source", "(a\n b)");
            expectEquals(nested.getText(), juce::String("Top n=1\n  source:\n    (a\n     b)\n"));

            StructureDumper ed;
            result.expression->dump(ed);
            expect(ed.getText().contains("title=Sum"));
            expect(ed.getText().contains("(+ 1 2)"));
        }

        beginTest("Concurrent compiles and loads");
        {
            juce::OwnedArray<CompileThread> threads;
            for (int i = 0 ; i < 4 ; i++)
              threads.add(new CompileThread(&env, i, 25));
            for (auto t : threads)
              t->startThread();
            for (auto t : threads)
              expect(t->waitForThreadToExit(60000));

            for (auto t : threads)
              expectEquals(t->failures, 0, t->firstFailure);

            for (int id = 0 ; id < 4 ; id++) {
                for (int i = 0 ; i < 25 ; i++) {
                    juce::String name = "shared-" + juce::String(id) + "-" + juce::String(i);
                    expectEquals(env.lookup(name).getInt(), (juce::int64)i, name);
                }
            }
        }

        beginTest("Not initialized");
        {
            ExprEnvironment fresh;
            expect(!fresh.isReady());
            ExprResult result = fresh.compileExpression("1", "status", false, false, "Early");
            expect(!result.isSuccess());
            expectEquals(result.getError().message, juce::String("Expression environment is not initialized"));
            expectEquals(result.getError().title, juce::String("Early"));
            result = fresh.loadSharedDefinitions("(def x 1)", "Early");
            expect(!result.isSuccess());
        }

        beginTest("Config");
        {
            ExprConfig config;
            expect(config.parseXml(ExtensionConfig));
            expectEquals(config.traceLevel, 1);
            expect(config.diagnosticMode);
            expectEquals(config.sharedDefinitions, juce::String("shared.clj"));
            expect(config.getCatalog() != nullptr);

            ExprConfig copy;
            expect(copy.parseXml(config.toXml()));
            expect(copy.diagnosticMode);
            expectEquals(copy.sharedDefinitions, juce::String("shared.clj"));
            expect(copy.getCatalog() != nullptr);

            ExprConfig bad;
            expect(!bad.parseXml("<ExprConfig"));
            expect(bad.getErrors().size() > 0);
            expect(!bad.parseXml("<Something/>"));
        }

        beginTest("Extension kinds");
        {
            ExprConfig config;
            expect(config.parseXml(ExtensionConfig));
            ExprEnvironment extended;
            expect(extended.initialize(&config));
            ExprResult result = extended.compileExpression("(+ answer doubled)", "Custom", false, false, "Custom");
            expect(result.isSuccess(), result.getError().toString());
            expectEquals(result.expression->getPrelude().joinIntoString(","), juce::String("answer,doubled"));
            expectEquals(extended.invoke(result.expression.get(), ExprValue(), nullptr).value.getInt(),
                         (juce::int64)126);
            expect(extended.renderHelp("Custom").contains("The answer"));

            ExprConfig broken;
            expect(broken.parseXml(BrokenConfig));
            ExprEnvironment refused;
            expect(!refused.initialize(&broken));
            expect(!refused.isReady());
            expect(refused.getErrors().size() > 0);
            expect(!refused.compileExpression("1", "status", false, false, "Refused").isSuccess());
        }

        // initialize took the level from the configs
        TraceDebugLevel = savedTraceLevel;
    }
};

const char* RuntimeTest::ExtensionConfig =
    "<ExprConfig traceLevel='1' diagnosticMode='true' sharedDefinitions='shared.clj'>"
    "  <Catalog>"
    "    <Kind name='Custom' description='A kind for testing'>"
    "      <Binding name='answer' doc='The answer'>42</Binding>"
    "      <Binding name='doubled' requires='answer' doc='Twice the answer'>(* answer 2)</Binding>"
    "    </Kind>"
    "  </Catalog>"
    "</ExprConfig>";

const char* RuntimeTest::BrokenConfig =
    "<ExprConfig>"
    "  <Catalog>"
    "    <Kind name='Orphan' inherits='Nowhere'/>"
    "  </Catalog>"
    "</ExprConfig>";

static RuntimeTest runtimeTest;
