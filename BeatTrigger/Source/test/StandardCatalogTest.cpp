/**
 * The standard kinds evaluated against the simulated network.
 */

#include <JuceHeader.h>

#include "../expr/ExprValue.h"
#include "../expr/ExprError.h"
#include "../expr/ExprCatalog.h"
#include "../expr/ExprEnvironment.h"
#include "../expr/ExprExpression.h"
#include "../sim/SimDevice.h"
#include "../sim/SimNetwork.h"

class StandardCatalogTest : public juce::UnitTest
{
  public:

    StandardCatalogTest() : juce::UnitTest("Standard Catalog", "BeatTrigger") {}

    /**
     * Printed value of the expression, or the error message.
     */
    juce::String eval(ExprEnvironment& env, juce::String kind, juce::String source, const ExprValue& event)
    {
        ExprResult result = env.compileExpression(source, kind, false, true, kind + " test");
        if (!result.isSuccess())
          return "compile error: " + result.getError().getSummary();

        ExprInvocation run = result.expression->invoke(event, ExprValue());
        if (!run.isSuccess())
          return "error: " + run.error.getSummary();

        return run.value.print();
    }

    void runTest() override
    {
        SimNetwork network;
        ExprEnvironment env;
        expect(env.initialize());
        network.install(&env);

        beginTest("Kinds");
        {
            juce::StringArray names = env.getCatalog()->getKindNames();
            for (auto kind : {ExprKindDeviceUpdate, ExprKindBeat, ExprKindMixerStatus, ExprKindCdjStatus,
                              ExprKindMetadata, ExprKindBeatMixin, ExprKindBeatPosition, ExprKindStatus})
              expect(names.contains(ExprStandardKindName(kind)), ExprStandardKindName(kind));

            const ExprBindingSet* status = env.resolveBindings(ExprKindStatus);
            expect(status->contains("track-title"));
            expect(status->contains("cue-countdown"));
            expect(status->contains("address"));

            const ExprBindingSet* mixer = env.resolveBindings(ExprKindMixerStatus);
            expect(!mixer->contains("track-title"));
            expect(mixer->contains("tempo-master?"));
        }

        beginTest("Nil guard covers every binding");
        {
            for (auto kind : {ExprKindDeviceUpdate, ExprKindBeat, ExprKindMixerStatus, ExprKindCdjStatus,
                              ExprKindMetadata, ExprKindBeatMixin, ExprKindBeatPosition, ExprKindStatus}) {
                juce::String kindName = ExprStandardKindName(kind);
                juce::StringArray names = env.resolveBindings(kind)->getNames();
                expect(names.size() > 0, kindName);

                juce::String source = "[" + names.joinIntoString(" ") + "]";
                ExprResult result = env.compileExpression(source, kindName, true, true, kindName + " nil guard");
                expect(result.isSuccess(), kindName + ": " + result.getError().getSummary());
                if (!result.isSuccess())
                  continue;

                ExprInvocation run = result.expression->invoke(ExprValue(), ExprValue());
                expect(run.isSuccess(), kindName + ": " + run.error.getSummary());
                expect(run.value.isVector(), kindName);
                const juce::Array<ExprValue>& items = run.value.getItems();
                expectEquals(items.size(), names.size(), kindName);
                for (int i = 0 ; i < items.size() ; i++)
                  expect(items[i].isNil(), kindName + " " + names[i] + " gave " + items[i].print());
            }
        }

        beginTest("CdjStatus");
        {
            ExprValue event = network.makeEvent("CdjStatus");
            expectEquals(eval(env, "CdjStatus", "track-title", event), juce::String("\"Strobe\""));
            expectEquals(eval(env, "CdjStatus", "track-artist", event), juce::String("\"deadmau5\""));
            expectEquals(eval(env, "CdjStatus", "[track-key track-length]", event), juce::String("[\"Fm\" 637]"));
            expectEquals(eval(env, "CdjStatus", "beat-number", event), juce::String("129"));
            expectEquals(eval(env, "CdjStatus", "bar-number", event), juce::String("33"));
            expectEquals(eval(env, "CdjStatus", "[track-source-slot track-type]", event),
                         juce::String("[:usb-slot :rekordbox]"));
            expectEquals(eval(env, "CdjStatus", "[pitch-percent pitch-multiplier]", event), juce::String("[0.0 1.0]"));
            expectEquals(eval(env, "CdjStatus", "[track-bpm effective-tempo raw-bpm]", event),
                         juce::String("[128.0 128.0 12800]"));
            expectEquals(eval(env, "CdjStatus", "[cue-countdown cue-countdown-text]", event),
                         juce::String("[64 \"15.4\"]"));
            expectEquals(eval(env, "CdjStatus", "track-time-reached", event), juce::String("60000"));
            expectEquals(eval(env, "CdjStatus", "[(.getComment next-cue) (.getComment previous-cue)]", event),
                         juce::String("[\"Drop\" \"Intro\"]"));
            expectEquals(eval(env, "CdjStatus", "[cdj? mixer? beat? playing? tempo-master?]", event),
                         juce::String("[true false false true true]"));
            expectEquals(eval(env, "CdjStatus", "(when (and playing? (> bar-number 32)) device-name)", event),
                         juce::String("\"CDJ-3000\""));
        }

        beginTest("Empty player");
        {
            ExprValue event = ExprValue::object(network.makeCdjStatus(2));
            expectEquals(eval(env, "CdjStatus", "[track-title track-source-slot rekordbox-id]", event),
                         juce::String("[nil :no-track 0]"));
            expectEquals(eval(env, "CdjStatus", "bar-number", event), juce::String("-1"));
            expectEquals(eval(env, "CdjStatus", "cue-countdown-text", event), juce::String("\"--.-\""));
        }

        beginTest("Beat");
        {
            ExprValue event = network.makeEvent("Beat");
            expectEquals(eval(env, "Beat", "[beat-number bar-number beat-within-bar]", event),
                         juce::String("[129 33 1]"));
            expectEquals(eval(env, "Beat", "[beat? cdj? tempo-master? on-air?]", event),
                         juce::String("[true true true true]"));
            expectEquals(eval(env, "Beat", "track-title", event), juce::String("\"Strobe\""));
            expectEquals(eval(env, "Beat", "(= beat status)", event), juce::String("true"));
        }

        beginTest("Beat with track position");
        {
            ExprValue event = network.makeEvent("beat-tpu");
            expectEquals(eval(env, "beat-tpu", "[track-time-reached beat-number bar-number]", event),
                         juce::String("[60000 129 33]"));
            expectEquals(eval(env, "beat-tpu", "[device-number cdj? mixer? beat?]", event),
                         juce::String("[1 true false true]"));
            expectEquals(eval(env, "beat-tpu", "(.getComment next-cue)", event), juce::String("\"Drop\""));
            expectEquals(eval(env, "beat-tpu", "track-title", event), juce::String("\"Strobe\""));
        }

        beginTest("MixerStatus");
        {
            ExprValue event = network.makeEvent("MixerStatus");
            expectEquals(eval(env, "MixerStatus", "[device-number device-name mixer? cdj?]", event),
                         juce::String("[33 \"DJM-900NXS2\" true false]"));
            expectEquals(eval(env, "MixerStatus", "bar-meaningful?", event), juce::String("false"));
            expectEquals(eval(env, "status", "mixer?", event), juce::String("true"));
        }

        beginTest("Time finder stopped");
        {
            network.setTimeFinderRunning(false);
            ExprValue event = network.makeEvent("CdjStatus");
            expectEquals(eval(env, "CdjStatus", "[track-time-reached next-cue previous-cue]", event),
                         juce::String("[nil nil nil]"));
            expectEquals(eval(env, "Beat", "beat-number", network.makeEvent("Beat")), juce::String("-1"));
            network.setTimeFinderRunning(true);
        }

        beginTest("Finders not installed");
        {
            ExprEnvironment bare;
            expect(bare.initialize());
            ExprValue event = network.makeEvent("CdjStatus");
            expectEquals(eval(bare, "CdjStatus", "[track-title track-time-reached bar-number]", event),
                         juce::String("[nil nil -1]"));
            expectEquals(eval(bare, "Beat", "[beat-number on-air?]", network.makeEvent("Beat")),
                         juce::String("[-1 nil]"));
        }

        beginTest("Helpers are shared definitions");
        {
            expectEquals(eval(env, "none", "(Util/pitchToPercentage 1153434)", ExprValue()).substring(0, 4),
                         juce::String("10.0"));
            expectEquals(eval(env, "none", "(extract-device-number nil)", ExprValue()), juce::String("nil"));
        }

        beginTest("Help");
        {
            juce::String help = env.renderHelp("CdjStatus");
            expect(help.contains("track-title"));
            expect(help.contains("`:usb-slot`"));
            expect(!help.contains("<code>"));
            expect(env.renderHelp("Nothing").startsWith("Unknown kind"));
        }
    }
};

static StandardCatalogTest standardCatalogTest;
