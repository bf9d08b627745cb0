/**
 * Command line access to the expression engine.
 *
 *    BeatTriggerConsole --kinds
 *    BeatTriggerConsole --help-kind CdjStatus
 *    BeatTriggerConsole --compile Beat "(when tempo-master? beat-number)"
 *    BeatTriggerConsole --eval beat-tpu "[bar-number track-title]"
 *    BeatTriggerConsole --dump
 *
 * Any command may be given --config <file> to start the environment
 * from an ExprConfig file.  Evaluation runs against the simulated
 * network so the standard bindings have something to look at.
 */

#include <JuceHeader.h>

#include "../util/Trace.h"
#include "../util/StructureDumper.h"

#include "../expr/ExprValue.h"
#include "../expr/ExprError.h"
#include "../expr/ExprBinding.h"
#include "../expr/ExprConfig.h"
#include "../expr/ExprEnvironment.h"
#include "../expr/ExprExpression.h"
#include "../expr/ExprOwner.h"
#include "../expr/ExprSlot.h"

#include "../sim/SimNetwork.h"

static void printErrors(const juce::Array<ExprError>& errors)
{
    for (auto error : errors)
      std::cout << error.toString() << std::endl;
}

/**
 * Build the environment, applying the config file if there is one,
 * then install the simulated finders.
 */
static void startEnvironment(const juce::ArgumentList& args, ExprEnvironment& env, SimNetwork& network)
{
    ExprConfig config;

    if (args.containsOption("--config")) {
        juce::File file = args.getExistingFileForOption("--config");
        if (!config.parseXml(file.loadFileAsString()))
          juce::ConsoleApplication::fail(config.getErrors().joinIntoString("\n"), 1);
    }

    if (!env.initialize(&config)) {
        printErrors(env.getErrors());
        juce::ConsoleApplication::fail("Unable to initialize the expression environment", 1);
    }

    if (config.sharedDefinitions.length() > 0) {
        juce::File file = juce::File::getCurrentWorkingDirectory().getChildFile(config.sharedDefinitions);
        if (!file.existsAsFile())
          juce::ConsoleApplication::fail("Shared definitions file not found: " + file.getFullPathName(), 1);

        ExprResult result = env.loadSharedDefinitions(file.loadFileAsString(), file.getFileName());
        if (!result.isSuccess()) {
            printErrors(result.errors);
            juce::ConsoleApplication::fail("Unable to load shared definitions", 1);
        }
    }

    network.install(&env);
}

/**
 * The arguments following an option, failing if there aren't enough.
 */
static juce::StringArray getOperands(const juce::ArgumentList& args, const char* option, int count,
                                     const char* usage)
{
    juce::StringArray operands;
    int index = args.indexOfOption(option);
    for (int i = index + 1 ; i < args.size() && operands.size() < count ; i++) {
        juce::String text = args[i].text;
        if (text == "--config") {
            // skip the option and its file
            i++;
            continue;
        }
        operands.add(text);
    }

    if (operands.size() < count)
      juce::ConsoleApplication::fail(juce::String("Usage: ") + usage, 1);

    return operands;
}

static ExprExpression::Ptr compile(ExprEnvironment& env, juce::String kind, juce::String source)
{
    const ExprBindingSet* bindings = env.resolveBindings(kind);
    if (bindings->isEmpty())
      Trace(1, "Console: Kind %s has no bindings", kind.toUTF8());

    ExprResult result = env.compileExpression(source, bindings, true, false, "Console Expression");
    if (!result.isSuccess()) {
        printErrors(result.errors);
        juce::ConsoleApplication::fail("Compilation failed", 1);
    }
    return result.expression;
}

//////////////////////////////////////////////////////////////////////
//
// Commands
//
//////////////////////////////////////////////////////////////////////

static void listKinds(const juce::ArgumentList& args)
{
    ExprEnvironment env;
    SimNetwork network;
    startEnvironment(args, env, network);

    ExprCatalog* catalog = env.getCatalog();
    for (auto name : catalog->getKindNames()) {
        ExprKind* kind = catalog->getKind(name);
        std::cout << name;
        if (kind->inherits.size() > 0)
          std::cout << " (" << kind->inherits.joinIntoString(", ") << ")";
        std::cout << std::endl;
        if (kind->description.length() > 0)
          std::cout << "    " << kind->description << std::endl;
    }
}

static void helpKind(const juce::ArgumentList& args)
{
    juce::StringArray operands = getOperands(args, "--help-kind", 1, "--help-kind <kind>");

    ExprEnvironment env;
    SimNetwork network;
    startEnvironment(args, env, network);

    std::cout << env.renderHelp(operands[0]);
}

static void compileCommand(const juce::ArgumentList& args)
{
    juce::StringArray operands = getOperands(args, "--compile", 2, "--compile <kind> <source>");

    ExprEnvironment env;
    SimNetwork network;
    startEnvironment(args, env, network);

    ExprExpression::Ptr expression = compile(env, operands[0], operands[1]);
    std::cout << "prelude: " << expression->getPrelude().joinIntoString(" ") << std::endl;
    std::cout << expression->getForm().print() << std::endl;
}

static void evalCommand(const juce::ArgumentList& args)
{
    juce::StringArray operands = getOperands(args, "--eval", 2, "--eval <kind> <source>");

    ExprEnvironment env;
    SimNetwork network;
    startEnvironment(args, env, network);

    ExprExpression::Ptr expression = compile(env, operands[0], operands[1]);

    ExprOwner owner ("Console");
    ExprInvocation result = env.invoke(expression.get(), network.makeEvent(operands[0]), &owner);
    if (result.isSuccess()) {
        std::cout << result.value.print() << std::endl;
    }
    else {
        std::cout << result.error.toString() << std::endl;
        juce::ConsoleApplication::fail("Evaluation failed", 1);
    }
}

static void listSlots(const juce::ArgumentList& args)
{
    (void)args;
    for (auto name : ExprSlotDefinitions::getNames()) {
        const ExprSlotDefinition* def = ExprSlotDefinitions::find(name);
        std::cout << name << ": " << def->title;
        if (def->kind != nullptr)
          std::cout << " [" << def->kind << "]";
        std::cout << std::endl << "    " << def->description << std::endl;
    }
}

static void dumpCommand(const juce::ArgumentList& args)
{
    ExprEnvironment env;
    SimNetwork network;
    startEnvironment(args, env, network);

    StructureDumper d;
    env.dump(d);
    std::cout << d.getText();
}

int main(int argc, char* argv[])
{
    // trace goes to stderr, results to stdout
    TraceToStdout = false;
    TraceDebugLevel = 1;

    juce::ConsoleApplication app;

    app.addHelpCommand("--help|-h", "Usage:", true);
    app.addVersionCommand("--version|-v", "BeatTriggerConsole 1.0");

    app.addCommand({"--kinds", "--kinds", "List the event kinds", "", listKinds});
    app.addCommand({"--help-kind", "--help-kind <kind>", "Show the values available to a kind", "", helpKind});
    app.addCommand({"--compile", "--compile <kind> <source>", "Compile and show the generated function", "", compileCommand});
    app.addCommand({"--eval", "--eval <kind> <source>", "Compile and run against a simulated event", "", evalCommand});
    app.addCommand({"--slots", "--slots", "List the expression slots", "", listSlots});
    app.addCommand({"--dump", "--dump", "Dump the environment", "", dumpCommand});

    return app.findAndRunCommand(argc, argv);
}
