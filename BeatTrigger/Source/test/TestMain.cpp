/**
 * Runs every registered expression test and exits non-zero
 * if any of them failed.
 */

#include <JuceHeader.h>

#include "../util/Trace.h"

int main(int argc, char* argv[])
{
    (void)argc;
    (void)argv;

    // errors are expected by many tests, keep the noise down
    TraceToStdout = false;
    TraceDebugLevel = 0;

    juce::UnitTestRunner runner;
    runner.setAssertOnFailure(false);
    runner.runTestsInCategory("BeatTrigger");

    int failures = 0;
    for (int i = 0 ; i < runner.getNumResults() ; i++) {
        const juce::UnitTestRunner::TestResult* result = runner.getResult(i);
        if (result != nullptr)
          failures += result->failures;
    }

    if (failures > 0)
      std::cerr << failures << " test failures" << std::endl;

    return (failures > 0) ? 1 : 0;
}
