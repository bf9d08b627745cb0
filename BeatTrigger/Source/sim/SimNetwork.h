/**
 * A pretend DJ network with two players and a mixer.
 *
 * Owns the finder objects the standard helpers look things up in and
 * knows how to make a plausible event of every standard kind.  Once
 * installed in an environment the metadata, playback position and beat
 * grid bindings return real values instead of nil.
 */

#pragma once

#include <JuceHeader.h>

#include "../expr/ExprValue.h"
#include "../expr/ExprObject.h"
#include "SimDevice.h"

/**
 * Finds the device number of whatever update a finder was handed.
 */
class SimFinder : public ExprObject
{
  public:

    SimFinder(class SimNetwork* n) : network(n) {}
    virtual ~SimFinder() {}

    bool isInstance(juce::String className) override {
        return (className == getClassName() || className == "Object");
    }

  protected:

    class SimNetwork* network = nullptr;

    int deviceNumber(const juce::String& method, const juce::Array<ExprValue>& args);
};

class SimTimeFinder : public SimFinder
{
  public:
    SimTimeFinder(class SimNetwork* n) : SimFinder(n) {}
    juce::String getClassName() override {return "TimeFinder";}
    bool invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result) override;
};

class SimMetadataFinder : public SimFinder
{
  public:
    SimMetadataFinder(class SimNetwork* n) : SimFinder(n) {}
    juce::String getClassName() override {return "MetadataFinder";}
    bool invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result) override;
};

class SimBeatGridFinder : public SimFinder
{
  public:
    SimBeatGridFinder(class SimNetwork* n) : SimFinder(n) {}
    juce::String getClassName() override {return "BeatGridFinder";}
    bool invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result) override;
};

class SimVirtualCdj : public SimFinder
{
  public:
    SimVirtualCdj(class SimNetwork* n) : SimFinder(n) {}
    juce::String getClassName() override {return "VirtualCdj";}
    bool invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result) override;
};

/**
 * What the network knows about one player.
 */
class SimPlayer
{
  public:

    int number = 0;
    bool loaded = false;
    juce::int64 milliseconds = 0;
    int beat = 0;
    juce::ReferenceCountedObjectPtr<SimTrackMetadata> metadata;
    juce::ReferenceCountedObjectPtr<SimBeatGrid> grid;
    juce::ReferenceCountedObjectPtr<SimUpdate> status;
};

class SimNetwork
{
  public:

    SimNetwork();
    ~SimNetwork();

    /**
     * Define the finders in an environment.
     */
    void install(class ExprEnvironment* env);

    // stop answering position queries, like a time finder that isn't running
    void setTimeFinderRunning(bool b) {timeFinderRunning = b;}
    bool isTimeFinderRunning() {return timeFinderRunning;}

    SimPlayer* getPlayer(int number);

    //
    // Events
    //

    SimUpdate* makeBeat(int device);
    SimUpdate* makeCdjStatus(int device);
    SimUpdate* makeMixerStatus();

    // the [beat position] vector
    ExprValue makeBeatPosition(int device);

    /**
     * An event suitable for a kind, nil for kinds that don't
     * have one.
     */
    ExprValue makeEvent(juce::String kind);

  private:

    juce::OwnedArray<SimPlayer> players;
    bool timeFinderRunning = true;

    ExprValue timeFinder;
    ExprValue metadataFinder;
    ExprValue beatGridFinder;
    ExprValue virtualCdj;

    void loadTrack(SimPlayer* player, juce::String title, juce::String artist, int seconds);
};
