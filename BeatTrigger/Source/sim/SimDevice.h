/**
 * Stand-ins for the objects the DJ network delivers to expressions.
 *
 * The real application gets these from the network library.  Here they
 * are plain objects with public fields so the console can show what an
 * expression does with a realistic event, and the tests can check the
 * standard bindings without a network.  Method names are the ones the
 * standard bindings and helpers call.
 */

#pragma once

#include <JuceHeader.h>

#include "../expr/ExprValue.h"
#include "../expr/ExprObject.h"

/**
 * The three concrete update classes.
 */
typedef enum {
    SimUpdateBeat,
    SimUpdateCdjStatus,
    SimUpdateMixerStatus
} SimUpdateType;

/**
 * A beat, a player status, or a mixer status.  All of them are
 * a DeviceUpdate, the player-only methods fail on the others.
 */
class SimUpdate : public ExprObject
{
  public:

    SimUpdate(SimUpdateType t) : type(t) {}
    ~SimUpdate() {}

    SimUpdateType type;

    juce::String address = "192.168.1.101";
    juce::String deviceName = "CDJ-3000";
    int deviceNumber = 1;
    juce::int64 timestamp = 0;

    // 1048576 is normal speed
    int pitch = 1048576;
    // track BPM times 100
    int bpm = 12800;
    int beatWithinBar = 1;
    bool beatWithinBarMeaningful = true;
    bool tempoMaster = false;

    // player status
    int beatNumber = 1;
    bool atEnd = false;
    bool busy = true;
    int cueCountdown = 511;
    bool cued = false;
    bool looping = false;
    bool onAir = true;
    bool paused = false;
    bool playing = true;
    int rekordboxId = 0;
    bool synced = false;
    int trackNumber = 0;
    int trackSourcePlayer = 0;
    juce::String trackSourceSlot = "NO_TRACK";
    juce::String trackType = "NO_TRACK";

    double getEffectiveTempo();
    juce::String formatCueCountdown();

    juce::String getClassName() override;
    bool isInstance(juce::String className) override;
    bool invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result) override;
    juce::String describe() override;

  private:

    bool invokeStatus(const juce::String& method, ExprValue& result);
};

/**
 * Where a player is in its track.
 */
class SimTrackPosition : public ExprObject
{
  public:

    SimTrackPosition(juce::int64 ms, int beat) : milliseconds(ms), beatNumber(beat) {}
    ~SimTrackPosition() {}

    juce::int64 milliseconds = 0;
    int beatNumber = 0;

    juce::String getClassName() override {return "TrackPositionUpdate";}
    bool isInstance(juce::String className) override;
    bool invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result) override;
};

/**
 * A hot cue or memory point.
 */
class SimCueEntry : public ExprObject
{
  public:

    SimCueEntry(juce::int64 ms, juce::String n, int hot = 0) : milliseconds(ms), name(n), hotCueNumber(hot) {}
    ~SimCueEntry() {}

    juce::int64 milliseconds = 0;
    juce::String name;
    int hotCueNumber = 0;

    juce::String getClassName() override {return "CueEntry";}
    bool isInstance(juce::String className) override;
    bool invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result) override;
    juce::String describe() override;
};

class SimCueList : public ExprObject
{
  public:

    SimCueList() {}
    ~SimCueList() {}

    // kept in time order
    void add(SimCueEntry* entry);

    // first entry after the time, nullptr if none
    SimCueEntry* findEntryAfter(juce::int64 ms);
    // last entry at or before the time, nullptr if none
    SimCueEntry* findEntryBefore(juce::int64 ms);

    juce::String getClassName() override {return "CueList";}
    bool isInstance(juce::String className) override;
    bool invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result) override;

  private:

    juce::ReferenceCountedArray<SimCueEntry> entries;
};

class SimTrackMetadata : public ExprObject
{
  public:

    SimTrackMetadata() {}
    ~SimTrackMetadata() {}

    juce::String title;
    juce::String artist;
    juce::String album;
    juce::String comment;
    juce::String genre;
    juce::String key;
    juce::String label;
    // seconds
    int duration = 0;

    juce::ReferenceCountedObjectPtr<SimCueList> cueList;

    juce::String getClassName() override {return "TrackMetadata";}
    bool isInstance(juce::String className) override;
    bool invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result) override;
    juce::String describe() override;
};

/**
 * Bars are four beats counting from beat 1.
 */
class SimBeatGrid : public ExprObject
{
  public:

    SimBeatGrid(int beats) : beatCount(beats) {}
    ~SimBeatGrid() {}

    int beatCount = 0;

    int getBarNumber(int beat);

    juce::String getClassName() override {return "BeatGrid";}
    bool isInstance(juce::String className) override;
    bool invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result) override;
};
