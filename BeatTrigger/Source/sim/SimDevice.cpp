
#include <JuceHeader.h>

#include "../expr/ExprValue.h"
#include "../expr/ExprObject.h"
#include "../expr/ExprError.h"

#include "SimDevice.h"

static void checkArgs(const juce::String& method, const juce::Array<ExprValue>& args, int count)
{
    if (args.size() != count)
      throw ExprException("Wrong number of args (" + juce::String(args.size()) + ") passed to ." + method);
}

static juce::int64 intArg(const juce::String& method, const ExprValue& arg)
{
    if (!arg.isNumber())
      throw ExprException("." + method + " expects a number, got " + juce::String(arg.getTypeName()));
    return arg.isInt() ? arg.getInt() : (juce::int64)arg.getFloat();
}

//////////////////////////////////////////////////////////////////////
//
// Updates
//
//////////////////////////////////////////////////////////////////////

juce::String SimUpdate::getClassName()
{
    juce::String name;
    switch (type) {
        case SimUpdateBeat: name = "Beat"; break;
        case SimUpdateCdjStatus: name = "CdjStatus"; break;
        case SimUpdateMixerStatus: name = "MixerStatus"; break;
    }
    return name;
}

bool SimUpdate::isInstance(juce::String className)
{
    return (className == getClassName() || className == "DeviceUpdate" || className == "Object");
}

double SimUpdate::getEffectiveTempo()
{
    return (bpm / 100.0) * (pitch / 1048576.0);
}

/**
 * The way the player shows it: bars and beats until the
 * next cue, or dashes when there isn't one close enough.
 */
juce::String SimUpdate::formatCueCountdown()
{
    if (cueCountdown == 511)
      return "--.-";

    if (cueCountdown >= 1 && cueCountdown <= 256) {
        int bars = (cueCountdown - 1) / 4;
        int beats = ((cueCountdown - 1) % 4) + 1;
        return juce::String(bars).paddedLeft('0', 2) + "." + juce::String(beats);
    }

    return "00.0";
}

bool SimUpdate::invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result)
{
    checkArgs(method, args, 0);
    bool found = true;

    if (method == "getAddress") result = ExprValue::fromString(address);
    else if (method == "getDeviceName") result = ExprValue::fromString(deviceName);
    else if (method == "getDeviceNumber") result = ExprValue::fromInt(deviceNumber);
    else if (method == "getTimestamp") result = ExprValue::fromInt(timestamp);
    else if (method == "getPitch") result = ExprValue::fromInt(pitch);
    else if (method == "getBpm") result = ExprValue::fromInt(bpm);
    else if (method == "getEffectiveTempo") result = ExprValue::fromFloat(getEffectiveTempo());
    else if (method == "getBeatWithinBar") result = ExprValue::fromInt(beatWithinBar);
    else if (method == "isBeatWithinBarMeaningful") result = ExprValue::fromBool(beatWithinBarMeaningful);
    else if (method == "isTempoMaster") result = ExprValue::fromBool(tempoMaster);
    else if (type == SimUpdateCdjStatus) found = invokeStatus(method, result);
    else if (type == SimUpdateMixerStatus && method == "isOnAir") result = ExprValue::fromBool(onAir);
    else found = false;

    return found;
}

bool SimUpdate::invokeStatus(const juce::String& method, ExprValue& result)
{
    bool found = true;

    if (method == "getBeatNumber") result = ExprValue::fromInt(beatNumber);
    else if (method == "isAtEnd") result = ExprValue::fromBool(atEnd);
    else if (method == "isBusy") result = ExprValue::fromBool(busy);
    else if (method == "getCueCountdown") result = ExprValue::fromInt(cueCountdown);
    else if (method == "formatCueCountdown") result = ExprValue::fromString(formatCueCountdown());
    else if (method == "isCued") result = ExprValue::fromBool(cued);
    else if (method == "isLooping") result = ExprValue::fromBool(looping);
    else if (method == "isOnAir") result = ExprValue::fromBool(onAir);
    else if (method == "isPaused") result = ExprValue::fromBool(paused);
    else if (method == "isPlaying") result = ExprValue::fromBool(playing);
    else if (method == "getRekordboxId") result = ExprValue::fromInt(rekordboxId);
    else if (method == "isSynced") result = ExprValue::fromBool(synced);
    else if (method == "getTrackNumber") result = ExprValue::fromInt(trackNumber);
    else if (method == "getTrackSourcePlayer") result = ExprValue::fromInt(trackSourcePlayer);
    else if (method == "getTrackSourceSlot") result = ExprValue::fromString(trackSourceSlot);
    else if (method == "getTrackType") result = ExprValue::fromString(trackType);
    else found = false;

    return found;
}

juce::String SimUpdate::describe()
{
    return "#object[" + getClassName() + " device " + juce::String(deviceNumber) +
        ", name: " + deviceName + "]";
}

//////////////////////////////////////////////////////////////////////
//
// Track position
//
//////////////////////////////////////////////////////////////////////

bool SimTrackPosition::isInstance(juce::String className)
{
    return (className == "TrackPositionUpdate" || className == "Object");
}

bool SimTrackPosition::invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result)
{
    checkArgs(method, args, 0);
    bool found = true;
    if (method == "getMilliseconds") result = ExprValue::fromInt(milliseconds);
    else if (method == "getBeatNumber") result = ExprValue::fromInt(beatNumber);
    else found = false;
    return found;
}

//////////////////////////////////////////////////////////////////////
//
// Cues
//
//////////////////////////////////////////////////////////////////////

bool SimCueEntry::isInstance(juce::String className)
{
    return (className == "CueEntry" || className == "Object");
}

bool SimCueEntry::invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result)
{
    checkArgs(method, args, 0);
    bool found = true;
    if (method == "getCueTime") result = ExprValue::fromInt(milliseconds);
    else if (method == "getComment") result = ExprValue::fromString(name);
    else if (method == "getHotCueNumber") result = ExprValue::fromInt(hotCueNumber);
    else if (method == "isHotCue") result = ExprValue::fromBool(hotCueNumber > 0);
    else found = false;
    return found;
}

juce::String SimCueEntry::describe()
{
    return "#object[CueEntry " + name + " at " + juce::String(milliseconds) + "ms]";
}

void SimCueList::add(SimCueEntry* entry)
{
    int index = 0;
    while (index < entries.size() && entries[index]->milliseconds <= entry->milliseconds)
      index++;
    entries.insert(index, entry);
}

SimCueEntry* SimCueList::findEntryAfter(juce::int64 ms)
{
    for (auto entry : entries) {
        if (entry->milliseconds > ms)
          return entry;
    }
    return nullptr;
}

SimCueEntry* SimCueList::findEntryBefore(juce::int64 ms)
{
    SimCueEntry* found = nullptr;
    for (auto entry : entries) {
        if (entry->milliseconds > ms)
          break;
        found = entry;
    }
    return found;
}

bool SimCueList::isInstance(juce::String className)
{
    return (className == "CueList" || className == "Object");
}

bool SimCueList::invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result)
{
    bool found = true;
    if (method == "findEntryAfter" || method == "findEntryBefore") {
        checkArgs(method, args, 1);
        juce::int64 ms = intArg(method, args[0]);
        SimCueEntry* entry = (method == "findEntryAfter") ? findEntryAfter(ms) : findEntryBefore(ms);
        if (entry != nullptr)
          result = ExprValue::object(entry);
    }
    else if (method == "size") {
        checkArgs(method, args, 0);
        result = ExprValue::fromInt(entries.size());
    }
    else {
        found = false;
    }
    return found;
}

//////////////////////////////////////////////////////////////////////
//
// Metadata and beat grids
//
//////////////////////////////////////////////////////////////////////

bool SimTrackMetadata::isInstance(juce::String className)
{
    return (className == "TrackMetadata" || className == "Object");
}

bool SimTrackMetadata::invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result)
{
    checkArgs(method, args, 0);
    bool found = true;
    if (method == "getTitle") result = ExprValue::fromString(title);
    else if (method == "getArtist") result = ExprValue::fromString(artist);
    else if (method == "getAlbum") result = ExprValue::fromString(album);
    else if (method == "getComment") result = ExprValue::fromString(comment);
    else if (method == "getGenre") result = ExprValue::fromString(genre);
    else if (method == "getKey") result = ExprValue::fromString(key);
    else if (method == "getLabel") result = ExprValue::fromString(label);
    else if (method == "getDuration") result = ExprValue::fromInt(duration);
    else if (method == "getCueList") {
        if (cueList != nullptr)
          result = ExprValue::object(cueList.get());
    }
    else found = false;
    return found;
}

juce::String SimTrackMetadata::describe()
{
    return "#object[TrackMetadata " + title + " by " + artist + "]";
}

int SimBeatGrid::getBarNumber(int beat)
{
    return ((beat - 1) / 4) + 1;
}

bool SimBeatGrid::isInstance(juce::String className)
{
    return (className == "BeatGrid" || className == "Object");
}

bool SimBeatGrid::invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result)
{
    bool found = true;
    if (method == "getBarNumber") {
        checkArgs(method, args, 1);
        juce::int64 beat = intArg(method, args[0]);
        if (beat < 1 || beat > beatCount)
          throw ExprException("Beat " + juce::String(beat) + " is outside the beat grid");
        result = ExprValue::fromInt(getBarNumber((int)beat));
    }
    else if (method == "getBeatCount") {
        checkArgs(method, args, 0);
        result = ExprValue::fromInt(beatCount);
    }
    else {
        found = false;
    }
    return found;
}
