
#include <JuceHeader.h>

#include "../util/Trace.h"

#include "../expr/ExprValue.h"
#include "../expr/ExprObject.h"
#include "../expr/ExprError.h"
#include "../expr/ExprStandardCatalog.h"
#include "../expr/ExprEnvironment.h"

#include "SimDevice.h"
#include "SimNetwork.h"

//////////////////////////////////////////////////////////////////////
//
// Finders
//
//////////////////////////////////////////////////////////////////////

int SimFinder::deviceNumber(const juce::String& method, const juce::Array<ExprValue>& args)
{
    if (args.size() != 1)
      throw ExprException("Wrong number of args (" + juce::String(args.size()) + ") passed to ." + method);

    SimUpdate* update = dynamic_cast<SimUpdate*>(args[0].getObject());
    if (update == nullptr)
      throw ExprException("." + method + " expects a DeviceUpdate, got " + args[0].print());

    return update->deviceNumber;
}

bool SimTimeFinder::invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result)
{
    bool found = true;
    if (method == "isRunning") {
        result = ExprValue::fromBool(network->isTimeFinderRunning());
    }
    else if (method == "getTimeFor") {
        SimPlayer* player = network->getPlayer(deviceNumber(method, args));
        juce::int64 ms = -1;
        if (player != nullptr && player->loaded && network->isTimeFinderRunning())
          ms = player->milliseconds;
        result = ExprValue::fromInt(ms);
    }
    else if (method == "getLatestPositionFor") {
        SimPlayer* player = network->getPlayer(deviceNumber(method, args));
        if (player != nullptr && player->loaded && network->isTimeFinderRunning())
          result = ExprValue::object(new SimTrackPosition(player->milliseconds, player->beat));
    }
    else {
        found = false;
    }
    return found;
}

bool SimMetadataFinder::invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result)
{
    bool found = true;
    if (method == "getLatestMetadataFor") {
        SimPlayer* player = network->getPlayer(deviceNumber(method, args));
        if (player != nullptr && player->metadata != nullptr)
          result = ExprValue::object(player->metadata.get());
    }
    else {
        found = false;
    }
    return found;
}

bool SimBeatGridFinder::invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result)
{
    bool found = true;
    if (method == "getLatestBeatGridFor") {
        SimPlayer* player = network->getPlayer(deviceNumber(method, args));
        if (player != nullptr && player->grid != nullptr)
          result = ExprValue::object(player->grid.get());
    }
    else {
        found = false;
    }
    return found;
}

bool SimVirtualCdj::invoke(juce::String method, const juce::Array<ExprValue>& args, ExprValue& result)
{
    bool found = true;
    if (method == "getLatestStatusFor") {
        SimPlayer* player = network->getPlayer(deviceNumber(method, args));
        if (player != nullptr && player->status != nullptr)
          result = ExprValue::object(player->status.get());
    }
    else {
        found = false;
    }
    return found;
}

//////////////////////////////////////////////////////////////////////
//
// Network
//
//////////////////////////////////////////////////////////////////////

SimNetwork::SimNetwork()
{
    for (int i = 1 ; i <= 2 ; i++) {
        SimPlayer* player = new SimPlayer();
        player->number = i;
        players.add(player);
    }

    loadTrack(players[0], "Strobe", "deadmau5", 637);
    players[0]->milliseconds = 60000;
    players[0]->beat = 129;
    players[0]->status = makeCdjStatus(1);

    timeFinder = ExprValue::object(new SimTimeFinder(this));
    metadataFinder = ExprValue::object(new SimMetadataFinder(this));
    beatGridFinder = ExprValue::object(new SimBeatGridFinder(this));
    virtualCdj = ExprValue::object(new SimVirtualCdj(this));
}

SimNetwork::~SimNetwork()
{
}

void SimNetwork::loadTrack(SimPlayer* player, juce::String title, juce::String artist, int seconds)
{
    SimTrackMetadata* metadata = new SimTrackMetadata();
    metadata->title = title;
    metadata->artist = artist;
    metadata->album = "For Lack of a Better Name";
    metadata->genre = "Progressive House";
    metadata->key = "Fm";
    metadata->label = "mau5trap";
    metadata->comment = "";
    metadata->duration = seconds;

    SimCueList* cues = new SimCueList();
    cues->add(new SimCueEntry(0, "Start", 0));
    cues->add(new SimCueEntry(30000, "Intro", 1));
    cues->add(new SimCueEntry(90000, "Drop", 2));
    cues->add(new SimCueEntry(300000, "Break", 3));
    metadata->cueList = cues;

    player->metadata = metadata;
    // 128 BPM across the whole track
    player->grid = new SimBeatGrid((seconds * 128) / 60);
    player->loaded = true;
}

void SimNetwork::install(ExprEnvironment* env)
{
    env->define(ExprStandardCatalog::TimeFinder, timeFinder);
    env->define(ExprStandardCatalog::MetadataFinder, metadataFinder);
    env->define(ExprStandardCatalog::BeatGridFinder, beatGridFinder);
    env->define(ExprStandardCatalog::VirtualCdj, virtualCdj);
    Trace(2, "SimNetwork: Installed finders");
}

SimPlayer* SimNetwork::getPlayer(int number)
{
    for (auto player : players) {
        if (player->number == number)
          return player;
    }
    return nullptr;
}

SimUpdate* SimNetwork::makeBeat(int device)
{
    SimUpdate* beat = new SimUpdate(SimUpdateBeat);
    beat->deviceNumber = device;
    beat->timestamp = juce::Time::getHighResolutionTicks();
    SimPlayer* player = getPlayer(device);
    if (player != nullptr)
      beat->beatWithinBar = ((player->beat - 1) % 4) + 1;
    beat->tempoMaster = (device == 1);
    return beat;
}

SimUpdate* SimNetwork::makeCdjStatus(int device)
{
    SimUpdate* status = new SimUpdate(SimUpdateCdjStatus);
    status->deviceNumber = device;
    status->timestamp = juce::Time::getHighResolutionTicks();
    status->tempoMaster = (device == 1);

    SimPlayer* player = getPlayer(device);
    if (player != nullptr && player->loaded) {
        status->beatNumber = player->beat;
        status->beatWithinBar = ((player->beat - 1) % 4) + 1;
        status->rekordboxId = 42;
        status->trackNumber = 3;
        status->trackSourcePlayer = device;
        status->trackSourceSlot = "USB_SLOT";
        status->trackType = "REKORDBOX";
        status->cueCountdown = 64;
    }
    else {
        status->playing = false;
        status->busy = false;
        status->beatNumber = 0;
    }
    return status;
}

SimUpdate* SimNetwork::makeMixerStatus()
{
    SimUpdate* status = new SimUpdate(SimUpdateMixerStatus);
    status->deviceNumber = 33;
    status->deviceName = "DJM-900NXS2";
    status->address = "192.168.1.133";
    status->timestamp = juce::Time::getHighResolutionTicks();
    status->beatWithinBarMeaningful = false;
    return status;
}

ExprValue SimNetwork::makeBeatPosition(int device)
{
    SimPlayer* player = getPlayer(device);
    juce::int64 ms = (player != nullptr) ? player->milliseconds : 0;
    int beat = (player != nullptr) ? player->beat : 0;

    juce::Array<ExprValue> items;
    items.add(ExprValue::object(makeBeat(device)));
    items.add(ExprValue::object(new SimTrackPosition(ms, beat)));
    return ExprValue::vector(items);
}

ExprValue SimNetwork::makeEvent(juce::String kind)
{
    ExprValue event;
    if (kind == "Beat" || kind == "beat")
      event = ExprValue::object(makeBeat(1));
    else if (kind == "CdjStatus" || kind == "status" || kind == "DeviceUpdate" || kind == "metadata")
      event = ExprValue::object(makeCdjStatus(1));
    else if (kind == "MixerStatus")
      event = ExprValue::object(makeMixerStatus());
    else if (kind == "beat-tpu")
      event = makeBeatPosition(1);
    return event;
}
