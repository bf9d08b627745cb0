/**
 * Standard catalog data.
 *
 * Generators refer to the event as status.  Kinds that may receive a
 * beat paired with a track position (a two element vector) go through
 * extract-device-update to find the update in either shape.
 */

#include <JuceHeader.h>

#include "ExprCatalog.h"
#include "ExprStandardCatalog.h"

const char* ExprStandardCatalog::MetadataFinder = "metadata-finder";
const char* ExprStandardCatalog::TimeFinder = "time-finder";
const char* ExprStandardCatalog::BeatGridFinder = "beatgrid-finder";
const char* ExprStandardCatalog::VirtualCdj = "virtual-cdj";

class ExprStandardBinding
{
  public:
    const char* kind;
    const char* name;
    const char* code;
    const char* doc;
    const char* required;
};

static ExprStandardBinding StandardBindings[] = {

    // DeviceUpdate
    {"DeviceUpdate", "address", "(.getAddress status)",
     "The address of the device that sent the update.", nullptr},
    {"DeviceUpdate", "bar-meaningful?", "(.isBeatWithinBarMeaningful status)",
     "True if <code>beat-within-bar</code> has musical meaning for the device that sent the update.", nullptr},
    {"DeviceUpdate", "beat?", "(instance? Beat status)",
     "True if the update announces a new beat.", nullptr},
    {"DeviceUpdate", "beat-within-bar", "(.getBeatWithinBar status)",
     "Position of the most recent beat within its bar, 1 to 4 with 1 the down beat.", nullptr},
    {"DeviceUpdate", "cdj?", "(or (instance? CdjStatus status) (and (instance? Beat status) (< (.getDeviceNumber status) 17)))",
     "True if the update reports the status of a player.", nullptr},
    {"DeviceUpdate", "device-name", "(.getDeviceName status)",
     "The name reported by the device.", nullptr},
    {"DeviceUpdate", "device-number", "(.getDeviceNumber status)",
     "The player or device number that sent the update.", nullptr},
    {"DeviceUpdate", "effective-tempo", "(.getEffectiveTempo status)",
     "The tempo after the pitch adjustment is applied to the track BPM.", nullptr},
    {"DeviceUpdate", "mixer?", "(or (instance? MixerStatus status) (and (instance? Beat status) (> (.getDeviceNumber status) 32)))",
     "True if the update reports the status of a mixer.", nullptr},
    {"DeviceUpdate", "next-cue", "(next-cue-for status)",
     "The next cue that will be reached in the playing track, nil unless the time finder is running.", nullptr},
    {"DeviceUpdate", "pitch-multiplier", "(Util/pitchToMultiplier (.getPitch status))",
     "The pitch as a multiplier from 0.0 to 2.0 where 1.0 is normal speed.", nullptr},
    {"DeviceUpdate", "pitch-percent", "(Util/pitchToPercentage (.getPitch status))",
     "The pitch as a percentage from -100 to +100 where 0 is normal speed.", nullptr},
    {"DeviceUpdate", "previous-cue", "(previous-cue-for status)",
     "The cue most recently passed in the playing track, nil unless the time finder is running.", nullptr},
    {"DeviceUpdate", "raw-bpm", "(.getBpm status)",
     "The track BPM times 100 as an integer.", nullptr},
    {"DeviceUpdate", "raw-pitch", "(.getPitch status)",
     "The raw device pitch, 0 to 2097152 with 1048576 being normal speed.", nullptr},
    {"DeviceUpdate", "timestamp", "(.getTimestamp status)",
     "The nanosecond at which the update was received.", nullptr},
    {"DeviceUpdate", "track-bpm", "(/ (.getBpm status) 100.0)",
     "The BPM of the loaded track, without the pitch adjustment.", nullptr},
    {"DeviceUpdate", "track-time-reached", "(playback-time status)",
     "Milliseconds played into the track, nil unless the time finder is running.", nullptr},

    // metadata mixin
    {"metadata", "track-metadata", "(metadata-for status)",
     "The metadata object for the loaded track, if one is available.", nullptr},
    {"metadata", "track-album", "(when track-metadata (.getAlbum track-metadata))",
     "The album of the loaded track, if metadata is available.", "track-metadata"},
    {"metadata", "track-artist", "(when track-metadata (.getArtist track-metadata))",
     "The artist of the loaded track, if metadata is available.", "track-metadata"},
    {"metadata", "track-comment", "(when track-metadata (.getComment track-metadata))",
     "The comment assigned to the loaded track, if metadata is available.", "track-metadata"},
    {"metadata", "track-genre", "(when track-metadata (.getGenre track-metadata))",
     "The genre of the loaded track, if metadata is available.", "track-metadata"},
    {"metadata", "track-key", "(when track-metadata (.getKey track-metadata))",
     "The key of the loaded track, if metadata is available.", "track-metadata"},
    {"metadata", "track-label", "(when track-metadata (.getLabel track-metadata))",
     "The label of the loaded track, if metadata is available.", "track-metadata"},
    {"metadata", "track-length", "(when track-metadata (.getDuration track-metadata))",
     "The length of the loaded track in seconds, if metadata is available.", "track-metadata"},
    {"metadata", "track-title", "(when track-metadata (.getTitle track-metadata))",
     "The title of the loaded track, if metadata is available.", "track-metadata"},

    // beat mixin
    {"beat", "bar-number", "(or (current-bar status) -1)",
     "The bar the beat falls in, counting from 1.  -1 when the beat grid is not known.", nullptr},
    {"beat", "beat-number", "(or (current-beat status) -1)",
     "The beat of the track being played, counting from 1.  -1 when it is not known.", nullptr},
    {"beat", "on-air?", "(when virtual-cdj (when-let [latest (.getLatestStatusFor virtual-cdj (extract-device-update status))] (.isOnAir latest)))",
     "True if the player is connected to a mixer channel that is not faded out.", nullptr},
    {"beat", "tempo-master?", "(.isTempoMaster (extract-device-update status))",
     "True if the beat was sent by the current tempo master.", nullptr},

    // Beat
    {"Beat", "beat", "status",
     "The raw beat message received from the player.", nullptr},
    {"Beat", "beat-number", "(or (current-beat status) -1)",
     "The beat of the track that just played, counting from 1.  -1 when it is not known.", nullptr},
    {"Beat", "tempo-master?", "(.isTempoMaster status)",
     "True if the beat was sent by the current tempo master.", nullptr},
    {"Beat", "on-air?", "(when virtual-cdj (when-let [latest (.getLatestStatusFor virtual-cdj status)] (.isOnAir latest)))",
     "True if the player is connected to a mixer channel that is not faded out.", nullptr},

    // MixerStatus
    {"MixerStatus", "tempo-master?", "(.isTempoMaster status)",
     "True if this mixer is the current tempo master.", nullptr},

    // CdjStatus
    {"CdjStatus", "at-end?", "(.isAtEnd status)",
     "True if the player is stopped at the end of a track.", nullptr},
    {"CdjStatus", "bar-number", "(or (bar-number-for status (.getBeatNumber status)) -1)",
     "The bar the current beat falls in, counting from 1.  -1 when the beat grid is not known.", nullptr},
    {"CdjStatus", "beat-number", "(.getBeatNumber status)",
     "The beat of the track being played, counting from 1.  0 before playback starts, -1 when unknown.", nullptr},
    {"CdjStatus", "busy?", "(.isBusy status)",
     "True if the player is doing anything.", nullptr},
    {"CdjStatus", "cue-countdown", "(.getCueCountdown status)",
     "Beats until the next cue point, 511 when there is none within 64 bars.", nullptr},
    {"CdjStatus", "cue-countdown-text", "(.formatCueCountdown status)",
     "The cue countdown formatted the way the player displays it, like 07.4 or --.-", nullptr},
    {"CdjStatus", "cued?", "(.isCued status)",
     "True if the player is paused at the cue point.", nullptr},
    {"CdjStatus", "looping?", "(.isLooping status)",
     "True if the player is playing a loop.", nullptr},
    {"CdjStatus", "on-air?", "(.isOnAir status)",
     "True if the player is connected to a mixer channel that is not faded out.", nullptr},
    {"CdjStatus", "paused?", "(.isPaused status)",
     "True if the player is paused.", nullptr},
    {"CdjStatus", "playing?", "(.isPlaying status)",
     "True if the player is playing a track.", nullptr},
    {"CdjStatus", "rekordbox-id", "(.getRekordboxId status)",
     "The rekordbox id of the loaded track, 0 when nothing is loaded.", nullptr},
    {"CdjStatus", "synced?", "(.isSynced status)",
     "True if the player is in Sync mode.", nullptr},
    {"CdjStatus", "tempo-master?", "(.isTempoMaster status)",
     "True if this player is the current tempo master.", nullptr},
    {"CdjStatus", "track-number", "(.getTrackNumber status)",
     "The position of the loaded track within its playlist or list.", nullptr},
    {"CdjStatus", "track-source-player", "(.getTrackSourcePlayer status)",
     "The player the track was loaded from, 0 when nothing is loaded.", nullptr},
    {"CdjStatus", "track-source-slot", "(track-source-slot status)",
     "The slot the track came from: <code>:no-track</code>, <code>:cd-slot</code>, <code>:sd-slot</code>, <code>:usb-slot</code>, <code>:collection</code> or <code>:unknown</code>.", nullptr},
    {"CdjStatus", "track-type", "(track-type status)",
     "The kind of track loaded: <code>:no-track</code>, <code>:cd-digital-audio</code>, <code>:rekordbox</code>, <code>:unanalyzed</code> or <code>:unknown</code>.", nullptr},

    // beat-tpu
    {"beat-tpu", "address", "(.getAddress (extract-device-update status))",
     "The address of the device the beat came from.", nullptr},
    {"beat-tpu", "bar-meaningful?", "(.isBeatWithinBarMeaningful (extract-device-update status))",
     "True if <code>beat-within-bar</code> has musical meaning for the device that sent the beat.", nullptr},
    {"beat-tpu", "beat", "(first status)",
     "The raw beat message received from the player.", nullptr},
    {"beat-tpu", "beat?", "true",
     "Always true, this event announces a new beat.", nullptr},
    {"beat-tpu", "beat-within-bar", "(.getBeatWithinBar (first status))",
     "Position of the beat within its bar, 1 to 4 with 1 the down beat.", nullptr},
    {"beat-tpu", "cdj?", "(< (.getDeviceNumber (extract-device-update status)) 17)",
     "True if the beat came from a player.", nullptr},
    {"beat-tpu", "device-name", "(.getDeviceName (extract-device-update status))",
     "The name reported by the device sending the beat.", nullptr},
    {"beat-tpu", "device-number", "(.getDeviceNumber (extract-device-update status))",
     "The player or device number sending the beat.", nullptr},
    {"beat-tpu", "effective-tempo", "(.getEffectiveTempo (extract-device-update status))",
     "The tempo after the pitch adjustment is applied to the track BPM.", nullptr},
    {"beat-tpu", "mixer?", "(> (.getDeviceNumber (extract-device-update status)) 32)",
     "True if the beat came from a mixer.", nullptr},
    {"beat-tpu", "next-cue", "(next-cue-for status)",
     "The next cue that will be reached in the playing track, if any.", nullptr},
    {"beat-tpu", "pitch-multiplier", "(Util/pitchToMultiplier (.getPitch (extract-device-update status)))",
     "The pitch as a multiplier from 0.0 to 2.0 where 1.0 is normal speed.", nullptr},
    {"beat-tpu", "pitch-percent", "(Util/pitchToPercentage (.getPitch (extract-device-update status)))",
     "The pitch as a percentage from -100 to +100 where 0 is normal speed.", nullptr},
    {"beat-tpu", "previous-cue", "(previous-cue-for status)",
     "The cue most recently passed in the playing track, if any.", nullptr},
    {"beat-tpu", "raw-bpm", "(.getBpm (extract-device-update status))",
     "The track BPM times 100 as an integer.", nullptr},
    {"beat-tpu", "raw-pitch", "(.getPitch (extract-device-update status))",
     "The raw device pitch, 0 to 2097152 with 1048576 being normal speed.", nullptr},
    {"beat-tpu", "timestamp", "(.getTimestamp (extract-device-update status))",
     "The nanosecond at which the beat was received.", nullptr},
    {"beat-tpu", "track-bpm", "(/ (.getBpm (extract-device-update status)) 100.0)",
     "The BPM of the loaded track, without the pitch adjustment.", nullptr},
    {"beat-tpu", "track-position", "(second status)",
     "The track position inferred from the beat.", nullptr},
    {"beat-tpu", "track-time-reached", "(.getMilliseconds (second status))",
     "Milliseconds played into the track when the beat fell.", nullptr},

    {nullptr, nullptr, nullptr, nullptr, nullptr}
};

void ExprStandardCatalog::populate(ExprCatalog* catalog)
{
    catalog->addKind(ExprStandardKindName(ExprKindDeviceUpdate), nullptr,
                     "Any update received from a device on the network.");
    catalog->addKind(ExprStandardKindName(ExprKindMetadata), nullptr,
                     "Track metadata for the player that sent the event.");
    catalog->addKind(ExprStandardKindName(ExprKindBeatMixin), nullptr,
                     "Beat and bar position for the player that sent the event.");
    catalog->addKind(ExprStandardKindName(ExprKindBeat), "DeviceUpdate,beat,metadata",
                     "A beat announcement from a player or mixer.");
    catalog->addKind(ExprStandardKindName(ExprKindMixerStatus), "DeviceUpdate",
                     "A status update from a mixer.");
    catalog->addKind(ExprStandardKindName(ExprKindCdjStatus), "DeviceUpdate,metadata",
                     "A status update from a player.");
    catalog->addKind(ExprStandardKindName(ExprKindBeatPosition), "beat,metadata",
                     "A beat paired with the track position inferred from it, status is the vector [beat position].");
    catalog->addKind(ExprStandardKindName(ExprKindStatus), "CdjStatus,MixerStatus",
                     "A status update from either a player or a mixer.");

    for (int i = 0 ; StandardBindings[i].kind != nullptr ; i++) {
        ExprStandardBinding* b = &(StandardBindings[i]);
        (void)catalog->addBinding(b->kind, b->name, b->code, b->doc,
                                  (b->required != nullptr) ? juce::String(b->required) : juce::String());
    }
}

/**
 * Order matters, each definition is linked against the ones
 * before it.
 */
juce::String ExprStandardCatalog::getPrelude()
{
    return R"PRELUDE(
(def metadata-finder nil)
(def time-finder nil)
(def beatgrid-finder nil)
(def virtual-cdj nil)

(defn Util/pitchToMultiplier [pitch]
  (/ pitch 1048576.0))

(defn Util/pitchToPercentage [pitch]
  (* (- (/ pitch 1048576.0) 1.0) 100.0))

(defn extract-device-update
  "Finds the device update in either a plain update or a beat-tpu vector."
  [status]
  (if (instance? DeviceUpdate status)
    status
    (first status)))

(defn extract-device-number
  "The number of the device responsible for the event."
  [status]
  (when-let [update (extract-device-update status)]
    (.getDeviceNumber update)))

(defn track-source-slot
  "The slot a track was loaded from as a keyword."
  [status]
  (case (.getTrackSourceSlot status)
    "NO_TRACK" :no-track
    "CD_SLOT" :cd-slot
    "SD_SLOT" :sd-slot
    "USB_SLOT" :usb-slot
    "COLLECTION" :collection
    :unknown))

(defn track-type
  "The type of the loaded track as a keyword."
  [status]
  (case (.getTrackType status)
    "NO_TRACK" :no-track
    "CD_DIGITAL_AUDIO" :cd-digital-audio
    "REKORDBOX" :rekordbox
    "UNANALYZED" :unanalyzed
    :unknown))

(defn playback-time
  "Milliseconds played into the track by the device, nil if unknown."
  [device-update]
  (when (and time-finder (.isRunning time-finder))
    (let [result (.getTimeFor time-finder device-update)]
      (when-not (neg? result)
        result))))

(defn current-beat
  "The beat number the device has reached, nil if unknown."
  [status]
  (cond
    (instance? DeviceUpdate status)
    (when (and time-finder (.isRunning time-finder))
      (when-let [position (.getLatestPositionFor time-finder status)]
        (.getBeatNumber position)))

    (vector? status)
    (.getBeatNumber (second status))))

(defn bar-number-for
  "The bar a beat falls in according to the device's beat grid."
  [device-update beat]
  (when (and beatgrid-finder beat)
    (when-let [grid (.getLatestBeatGridFor beatgrid-finder device-update)]
      (.getBarNumber grid beat))))

(defn current-bar
  "The bar number the device has reached, nil if unknown."
  [status]
  (when-let [beat (current-beat status)]
    (bar-number-for (extract-device-update status) beat)))

(defn metadata-for
  "The metadata of the track loaded in the device, nil if unknown."
  [status]
  (when metadata-finder
    (when-let [update (extract-device-update status)]
      (.getLatestMetadataFor metadata-finder update))))

(defn next-cue-for
  "The next cue the device will reach, nil if unknown."
  [status]
  (let [device-update (extract-device-update status)]
    (when-let [reached (playback-time device-update)]
      (when-let [metadata (metadata-for device-update)]
        (when-let [cue-list (.getCueList metadata)]
          (.findEntryAfter cue-list reached))))))

(defn previous-cue-for
  "The cue the device most recently passed, nil if unknown."
  [status]
  (let [device-update (extract-device-update status)]
    (when-let [reached (playback-time device-update)]
      (when-let [metadata (metadata-for device-update)]
        (when-let [cue-list (.getCueList metadata)]
          (.findEntryBefore cue-list reached))))))
)PRELUDE";
}
