/**
 * The registry of event kinds and the convenience bindings each
 * kind makes available to expressions.
 *
 * The catalog is built once at startup.  Kinds and bindings are added,
 * then finish() parses every generator and validates the whole thing.
 * After that the catalog is sealed and never changes, which is what lets
 * resolved sets be cached and shared between threads without locking.
 *
 * Problems found while building are collected rather than thrown so
 * a single pass can report all of them.  An environment refuses to use
 * a catalog that isn't valid.
 */

#pragma once

#include <JuceHeader.h>

#include "ExprError.h"
#include "ExprBinding.h"

/**
 * The kinds built into the standard catalog.
 * Extension kinds are registered by name.
 */
typedef enum {

    // concrete update classes from the network
    ExprKindDeviceUpdate,
    ExprKindBeat,
    ExprKindMixerStatus,
    ExprKindCdjStatus,

    // bindings mixed into several other kinds
    ExprKindMetadata,
    ExprKindBeatMixin,

    // a beat paired with the track position inferred from it
    ExprKindBeatPosition,

    // either kind of status, used by the enabled filter
    ExprKindStatus

} ExprStandardKind;

const char* ExprStandardKindName(ExprStandardKind kind);

class ExprKind
{
  public:

    ExprKind() {}
    ~ExprKind() {}

    juce::String name;
    juce::String description;

    // kinds whose bindings this one reuses, later ones win
    juce::StringArray inherits;

    juce::OwnedArray<ExprBinding> bindings;

    ExprBinding* findBinding(const juce::String& bindingName);
};

class ExprCatalog
{
  public:

    ExprCatalog();
    ~ExprCatalog();

    /**
     * Register a kind.  Inherited kinds may be registered later,
     * they are checked by finish.
     */
    ExprKind* addKind(juce::String name, juce::StringArray inherits, juce::String description = "");
    ExprKind* addKind(juce::String name, const char* inherits = nullptr, juce::String description = "");

    /**
     * Add a binding to a registered kind.
     */
    ExprBinding* addBinding(juce::String kind, juce::String name, juce::String source,
                            juce::String doc, juce::String required = "");

    /**
     * Parse generators and validate.  Seals the catalog.
     * Returns true if it is usable.
     */
    bool finish();

    bool isSealed() {return sealed;}
    bool isValid() {return sealed && errors.size() == 0;}
    juce::Array<ExprError>& getErrors() {return errors;}

    ExprKind* getKind(juce::String name);
    ExprKind* getKind(ExprStandardKind kind);
    juce::StringArray getKindNames();

    /**
     * Read kinds from a <Catalog> element.
     * Problems are added to the error list.
     */
    void parseXml(juce::String xml);
    void parseXml(juce::XmlElement* root);
    juce::String toXml();

    /**
     * The binding help shown next to the editor for one kind,
     * one entry per available binding in name order.
     */
    juce::String renderHelp(juce::String kind);

    void dump(class StructureDumper& d);

  private:

    juce::OwnedArray<ExprKind> kinds;
    juce::Array<ExprError> errors;
    bool sealed = false;

    void addError(juce::String msg);
    void checkInheritance();
    bool checkInheritanceCycle(ExprKind* kind, juce::StringArray& path);
    void parseGenerators();
    void checkRequirements();
};
