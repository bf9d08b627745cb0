/**
 * Startup options for an expression environment.
 *
 * Stored as XML:
 *
 *   <ExprConfig traceLevel='2' diagnosticMode='true'
 *               sharedDefinitions='/path/to/shared.clj'>
 *     <Catalog>
 *       <Kind name='...' inherits='...'>
 *         <Binding name='...' requires='...' doc='...'>code</Binding>
 *       </Kind>
 *     </Catalog>
 *   </ExprConfig>
 *
 * The embedded Catalog adds extension kinds to the standard ones.
 * The shared definitions file is read by the application, the engine
 * itself never touches the file system.
 */

#pragma once

#include <JuceHeader.h>

class ExprConfig
{
  public:

    ExprConfig() {}
    ~ExprConfig() {}

    // TraceDebugLevel while the environment runs
    int traceLevel = 1;

    // log generated functions as they are compiled
    bool diagnosticMode = false;

    // file of shared definitions loaded at startup
    juce::String sharedDefinitions;

    /**
     * The <Catalog> element, null if there are no extensions.
     */
    juce::XmlElement* getCatalog() {return catalog.get();}
    void setCatalog(juce::XmlElement* el);

    /**
     * Returns false and leaves a message in errors if the
     * text could not be parsed.
     */
    bool parseXml(juce::String xml);
    juce::String toXml();

    juce::StringArray& getErrors() {return errors;}

  private:

    std::unique_ptr<juce::XmlElement> catalog;
    juce::StringArray errors;
};
