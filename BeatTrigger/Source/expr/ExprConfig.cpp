
#include <JuceHeader.h>

#include "../util/Trace.h"

#include "ExprConfig.h"

#define EL_EXPR_CONFIG "ExprConfig"
#define EL_CATALOG "Catalog"

#define ATT_TRACE_LEVEL "traceLevel"
#define ATT_DIAGNOSTIC_MODE "diagnosticMode"
#define ATT_SHARED_DEFINITIONS "sharedDefinitions"

void ExprConfig::setCatalog(juce::XmlElement* el)
{
    catalog.reset(el);
}

bool ExprConfig::parseXml(juce::String xml)
{
    errors.clear();

    juce::XmlDocument doc(xml);
    std::unique_ptr<juce::XmlElement> root = doc.getDocumentElement();
    if (root == nullptr) {
        errors.add("ExprConfig: XML parse error: " + doc.getLastParseError());
    }
    else if (!root->hasTagName(EL_EXPR_CONFIG)) {
        errors.add("ExprConfig: Unexpected XML tag name: " + root->getTagName());
    }
    else {
        traceLevel = root->getIntAttribute(ATT_TRACE_LEVEL, traceLevel);
        diagnosticMode = root->getBoolAttribute(ATT_DIAGNOSTIC_MODE, diagnosticMode);
        sharedDefinitions = root->getStringAttribute(ATT_SHARED_DEFINITIONS);

        for (auto* el : root->getChildIterator()) {
            if (el->hasTagName(EL_CATALOG)) {
                catalog.reset(new juce::XmlElement(*el));
            }
            else {
                errors.add("ExprConfig: Unexpected XML tag name: " + el->getTagName());
            }
        }
    }

    for (auto error : errors)
      Trace(1, "%s", error.toUTF8());

    return errors.size() == 0;
}

juce::String ExprConfig::toXml()
{
    juce::XmlElement root (EL_EXPR_CONFIG);

    root.setAttribute(ATT_TRACE_LEVEL, traceLevel);
    if (diagnosticMode)
      root.setAttribute(ATT_DIAGNOSTIC_MODE, diagnosticMode);
    if (sharedDefinitions.length() > 0)
      root.setAttribute(ATT_SHARED_DEFINITIONS, sharedDefinitions);

    if (catalog != nullptr)
      root.addChildElement(new juce::XmlElement(*catalog));

    return root.toString();
}
