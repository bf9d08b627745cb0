/**
 * Building and validating the binding catalog.
 */

#include <JuceHeader.h>

#include "../util/Trace.h"
#include "../util/StructureDumper.h"

#include "ExprValue.h"
#include "ExprError.h"
#include "ExprParser.h"
#include "ExprBinding.h"
#include "ExprResolver.h"
#include "ExprCatalog.h"

const char* ExprStandardKindName(ExprStandardKind kind)
{
    const char* name = "?";
    switch (kind) {
        case ExprKindDeviceUpdate: name = "DeviceUpdate"; break;
        case ExprKindBeat: name = "Beat"; break;
        case ExprKindMixerStatus: name = "MixerStatus"; break;
        case ExprKindCdjStatus: name = "CdjStatus"; break;
        case ExprKindMetadata: name = "metadata"; break;
        case ExprKindBeatMixin: name = "beat"; break;
        case ExprKindBeatPosition: name = "beat-tpu"; break;
        case ExprKindStatus: name = "status"; break;
    }
    return name;
}

ExprBinding* ExprKind::findBinding(const juce::String& bindingName)
{
    for (auto b : bindings) {
        if (b->name == bindingName)
          return b;
    }
    return nullptr;
}

ExprCatalog::ExprCatalog()
{
}

ExprCatalog::~ExprCatalog()
{
}

void ExprCatalog::addError(juce::String msg)
{
    Trace(1, "ExprCatalog: %s", msg.toUTF8());
    errors.add(ExprError("Catalog", msg));
}

//////////////////////////////////////////////////////////////////////
//
// Construction
//
//////////////////////////////////////////////////////////////////////

ExprKind* ExprCatalog::addKind(juce::String name, const char* inherits, juce::String description)
{
    juce::StringArray list;
    if (inherits != nullptr) {
        list.addTokens(inherits, ",", "");
        list.trim();
        list.removeEmptyStrings();
    }
    return addKind(name, list, description);
}

ExprKind* ExprCatalog::addKind(juce::String name, juce::StringArray inherits, juce::String description)
{
    ExprKind* kind = nullptr;
    if (sealed) {
        addError("Kind " + name + " added after the catalog was finished");
    }
    else if (name.length() == 0) {
        addError("Kind with no name");
    }
    else if (getKind(name) != nullptr) {
        addError("Duplicate kind " + name);
    }
    else {
        kind = new ExprKind();
        kind->name = name;
        kind->inherits = inherits;
        kind->description = description;
        kinds.add(kind);
    }
    return kind;
}

ExprBinding* ExprCatalog::addBinding(juce::String kindName, juce::String name, juce::String source,
                                     juce::String doc, juce::String required)
{
    ExprBinding* binding = nullptr;
    ExprKind* kind = getKind(kindName);
    if (sealed) {
        addError("Binding " + name + " added after the catalog was finished");
    }
    else if (kind == nullptr) {
        addError("Binding " + name + " added to unknown kind " + kindName);
    }
    else if (name.length() == 0) {
        addError("Binding with no name in kind " + kindName);
    }
    else if (kind->findBinding(name) != nullptr) {
        addError("Duplicate binding " + name + " in kind " + kindName);
    }
    else {
        binding = new ExprBinding();
        binding->name = name;
        binding->source = source;
        binding->doc = doc;
        binding->required = required;
        binding->kind = kindName;
        kind->bindings.add(binding);
    }
    return binding;
}

ExprKind* ExprCatalog::getKind(juce::String name)
{
    for (auto kind : kinds) {
        if (kind->name == name)
          return kind;
    }
    return nullptr;
}

ExprKind* ExprCatalog::getKind(ExprStandardKind kind)
{
    return getKind(juce::String(ExprStandardKindName(kind)));
}

juce::StringArray ExprCatalog::getKindNames()
{
    juce::StringArray names;
    for (auto kind : kinds)
      names.add(kind->name);
    return names;
}

//////////////////////////////////////////////////////////////////////
//
// Validation
//
//////////////////////////////////////////////////////////////////////

bool ExprCatalog::finish()
{
    if (sealed) {
        Trace(1, "ExprCatalog: finish called more than once");
        return isValid();
    }

    int structuralErrors = errors.size();
    checkInheritance();
    parseGenerators();

    // requirement checks resolve kinds which is only safe without cycles
    if (errors.size() == structuralErrors)
      checkRequirements();

    sealed = true;
    Trace(2, "ExprCatalog: Finished with %ld kinds and %ld errors", (long)kinds.size(), (long)errors.size());
    return isValid();
}

void ExprCatalog::checkInheritance()
{
    for (auto kind : kinds) {
        for (auto inherited : kind->inherits) {
            if (getKind(inherited) == nullptr)
              addError("Kind " + kind->name + " inherits unknown kind " + inherited);
        }
    }

    for (auto kind : kinds) {
        juce::StringArray path;
        if (!checkInheritanceCycle(kind, path))
          break;
    }
}

/**
 * Depth first walk of the inherits graph.
 * Returns false after reporting the first cycle found.
 */
bool ExprCatalog::checkInheritanceCycle(ExprKind* kind, juce::StringArray& path)
{
    if (path.contains(kind->name)) {
        path.add(kind->name);
        addError("Kind " + kind->name + " has a cyclic inheritance chain: " + path.joinIntoString(" -> "));
        return false;
    }

    path.add(kind->name);
    for (auto inherited : kind->inherits) {
        ExprKind* base = getKind(inherited);
        if (base != nullptr && !checkInheritanceCycle(base, path))
          return false;
    }
    path.remove(path.size() - 1);
    return true;
}

void ExprCatalog::parseGenerators()
{
    for (auto kind : kinds) {
        for (auto b : kind->bindings) {
            ExprParser parser;
            if (!parser.parseOne(b->source, b->generator)) {
                juce::String detail = (parser.getErrors().size() > 0) ?
                    parser.getErrors().getReference(0).getSummary() : juce::String("no form");
                addError("Binding " + b->name + " of kind " + kind->name + " does not parse: " + detail);
            }
        }
    }
}

/**
 * Every requires target must be in the resolved set of each kind
 * that can see the binding, and following requires links from any
 * binding must never come back to it.
 */
void ExprCatalog::checkRequirements()
{
    ExprResolver resolver (this);

    for (auto kind : kinds) {
        const ExprBindingSet* set = resolver.resolve(kind->name);
        for (auto name : set->getNames()) {
            const ExprBinding* b = set->get(name);
            juce::StringArray chain;
            chain.add(b->name);
            const ExprBinding* current = b;
            while (current->hasRequired()) {
                const ExprBinding* target = set->get(current->required);
                if (target == nullptr) {
                    addError("Binding " + current->name + " in kind " + kind->name +
                             " requires " + current->required + " which is not available");
                    break;
                }
                if (chain.contains(target->name)) {
                    chain.add(target->name);
                    addError("Binding " + b->name + " in kind " + kind->name +
                             " has a cyclic requires chain: " + chain.joinIntoString(" -> "));
                    break;
                }
                chain.add(target->name);
                current = target;
            }
        }
    }
}

//////////////////////////////////////////////////////////////////////
//
// XML
//
//////////////////////////////////////////////////////////////////////

void ExprCatalog::parseXml(juce::String xml)
{
    juce::XmlDocument doc(xml);
    std::unique_ptr<juce::XmlElement> root = doc.getDocumentElement();
    if (root == nullptr)
      addError("XML parse error: " + doc.getLastParseError());
    else
      parseXml(root.get());
}

/**
 * <Catalog>
 *   <Kind name='x' inherits='a,b' description='...'>
 *     <Binding name='y' requires='z' doc='...'>(* z 10)</Binding>
 *   </Kind>
 * </Catalog>
 */
void ExprCatalog::parseXml(juce::XmlElement* root)
{
    if (!root->hasTagName("Catalog")) {
        addError("Unexpected XML tag name: " + root->getTagName());
        return;
    }

    for (auto* kel : root->getChildIterator()) {
        if (!kel->hasTagName("Kind")) {
            addError("Unexpected XML tag name: " + kel->getTagName());
            continue;
        }

        juce::String kindName = kel->getStringAttribute("name");
        juce::String inherits = kel->getStringAttribute("inherits");
        ExprKind* kind = addKind(kindName, inherits.toRawUTF8(), kel->getStringAttribute("description"));
        if (kind == nullptr)
          continue;

        for (auto* bel : kel->getChildIterator()) {
            if (!bel->hasTagName("Binding")) {
                addError("Unexpected XML tag name: " + bel->getTagName());
                continue;
            }
            // code may be element text or a code attribute
            juce::String code = bel->getAllSubText().trim();
            if (code.length() == 0)
              code = bel->getStringAttribute("code");
            (void)addBinding(kindName, bel->getStringAttribute("name"), code,
                             bel->getStringAttribute("doc"), bel->getStringAttribute("requires"));
        }
    }
}

juce::String ExprCatalog::toXml()
{
    juce::XmlElement root ("Catalog");
    for (auto kind : kinds) {
        juce::XmlElement* kel = new juce::XmlElement("Kind");
        kel->setAttribute("name", kind->name);
        if (kind->inherits.size() > 0)
          kel->setAttribute("inherits", kind->inherits.joinIntoString(","));
        if (kind->description.length() > 0)
          kel->setAttribute("description", kind->description);
        for (auto b : kind->bindings) {
            juce::XmlElement* bel = new juce::XmlElement("Binding");
            bel->setAttribute("name", b->name);
            if (b->hasRequired())
              bel->setAttribute("requires", b->required);
            if (b->doc.length() > 0)
              bel->setAttribute("doc", b->doc);
            bel->addTextElement(b->source);
            kel->addChildElement(bel);
        }
        root.addChildElement(kel);
    }
    return root.toString();
}

//////////////////////////////////////////////////////////////////////
//
// Help and diagnostics
//
//////////////////////////////////////////////////////////////////////

/**
 * The documentation may contain the same small amount of HTML the
 * editors render, <code> becomes backquotes here.
 */
static juce::String plainDoc(juce::String doc)
{
    return doc.replace("<code>", "`").replace("</code>", "`")
        .replace("<p>", "\n\n").replace("&ldquo;", "\"").replace("&rdquo;", "\"");
}

juce::String ExprCatalog::renderHelp(juce::String kindName)
{
    juce::String help;
    ExprKind* kind = getKind(kindName);
    if (kind == nullptr) {
        help = "Unknown kind: " + kindName + "\n";
    }
    else {
        ExprResolver resolver (this);
        const ExprBindingSet* set = resolver.resolve(kindName);
        help << "Values available in " << kindName << " expressions:\n";
        if (kind->description.length() > 0)
          help << kind->description << "\n";
        help << "\n";
        for (auto name : set->getNames()) {
            const ExprBinding* b = set->get(name);
            help << name << "\n";
            if (b->doc.length() > 0)
              help << "    " << plainDoc(b->doc).replace("\n", "\n    ") << "\n";
            help << "\n";
        }
    }
    return help;
}

void ExprCatalog::dump(StructureDumper& d)
{
    d.start("Catalog");
    d.addb("sealed", sealed);
    d.add("errors", errors.size());
    d.newline();
    d.inc();
    for (auto kind : kinds) {
        d.start("Kind");
        d.add("name", kind->name);
        if (kind->inherits.size() > 0)
          d.add("inherits", kind->inherits.joinIntoString(","));
        d.newline();
        d.inc();
        for (auto b : kind->bindings) {
            d.start(b->name);
            if (b->hasRequired())
              d.add("requires", b->required);
            d.newline();
        }
        d.dec();
    }
    d.dec();
}
