/**
 * Catalog construction, validation, XML extensions, and the resolver.
 */

#include <JuceHeader.h>

#include "../expr/ExprError.h"
#include "../expr/ExprBinding.h"
#include "../expr/ExprCatalog.h"
#include "../expr/ExprResolver.h"

class CatalogTest : public juce::UnitTest
{
  public:

    CatalogTest() : juce::UnitTest("Catalog", "BeatTrigger") {}

    bool hasError(ExprCatalog& catalog, const char* fragment)
    {
        for (auto error : catalog.getErrors()) {
            if (error.message.contains(fragment))
              return true;
        }
        return false;
    }

    void runTest() override
    {
        beginTest("Inheritance and requires");
        {
            ExprCatalog catalog;
            catalog.addKind("Base");
            catalog.addKind("Child", "Base");
            catalog.addBinding("Base", "x", "(+ 1 1)", "Two.");
            catalog.addBinding("Child", "y", "(* x 10)", "Twenty.", "x");
            expect(catalog.finish());
            expect(catalog.isValid());
            expect(catalog.isSealed());

            ExprResolver resolver (&catalog);
            const ExprBindingSet* set = resolver.resolve("Child");
            expectEquals(set->size(), 2);
            expect(set->contains("x"));
            expect(set->contains("y"));
            expectEquals(set->get("y")->required, juce::String("x"));
            expect(set->get("x")->generator.isList());

            // cached
            expect(resolver.resolve("Child") == set);

            const ExprBindingSet* base = resolver.resolve("Base");
            expectEquals(base->size(), 1);
            expect(!base->contains("y"));
        }

        beginTest("Precedence");
        {
            ExprCatalog catalog;
            catalog.addKind("A");
            catalog.addKind("B");
            catalog.addKind("AB", "A,B");
            catalog.addKind("BA", "B,A");
            catalog.addKind("Own", "A,B");
            catalog.addBinding("A", "v", "1", "");
            catalog.addBinding("B", "v", "2", "");
            catalog.addBinding("Own", "v", "3", "");
            expect(catalog.finish());

            ExprResolver resolver (&catalog);
            expectEquals(resolver.resolve("AB")->get("v")->source, juce::String("2"));
            expectEquals(resolver.resolve("BA")->get("v")->source, juce::String("1"));
            expectEquals(resolver.resolve("Own")->get("v")->source, juce::String("3"));
            expectEquals(resolver.resolve("Own")->size(), 1);
        }

        beginTest("Unknown kinds resolve empty");
        {
            ExprCatalog catalog;
            catalog.addKind("A");
            expect(catalog.finish());
            ExprResolver resolver (&catalog);
            expect(resolver.resolve("Nope")->isEmpty());
        }

        beginTest("Unknown inherited kind");
        {
            ExprCatalog catalog;
            catalog.addKind("A", "Missing");
            expect(!catalog.finish());
            expect(hasError(catalog, "inherits unknown kind Missing"));
        }

        beginTest("Inheritance cycle");
        {
            ExprCatalog catalog;
            catalog.addKind("A", "B");
            catalog.addKind("B", "C");
            catalog.addKind("C", "A");
            expect(!catalog.finish());
            expect(hasError(catalog, "cyclic inheritance"));
        }

        beginTest("Generator that does not parse");
        {
            ExprCatalog catalog;
            catalog.addKind("A");
            catalog.addBinding("A", "broken", "(+ 1", "");
            expect(!catalog.finish());
            expect(hasError(catalog, "Binding broken of kind A does not parse"));
            expectEquals(catalog.getErrors()[0].title, juce::String("Catalog"));
        }

        beginTest("Missing requires target");
        {
            ExprCatalog catalog;
            catalog.addKind("A");
            catalog.addBinding("A", "y", "(* x 2)", "", "x");
            expect(!catalog.finish());
            expect(hasError(catalog, "requires x which is not available"));
        }

        beginTest("Requires target missing only in one kind");
        {
            ExprCatalog catalog;
            catalog.addKind("Mixin");
            catalog.addKind("Full", "Mixin");
            catalog.addKind("Partial", "Mixin");
            catalog.addBinding("Mixin", "y", "(* x 2)", "", "x");
            catalog.addBinding("Full", "x", "1", "");
            expect(!catalog.finish());
            expect(hasError(catalog, "in kind Partial requires x"));
            expect(!hasError(catalog, "in kind Full"));
        }

        beginTest("Cyclic requires");
        {
            ExprCatalog catalog;
            catalog.addKind("A");
            catalog.addBinding("A", "p", "q", "", "q");
            catalog.addBinding("A", "q", "p", "", "p");
            expect(!catalog.finish());
            expect(hasError(catalog, "cyclic requires chain"));
        }

        beginTest("Duplicates and late additions");
        {
            ExprCatalog catalog;
            catalog.addKind("A");
            expect(catalog.addKind("A") == nullptr);
            catalog.addBinding("A", "x", "1", "");
            expect(catalog.addBinding("A", "x", "2", "") == nullptr);
            expect(hasError(catalog, "Duplicate binding x"));
            expect(!catalog.finish());

            ExprCatalog sealed;
            sealed.addKind("A");
            expect(sealed.finish());
            expect(sealed.addKind("B") == nullptr);
            expect(hasError(sealed, "after the catalog was finished"));
        }

        beginTest("XML extensions");
        {
            ExprCatalog catalog;
            catalog.addKind("Base");
            catalog.addBinding("Base", "x", "(+ 1 1)", "Two.");
            catalog.parseXml(
                "<Catalog>"
                "  <Kind name='Custom' inherits='Base' description='A custom kind.'>"
                "    <Binding name='y' requires='x' doc='Ten times x.'>(* x 10)</Binding>"
                "    <Binding name='z' code='(str x)'/>"
                "  </Kind>"
                "</Catalog>");
            expect(catalog.finish());

            ExprResolver resolver (&catalog);
            const ExprBindingSet* set = resolver.resolve("Custom");
            expectEquals(set->size(), 3);
            expectEquals(set->get("y")->source, juce::String("(* x 10)"));
            expectEquals(set->get("y")->doc, juce::String("Ten times x."));
            expectEquals(set->get("z")->source, juce::String("(str x)"));
            expectEquals(catalog.getKind("Custom")->description, juce::String("A custom kind."));

            juce::String xml = catalog.toXml();
            expect(xml.contains("name=\"Custom\""));
            expect(xml.contains("inherits=\"Base\""));

            ExprCatalog bad;
            bad.parseXml("<Catalog><Thing/></Catalog>");
            expect(bad.getErrors().size() > 0);

            ExprCatalog garbage;
            garbage.parseXml("<Catalog");
            expect(garbage.getErrors().size() > 0);
        }

        beginTest("Help");
        {
            ExprCatalog catalog;
            catalog.addKind("Base");
            catalog.addKind("Child", "Base", "The child kind.");
            catalog.addBinding("Base", "x", "1", "The <code>x</code> value.");
            catalog.addBinding("Child", "a", "2", "Comes first.");
            expect(catalog.finish());

            juce::String help = catalog.renderHelp("Child");
            expect(help.startsWith("Values available in Child expressions:"));
            expect(help.contains("The child kind."));
            expect(help.contains("The `x` value."));
            expect(help.indexOf("\na\n") < help.indexOf("\nx\n"));
            expect(catalog.renderHelp("Nope").startsWith("Unknown kind"));
        }

        beginTest("Standard kind names");
        {
            expectEquals(juce::String(ExprStandardKindName(ExprKindBeatPosition)), juce::String("beat-tpu"));
            expectEquals(juce::String(ExprStandardKindName(ExprKindCdjStatus)), juce::String("CdjStatus"));
        }
    }
};

static CatalogTest catalogTest;
