
#include <JuceHeader.h>

#include "ExprValue.h"
#include "ExprBinding.h"
#include "ExprScanner.h"

juce::StringArray ExprScanner::scan(const ExprValue& form, const ExprBindingSet* bindings)
{
    juce::StringArray found;
    if (bindings != nullptr && !bindings->isEmpty()) {
        walk(form, bindings, found);
        found.sort(false);
    }
    return found;
}

void ExprScanner::walk(const ExprValue& form, const ExprBindingSet* bindings,
                       juce::StringArray& found)
{
    switch (form.getType()) {

        case ExprValue::Symbol:
            if (bindings->contains(form.getName()))
              found.addIfNotAlreadyThere(form.getName());
            break;

        case ExprValue::List:
            if (form.first().isSymbol("quote"))
              break;
            for (auto item : form.getItems())
              walk(item, bindings, found);
            break;

        case ExprValue::Vector:
            for (auto item : form.getItems())
              walk(item, bindings, found);
            break;

        case ExprValue::Map:
            for (auto key : form.getKeys())
              walk(key, bindings, found);
            for (auto value : form.getValues())
              walk(value, bindings, found);
            break;

        default:
            break;
    }
}
