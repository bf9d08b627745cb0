/**
 * Implementations of the library functions.
 *
 * Numbers follow the usual contagion rule, if any argument is a float
 * the result is a float.  Integer division that comes out even stays
 * an integer, otherwise it becomes a float since there are no ratios.
 *
 * Sequence functions are eager and return lists.  Nothing is lazy
 * so (range) with no arguments is refused rather than running forever.
 */

#include <JuceHeader.h>

#include <cmath>
#include <limits>
#include <stdio.h>

#include "../util/Trace.h"

#include "ExprValue.h"
#include "ExprObject.h"
#include "ExprError.h"
#include "ExprParser.h"
#include "ExprEvaluator.h"
#include "ExprExpander.h"
#include "ExprWorkspace.h"
#include "ExprStandardLibrary.h"

//////////////////////////////////////////////////////////////////////
//
// Helpers
//
//////////////////////////////////////////////////////////////////////

static void checkNumber(const ExprValue& v, const char* fname)
{
    if (!v.isNumber())
      throw ExprException(juce::String(fname) + " requires a number but got " +
                          v.getTypeName() + " " + v.print());
}

static void checkInt(const ExprValue& v, const char* fname)
{
    if (!v.isInt())
      throw ExprException(juce::String(fname) + " requires an integer but got " +
                          v.getTypeName() + " " + v.print());
}

static ExprValue makeList(const juce::Array<ExprValue>& items)
{
    return ExprValue::list(items);
}

static ExprValue call1(ExprEvaluator* ev, const ExprValue& f, const ExprValue& a)
{
    juce::Array<ExprValue> args;
    args.add(a);
    return ev->apply(f, args);
}

static ExprValue call2(ExprEvaluator* ev, const ExprValue& f, const ExprValue& a, const ExprValue& b)
{
    juce::Array<ExprValue> args;
    args.add(a);
    args.add(b);
    return ev->apply(f, args);
}

/**
 * Most sequence functions treat nil as empty and keep the
 * type of a vector when adding to it.
 */
static juce::Array<ExprValue> items(const ExprValue& v)
{
    return ExprEvaluator::toItems(v);
}

//////////////////////////////////////////////////////////////////////
//
// Arithmetic
//
//////////////////////////////////////////////////////////////////////

/**
 * Integers are 64 bit and never wrap, leaving the range is an error.
 */
static const juce::int64 IntMax = std::numeric_limits<juce::int64>::max();
static const juce::int64 IntMin = std::numeric_limits<juce::int64>::min();

static void overflow()
{
    throw ExprException("integer overflow");
}

static juce::int64 checkedAdd(juce::int64 x, juce::int64 y)
{
    if ((y > 0 && x > IntMax - y) || (y < 0 && x < IntMin - y))
      overflow();
    return x + y;
}

static juce::int64 checkedSubtract(juce::int64 x, juce::int64 y)
{
    if ((y < 0 && x > IntMax + y) || (y > 0 && x < IntMin + y))
      overflow();
    return x - y;
}

static juce::int64 checkedMultiply(juce::int64 x, juce::int64 y)
{
    if (x == 0 || y == 0)
      return 0;
    // IntMin has no positive counterpart
    if (x == -1) {
        if (y == IntMin) overflow();
        return -y;
    }
    if (y == -1) {
        if (x == IntMin) overflow();
        return -x;
    }
    if (x > 0) {
        if ((y > 0 && x > IntMax / y) || (y < 0 && y < IntMin / x))
          overflow();
    }
    else {
        if ((y > 0 && x < IntMin / y) || (y < 0 && x < IntMax / y))
          overflow();
    }
    return x * y;
}

/**
 * Truncating quotient, the divisor has already been checked for zero.
 */
static juce::int64 checkedQuotient(juce::int64 x, juce::int64 y)
{
    if (y == -1)
      return checkedSubtract(0, x);
    return x / y;
}

static juce::int64 checkedRemainder(juce::int64 x, juce::int64 y)
{
    if (y == -1)
      return 0;
    return x % y;
}

typedef enum {
    ArithAdd,
    ArithSubtract,
    ArithMultiply
} ArithOp;

static ExprValue arith(const ExprValue& a, const ExprValue& b, ArithOp op)
{
    ExprValue result;
    if (a.isInt() && b.isInt()) {
        juce::int64 x = a.getInt();
        juce::int64 y = b.getInt();
        switch (op) {
            case ArithAdd: result = ExprValue::fromInt(checkedAdd(x, y)); break;
            case ArithSubtract: result = ExprValue::fromInt(checkedSubtract(x, y)); break;
            case ArithMultiply: result = ExprValue::fromInt(checkedMultiply(x, y)); break;
        }
    }
    else {
        double x = a.getFloat();
        double y = b.getFloat();
        switch (op) {
            case ArithAdd: result = ExprValue::fromFloat(x + y); break;
            case ArithSubtract: result = ExprValue::fromFloat(x - y); break;
            case ArithMultiply: result = ExprValue::fromFloat(x * y); break;
        }
    }
    return result;
}

static ExprValue Add(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    ExprValue result = ExprValue::fromInt(0);
    for (auto a : args) {
        checkNumber(a, "+");
        result = arith(result, a, ArithAdd);
    }
    return result;
}

static ExprValue Multiply(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    ExprValue result = ExprValue::fromInt(1);
    for (auto a : args) {
        checkNumber(a, "*");
        result = arith(result, a, ArithMultiply);
    }
    return result;
}

static ExprValue Subtract(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkNumber(args[0], "-");
    if (args.size() == 1)
      return arith(ExprValue::fromInt(0), args[0], ArithSubtract);

    ExprValue result = args[0];
    for (int i = 1 ; i < args.size() ; i++) {
        checkNumber(args[i], "-");
        result = arith(result, args[i], ArithSubtract);
    }
    return result;
}

static ExprValue divide(const ExprValue& a, const ExprValue& b)
{
    checkNumber(a, "/");
    checkNumber(b, "/");
    ExprValue result;
    if (a.isInt() && b.isInt()) {
        juce::int64 x = a.getInt();
        juce::int64 y = b.getInt();
        if (y == 0)
          throw ExprException("Divide by zero");
        if (checkedRemainder(x, y) == 0)
          result = ExprValue::fromInt(checkedQuotient(x, y));
        else
          result = ExprValue::fromFloat((double)x / (double)y);
    }
    else {
        result = ExprValue::fromFloat(a.getFloat() / b.getFloat());
    }
    return result;
}

static ExprValue Divide(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    if (args.size() == 1)
      return divide(ExprValue::fromInt(1), args[0]);

    ExprValue result = args[0];
    for (int i = 1 ; i < args.size() ; i++)
      result = divide(result, args[i]);
    return result;
}

static ExprValue Quot(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkNumber(args[0], "quot");
    checkNumber(args[1], "quot");
    if (args[0].isInt() && args[1].isInt()) {
        if (args[1].getInt() == 0)
          throw ExprException("Divide by zero");
        return ExprValue::fromInt(checkedQuotient(args[0].getInt(), args[1].getInt()));
    }
    return ExprValue::fromFloat(std::trunc(args[0].getFloat() / args[1].getFloat()));
}

static ExprValue Rem(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkNumber(args[0], "rem");
    checkNumber(args[1], "rem");
    if (args[0].isInt() && args[1].isInt()) {
        if (args[1].getInt() == 0)
          throw ExprException("Divide by zero");
        return ExprValue::fromInt(checkedRemainder(args[0].getInt(), args[1].getInt()));
    }
    return ExprValue::fromFloat(std::fmod(args[0].getFloat(), args[1].getFloat()));
}

/**
 * Unlike rem the result has the sign of the divisor.
 */
static ExprValue Mod(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkNumber(args[0], "mod");
    checkNumber(args[1], "mod");
    if (args[0].isInt() && args[1].isInt()) {
        juce::int64 y = args[1].getInt();
        if (y == 0)
          throw ExprException("Divide by zero");
        juce::int64 m = checkedRemainder(args[0].getInt(), y);
        if (m != 0 && ((m < 0) != (y < 0)))
          m += y;
        return ExprValue::fromInt(m);
    }
    double y = args[1].getFloat();
    double m = std::fmod(args[0].getFloat(), y);
    if (m != 0 && ((m < 0) != (y < 0)))
      m += y;
    return ExprValue::fromFloat(m);
}

static ExprValue Inc(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkNumber(args[0], "inc");
    return arith(args[0], ExprValue::fromInt(1), ArithAdd);
}

static ExprValue Dec(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkNumber(args[0], "dec");
    return arith(args[0], ExprValue::fromInt(1), ArithSubtract);
}

static ExprValue Max(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    ExprValue result = args[0];
    checkNumber(result, "max");
    for (int i = 1 ; i < args.size() ; i++) {
        checkNumber(args[i], "max");
        if (ExprStandardLibrary::compare(args[i], result) > 0)
          result = args[i];
    }
    return result;
}

static ExprValue Min(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    ExprValue result = args[0];
    checkNumber(result, "min");
    for (int i = 1 ; i < args.size() ; i++) {
        checkNumber(args[i], "min");
        if (ExprStandardLibrary::compare(args[i], result) < 0)
          result = args[i];
    }
    return result;
}

static ExprValue Abs(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkNumber(args[0], "abs");
    if (args[0].isInt())
      return ExprValue::fromInt(args[0].getInt() < 0 ? checkedSubtract(0, args[0].getInt()) : args[0].getInt());
    return ExprValue::fromFloat(std::fabs(args[0].getFloat()));
}

static ExprValue Round(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkNumber(args[0], "Math/round");
    return ExprValue::fromInt((juce::int64)std::floor(args[0].getFloat() + 0.5));
}

static ExprValue Floor(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkNumber(args[0], "Math/floor");
    return ExprValue::fromFloat(std::floor(args[0].getFloat()));
}

static ExprValue Ceil(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkNumber(args[0], "Math/ceil");
    return ExprValue::fromFloat(std::ceil(args[0].getFloat()));
}

static ExprValue ToDouble(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkNumber(args[0], "double");
    return ExprValue::fromFloat(args[0].getFloat());
}

static ExprValue ToLong(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkNumber(args[0], "long");
    return ExprValue::fromInt(args[0].getInt());
}

static ExprValue ParseLong(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::String s = args[0].getName().trim();
    bool negative = s.startsWithChar('-');
    juce::String digits = (negative || s.startsWithChar('+')) ? s.substring(1) : s;
    if (!args[0].isString() || digits.isEmpty() || !digits.containsOnly("0123456789"))
      return ExprValue();
    return ExprValue::fromInt(s.getLargeIntValue());
}

static ExprValue ParseDouble(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::String s = args[0].getName().trim();
    if (!args[0].isString() || s.isEmpty() || !s.containsOnly("0123456789.eE-+"))
      return ExprValue();
    return ExprValue::fromFloat(s.getDoubleValue());
}

static ExprValue RandInt(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkInt(args[0], "rand-int");
    juce::int64 n = args[0].getInt();
    if (n <= 0)
      return ExprValue::fromInt(0);
    juce::int64 r = juce::Random::getSystemRandom().nextInt64() % n;
    if (r < 0)
      r = -r;
    return ExprValue::fromInt(r);
}

static ExprValue Rand(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    double scale = 1.0;
    if (args.size() > 0) {
        checkNumber(args[0], "rand");
        scale = args[0].getFloat();
    }
    return ExprValue::fromFloat(juce::Random::getSystemRandom().nextDouble() * scale);
}

static ExprValue CurrentTimeMillis(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    (void)args;
    return ExprValue::fromInt(juce::Time::currentTimeMillis());
}

//////////////////////////////////////////////////////////////////////
//
// Comparison
//
//////////////////////////////////////////////////////////////////////

int ExprStandardLibrary::compare(const ExprValue& a, const ExprValue& b)
{
    int result = 0;
    if (a.isNumber() && b.isNumber()) {
        if (a.isInt() && b.isInt()) {
            juce::int64 x = a.getInt();
            juce::int64 y = b.getInt();
            result = (x < y) ? -1 : ((x > y) ? 1 : 0);
        }
        else {
            double x = a.getFloat();
            double y = b.getFloat();
            result = (x < y) ? -1 : ((x > y) ? 1 : 0);
        }
    }
    else if (a.isNil() || b.isNil()) {
        result = (a.isNil() ? 0 : 1) - (b.isNil() ? 0 : 1);
    }
    else if ((a.isString() && b.isString()) ||
             (a.isKeyword() && b.isKeyword()) ||
             (a.isSymbol() && b.isSymbol())) {
        result = a.getName().compare(b.getName());
        result = (result < 0) ? -1 : ((result > 0) ? 1 : 0);
    }
    else if (a.isBool() && b.isBool()) {
        result = (a.getBool() ? 1 : 0) - (b.getBool() ? 1 : 0);
    }
    else if (a.isVector() && b.isVector()) {
        result = (a.size() < b.size()) ? -1 : ((a.size() > b.size()) ? 1 : 0);
        for (int i = 0 ; i < a.size() && result == 0 ; i++)
          result = compare(a.get(i), b.get(i));
    }
    else {
        throw ExprException("Cannot compare " + juce::String(a.getTypeName()) +
                            " with " + juce::String(b.getTypeName()));
    }
    return result;
}

static ExprValue Equal(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    for (int i = 1 ; i < args.size() ; i++) {
        if (!args[0].equals(args[i]))
          return ExprValue::fromBool(false);
    }
    return ExprValue::fromBool(true);
}

static ExprValue NotEqual(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    return ExprValue::fromBool(!Equal(ev, args).getBool());
}

static ExprValue NumEqual(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    for (int i = 0 ; i < args.size() ; i++) {
        checkNumber(args[i], "==");
        if (i > 0 && ExprStandardLibrary::compare(args[i-1], args[i]) != 0)
          return ExprValue::fromBool(false);
    }
    return ExprValue::fromBool(true);
}

typedef enum {
    CompareLess,
    CompareGreater,
    CompareLessEqual,
    CompareGreaterEqual
} CompareOp;

static ExprValue compareChain(const juce::Array<ExprValue>& args, CompareOp op, const char* fname)
{
    for (int i = 0 ; i < args.size() ; i++) {
        checkNumber(args[i], fname);
        if (i > 0) {
            int c = ExprStandardLibrary::compare(args[i-1], args[i]);
            bool ok = false;
            switch (op) {
                case CompareLess: ok = (c < 0); break;
                case CompareGreater: ok = (c > 0); break;
                case CompareLessEqual: ok = (c <= 0); break;
                case CompareGreaterEqual: ok = (c >= 0); break;
            }
            if (!ok)
              return ExprValue::fromBool(false);
        }
    }
    return ExprValue::fromBool(true);
}

static ExprValue Less(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return compareChain(args, CompareLess, "<");
}

static ExprValue Greater(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return compareChain(args, CompareGreater, ">");
}

static ExprValue LessEqual(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return compareChain(args, CompareLessEqual, "<=");
}

static ExprValue GreaterEqual(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return compareChain(args, CompareGreaterEqual, ">=");
}

static ExprValue Compare(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromInt(ExprStandardLibrary::compare(args[0], args[1]));
}

//////////////////////////////////////////////////////////////////////
//
// Predicates
//
//////////////////////////////////////////////////////////////////////

static ExprValue Not(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(!args[0].isTruthy());
}

static ExprValue IsNil(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].isNil());
}

static ExprValue IsSome(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(!args[0].isNil());
}

static ExprValue IsTrue(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].isBool() && args[0].getBool());
}

static ExprValue IsFalse(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].isBool() && !args[0].getBool());
}

static ExprValue IsZero(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkNumber(args[0], "zero?");
    return ExprValue::fromBool(args[0].getFloat() == 0.0);
}

static ExprValue IsPos(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkNumber(args[0], "pos?");
    return ExprValue::fromBool(args[0].getFloat() > 0.0);
}

static ExprValue IsNeg(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkNumber(args[0], "neg?");
    return ExprValue::fromBool(args[0].getFloat() < 0.0);
}

static ExprValue IsEven(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkInt(args[0], "even?");
    return ExprValue::fromBool((args[0].getInt() % 2) == 0);
}

static ExprValue IsOdd(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkInt(args[0], "odd?");
    return ExprValue::fromBool((args[0].getInt() % 2) != 0);
}

static ExprValue IsNumber(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].isNumber());
}

static ExprValue IsInteger(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].isInt());
}

static ExprValue IsFloat(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].isFloat());
}

static ExprValue IsString(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].isString());
}

static ExprValue IsKeyword(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].isKeyword());
}

static ExprValue IsSymbol(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].isSymbol());
}

static ExprValue IsBoolean(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].isBool());
}

static ExprValue IsFn(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].isFunction());
}

static ExprValue IsMap(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].isMap());
}

static ExprValue IsVector(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].isVector());
}

static ExprValue IsList(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].isList());
}

static ExprValue IsColl(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].isSequential() || args[0].isMap());
}

static ExprValue IsEmpty(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(items(args[0]).size() == 0);
}

static ExprValue NotEmpty(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return (items(args[0]).size() == 0) ? ExprValue() : args[0];
}

static ExprValue IsContains(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].containsKey(args[1]));
}

/**
 * (instance? Class x)
 * Host objects answer for themselves, ordinary values are
 * described with the usual Java names.
 */
static ExprValue IsInstance(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    ExprClass* cls = dynamic_cast<ExprClass*>(args[0].getObject());
    if (cls == nullptr)
      throw ExprException("instance? requires a class but got " + args[0].print());

    const juce::String& name = cls->name;
    const ExprValue& x = args[1];
    bool result = false;

    ExprObject* obj = x.getObject();
    if (obj != nullptr) {
        result = obj->isInstance(name);
    }
    else if (!x.isNil()) {
        result = (name == "Object" ||
                  name == juce::String(x.getTypeName()) ||
                  (name == "Number" && x.isNumber()));
    }
    return ExprValue::fromBool(result);
}

static ExprValue Identity(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return args[0];
}

static ExprValue Type(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    ExprObject* obj = args[0].getObject();
    if (obj != nullptr)
      return ExprValue::symbol(obj->getClassName());
    return ExprValue::symbol(args[0].getTypeName());
}

//////////////////////////////////////////////////////////////////////
//
// Strings
//
//////////////////////////////////////////////////////////////////////

static ExprValue Str(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::String s;
    for (auto a : args)
      s += a.toString();
    return ExprValue::fromString(s);
}

static ExprValue PrStr(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::StringArray parts;
    for (auto a : args)
      parts.add(a.print());
    return ExprValue::fromString(parts.joinIntoString(" "));
}

static ExprValue Subs(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    if (!args[0].isString())
      throw ExprException("subs requires a string");
    juce::String s = args[0].getName();
    checkInt(args[1], "subs");
    int start = (int)args[1].getInt();
    int end = s.length();
    if (args.size() > 2) {
        checkInt(args[2], "subs");
        end = (int)args[2].getInt();
    }
    if (start < 0 || end > s.length() || start > end)
      throw ExprException("String index out of range: " + juce::String(start) + " to " + juce::String(end));
    return ExprValue::fromString(s.substring(start, end));
}

static ExprValue Name(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    if (!(args[0].isString() || args[0].isKeyword() || args[0].isSymbol()))
      throw ExprException("Doesn't support name: " + args[0].print());
    return ExprValue::fromString(args[0].getName());
}

static ExprValue Keyword(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    if (args[0].isKeyword())
      return args[0];
    if (args[0].isNil())
      return ExprValue();
    return ExprValue::keyword(args[0].getName());
}

static ExprValue Symbol(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::symbol(args[0].getName());
}

static ExprValue Format(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromString(ExprStandardLibrary::format(args[0].toString(), args, 1));
}

/**
 * Render one numeric conversion, the buffer is sized from what
 * snprintf says it needs.
 */
template <typename T>
static juce::String formatNumber(const juce::String& directive, T value)
{
    const char* fmt = directive.toRawUTF8();
    int needed = snprintf(nullptr, 0, fmt, value);
    if (needed < 0)
      throw ExprException("Invalid format specifier: " + directive);
    juce::HeapBlock<char> buffer((size_t)needed + 1);
    snprintf(buffer.getData(), (size_t)needed + 1, fmt, value);
    return juce::String(juce::CharPointer_UTF8(buffer.getData()));
}

/**
 * %s works on characters rather than bytes so width and precision
 * never split a multi-byte character.
 */
static juce::String formatString(const juce::String& flags, const juce::String& text)
{
    bool leftJustify = flags.containsChar('-');
    juce::String sizes = flags.retainCharacters("0123456789.");
    int width = sizes.upToFirstOccurrenceOf(".", false, false).getIntValue();

    juce::String result = text;
    if (sizes.containsChar('.')) {
        int precision = sizes.fromFirstOccurrenceOf(".", false, false).getIntValue();
        if (result.length() > precision)
          result = result.substring(0, precision);
    }

    int pad = width - result.length();
    if (pad > 0) {
        juce::String spaces = juce::String::repeatedString(" ", pad);
        result = leftJustify ? result + spaces : spaces + result;
    }
    return result;
}

/**
 * Handles %s %d %f %x %% and %n with the usual flags,
 * width and precision.
 */
juce::String ExprStandardLibrary::format(const juce::String& pattern, const juce::Array<ExprValue>& args, int start)
{
    juce::String result;
    int argIndex = start;
    int length = pattern.length();

    for (int i = 0 ; i < length ; i++) {
        juce::juce_wchar ch = pattern[i];
        if (ch != '%') {
            result += juce::String::charToString(ch);
            continue;
        }

        juce::String directive = "%";
        i++;
        while (i < length && juce::String("-+ 0#.0123456789").containsChar(pattern[i])) {
            directive += juce::String::charToString(pattern[i]);
            i++;
        }
        if (i >= length)
          throw ExprException("Incomplete format specifier: " + directive);

        juce::juce_wchar conversion = pattern[i];
        if (conversion == '%') {
            result += "%";
            continue;
        }
        if (conversion == 'n') {
            result += "\n";
            continue;
        }

        if (argIndex >= args.size())
          throw ExprException("Format specifier " + directive + juce::String::charToString(conversion) +
                              " has no argument");
        const ExprValue& arg = args.getReference(argIndex++);

        switch (conversion) {
            case 's': {
                juce::String text = arg.toString();
                if (arg.isNil()) text = "null";
                result += formatString(directive, text);
            }
                break;
            case 'd':
                checkInt(arg, "format %d");
                result += formatNumber(directive + "lld", (long long)arg.getInt());
                break;
            case 'x':
            case 'X':
                checkInt(arg, "format %x");
                result += formatNumber(directive + ((conversion == 'x') ? "llx" : "llX"), (long long)arg.getInt());
                break;
            case 'f':
            case 'e':
            case 'g':
                checkNumber(arg, "format %f");
                result += formatNumber(directive + juce::String::charToString(conversion), arg.getFloat());
                break;
            default:
                throw ExprException("Unsupported format conversion: " + juce::String::charToString(conversion));
        }
    }
    return result;
}

static ExprValue StrJoin(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::String separator;
    ExprValue coll = args[0];
    if (args.size() > 1) {
        separator = args[0].toString();
        coll = args[1];
    }
    juce::StringArray parts;
    for (auto item : items(coll))
      parts.add(item.toString());
    return ExprValue::fromString(parts.joinIntoString(separator));
}

static ExprValue StrUpper(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromString(args[0].toString().toUpperCase());
}

static ExprValue StrLower(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromString(args[0].toString().toLowerCase());
}

static ExprValue StrTrim(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromString(args[0].toString().trim());
}

static ExprValue StrBlank(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].toString().trim().isEmpty());
}

static ExprValue StrIncludes(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].toString().contains(args[1].toString()));
}

static ExprValue StrStartsWith(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].toString().startsWith(args[1].toString()));
}

static ExprValue StrEndsWith(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromBool(args[0].toString().endsWith(args[1].toString()));
}

/**
 * Splits on a literal separator, there are no regular expressions.
 */
static ExprValue StrSplit(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::String s = args[0].toString();
    juce::String separator = args[1].toString();
    juce::Array<ExprValue> parts;
    if (separator.isEmpty()) {
        for (auto p = s.getCharPointer() ; !p.isEmpty() ; )
          parts.add(ExprValue::fromString(juce::String::charToString(p.getAndAdvance())));
    }
    else {
        int start = 0;
        while (true) {
            int index = s.indexOf(start, separator);
            if (index < 0) {
                parts.add(ExprValue::fromString(s.substring(start)));
                break;
            }
            parts.add(ExprValue::fromString(s.substring(start, index)));
            start = index + separator.length();
        }
    }
    return ExprValue::vector(parts);
}

static ExprValue StrReplace(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::fromString(args[0].toString().replace(args[1].toString(), args[2].toString()));
}

//////////////////////////////////////////////////////////////////////
//
// Collections
//
//////////////////////////////////////////////////////////////////////

static ExprValue List(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return makeList(args);
}

static ExprValue Vector(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::vector(args);
}

static ExprValue Vec(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::vector(items(args[0]));
}

static ExprValue HashMap(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    if ((args.size() % 2) != 0)
      throw ExprException("No value supplied for key: " + args[args.size() - 1].print());
    return ExprValue::map(args);
}

static ExprValue First(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::Array<ExprValue> all = items(args[0]);
    return all.size() > 0 ? all[0] : ExprValue();
}

static ExprValue Second(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::Array<ExprValue> all = items(args[0]);
    return all.size() > 1 ? all[1] : ExprValue();
}

static ExprValue Last(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::Array<ExprValue> all = items(args[0]);
    return all.size() > 0 ? all.getLast() : ExprValue();
}

static ExprValue Rest(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::Array<ExprValue> all = items(args[0]);
    if (all.size() > 0)
      all.remove(0);
    return makeList(all);
}

static ExprValue Next(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::Array<ExprValue> all = items(args[0]);
    if (all.size() <= 1)
      return ExprValue();
    all.remove(0);
    return makeList(all);
}

static ExprValue Nth(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkInt(args[1], "nth");
    juce::Array<ExprValue> all = items(args[0]);
    juce::int64 index = args[1].getInt();
    if (index < 0 || index >= all.size()) {
        if (args.size() > 2)
          return args[2];
        throw ExprException("Index out of bounds: " + juce::String(index));
    }
    return all[(int)index];
}

static ExprValue Count(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    if (args[0].isString() || args[0].isMap())
      return ExprValue::fromInt(args[0].size());
    return ExprValue::fromInt(items(args[0]).size());
}

static ExprValue Cons(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::Array<ExprValue> all = items(args[1]);
    all.insert(0, args[0]);
    return makeList(all);
}

/**
 * Lists grow at the front, vectors at the back,
 * maps take [key value] entries or other maps.
 */
static ExprValue Conj(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    ExprValue coll = args[0];
    for (int i = 1 ; i < args.size() ; i++) {
        const ExprValue& x = args.getReference(i);
        if (coll.isMap()) {
            if (x.isMap()) {
                for (int k = 0 ; k < x.getKeys().size() ; k++)
                  coll = coll.assoc(x.getKeys()[k], x.getValues()[k]);
            }
            else if (x.isVector() && x.size() == 2) {
                coll = coll.assoc(x.get(0), x.get(1));
            }
            else {
                throw ExprException("Maps can only conj [key value] vectors or maps");
            }
        }
        else if (coll.isVector()) {
            juce::Array<ExprValue> all = coll.getItems();
            all.add(x);
            coll = ExprValue::vector(all);
        }
        else if (coll.isList() || coll.isNil()) {
            juce::Array<ExprValue> all = coll.getItems();
            all.insert(0, x);
            coll = makeList(all);
        }
        else {
            throw ExprException("Cannot conj onto " + juce::String(coll.getTypeName()));
        }
    }
    return coll;
}

static ExprValue Concat(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::Array<ExprValue> all;
    for (auto a : args)
      all.addArray(items(a));
    return makeList(all);
}

static ExprValue Seq(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::Array<ExprValue> all = items(args[0]);
    return all.size() > 0 ? makeList(all) : ExprValue();
}

static ExprValue Get(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    ExprValue result;
    if (!args[0].lookup(args[1], result) && args.size() > 2)
      result = args[2];
    return result;
}

static ExprValue GetIn(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    ExprValue current = args[0];
    for (auto key : items(args[1])) {
        ExprValue next;
        if (!current.lookup(key, next))
          return (args.size() > 2) ? args[2] : ExprValue();
        current = next;
    }
    return current;
}

static ExprValue Assoc(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    if ((args.size() % 2) != 1)
      throw ExprException("assoc expects even number of arguments after map/vector");
    ExprValue result = args[0];
    if (!(result.isNil() || result.isMap() || result.isVector()))
      throw ExprException("Cannot assoc onto " + juce::String(result.getTypeName()));
    for (int i = 1 ; i < args.size() ; i += 2) {
        if (result.isVector()) {
            checkInt(args[i], "assoc");
            juce::int64 index = args[i].getInt();
            if (index < 0 || index > result.size())
              throw ExprException("Index out of bounds: " + juce::String(index));
        }
        result = result.assoc(args[i], args[i+1]);
    }
    return result;
}

static ExprValue Dissoc(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    ExprValue result = args[0];
    if (result.isNil())
      return result;
    for (int i = 1 ; i < args.size() ; i++)
      result = result.dissoc(args[i]);
    return result;
}

static ExprValue assocIn(const ExprValue& m, const juce::Array<ExprValue>& keys, int index, const ExprValue& value)
{
    if (index == keys.size() - 1)
      return m.assoc(keys[index], value);
    return m.assoc(keys[index], assocIn(m.lookup(keys[index]), keys, index + 1, value));
}

static ExprValue AssocIn(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::Array<ExprValue> keys = items(args[1]);
    if (keys.size() == 0)
      throw ExprException("assoc-in requires at least one key");
    return assocIn(args[0], keys, 0, args[2]);
}

static ExprValue Update(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    juce::Array<ExprValue> fargs;
    fargs.add(args[0].lookup(args[1]));
    for (int i = 3 ; i < args.size() ; i++)
      fargs.add(args[i]);
    return args[0].assoc(args[1], ev->apply(args[2], fargs));
}

static ExprValue updateIn(ExprEvaluator* ev, const ExprValue& m, const juce::Array<ExprValue>& keys, int index,
                          const ExprValue& f, const juce::Array<ExprValue>& extra)
{
    ExprValue current = m.lookup(keys[index]);
    ExprValue updated;
    if (index == keys.size() - 1) {
        juce::Array<ExprValue> fargs;
        fargs.add(current);
        fargs.addArray(extra);
        updated = ev->apply(f, fargs);
    }
    else {
        updated = updateIn(ev, current, keys, index + 1, f, extra);
    }
    return m.assoc(keys[index], updated);
}

static ExprValue UpdateIn(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    juce::Array<ExprValue> keys = items(args[1]);
    if (keys.size() == 0)
      throw ExprException("update-in requires at least one key");
    juce::Array<ExprValue> extra;
    for (int i = 3 ; i < args.size() ; i++)
      extra.add(args[i]);
    return updateIn(ev, args[0], keys, 0, args[2], extra);
}

static ExprValue Merge(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    ExprValue result;
    for (auto m : args) {
        if (m.isNil())
          continue;
        if (!m.isMap())
          throw ExprException("merge requires maps but got " + juce::String(m.getTypeName()));
        if (result.isNil()) {
            result = m;
        }
        else {
            for (int i = 0 ; i < m.getKeys().size() ; i++)
              result = result.assoc(m.getKeys()[i], m.getValues()[i]);
        }
    }
    return result;
}

static ExprValue SelectKeys(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    ExprValue result = ExprValue::map();
    for (auto key : items(args[1])) {
        ExprValue value;
        if (args[0].lookup(key, value))
          result = result.assoc(key, value);
    }
    return result;
}

static ExprValue Keys(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    const juce::Array<ExprValue>& keys = args[0].getKeys();
    return keys.size() > 0 ? makeList(keys) : ExprValue();
}

static ExprValue Vals(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    const juce::Array<ExprValue>& values = args[0].getValues();
    return values.size() > 0 ? makeList(values) : ExprValue();
}

static ExprValue Zipmap(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::Array<ExprValue> keys = items(args[0]);
    juce::Array<ExprValue> values = items(args[1]);
    ExprValue result = ExprValue::map();
    for (int i = 0 ; i < keys.size() && i < values.size() ; i++)
      result = result.assoc(keys[i], values[i]);
    return result;
}

/**
 * (map f coll) or (map f c1 c2 ...) stopping at the shortest.
 */
static juce::Array<ExprValue> mapItems(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    juce::Array<juce::Array<ExprValue>> colls;
    int shortest = -1;
    for (int i = 1 ; i < args.size() ; i++) {
        colls.add(items(args[i]));
        int n = colls.getReference(colls.size() - 1).size();
        if (shortest < 0 || n < shortest)
          shortest = n;
    }

    juce::Array<ExprValue> result;
    for (int i = 0 ; i < shortest ; i++) {
        juce::Array<ExprValue> fargs;
        for (auto& coll : colls)
          fargs.add(coll[i]);
        result.add(ev->apply(args[0], fargs));
    }
    return result;
}

static ExprValue Map(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    return makeList(mapItems(ev, args));
}

static ExprValue Mapv(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    return ExprValue::vector(mapItems(ev, args));
}

static ExprValue Filter(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    juce::Array<ExprValue> result;
    for (auto item : items(args[1])) {
        if (call1(ev, args[0], item).isTruthy())
          result.add(item);
    }
    return makeList(result);
}

static ExprValue Remove(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    juce::Array<ExprValue> result;
    for (auto item : items(args[1])) {
        if (!call1(ev, args[0], item).isTruthy())
          result.add(item);
    }
    return makeList(result);
}

static ExprValue Some(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    for (auto item : items(args[1])) {
        ExprValue v = call1(ev, args[0], item);
        if (v.isTruthy())
          return v;
    }
    return ExprValue();
}

static ExprValue Every(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    for (auto item : items(args[1])) {
        if (!call1(ev, args[0], item).isTruthy())
          return ExprValue::fromBool(false);
    }
    return ExprValue::fromBool(true);
}

static ExprValue Reduce(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    juce::Array<ExprValue> all;
    ExprValue acc;
    int start = 0;
    if (args.size() == 2) {
        all = items(args[1]);
        if (all.size() == 0)
          return ev->apply(args[0], juce::Array<ExprValue>());
        acc = all[0];
        start = 1;
    }
    else {
        acc = args[1];
        all = items(args[2]);
    }
    for (int i = start ; i < all.size() ; i++)
      acc = call2(ev, args[0], acc, all[i]);
    return acc;
}

/**
 * (apply f a b [c d]) calls (f a b c d)
 */
static ExprValue Apply(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    juce::Array<ExprValue> fargs;
    for (int i = 1 ; i < args.size() - 1 ; i++)
      fargs.add(args[i]);
    if (args.size() > 1)
      fargs.addArray(items(args[args.size() - 1]));
    return ev->apply(args[0], fargs);
}

static ExprValue Range(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::int64 start = 0;
    juce::int64 end = 0;
    juce::int64 step = 1;
    for (auto a : args)
      checkInt(a, "range");
    if (args.size() == 1) {
        end = args[0].getInt();
    }
    else {
        start = args[0].getInt();
        end = args[1].getInt();
        if (args.size() > 2)
          step = args[2].getInt();
    }
    if (step == 0)
      throw ExprException("range step may not be zero");

    juce::Array<ExprValue> result;
    for (juce::int64 i = start ; (step > 0) ? (i < end) : (i > end) ; i += step)
      result.add(ExprValue::fromInt(i));
    return makeList(result);
}

static ExprValue Take(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkInt(args[0], "take");
    juce::Array<ExprValue> all = items(args[1]);
    juce::Array<ExprValue> result;
    for (int i = 0 ; i < all.size() && i < args[0].getInt() ; i++)
      result.add(all[i]);
    return makeList(result);
}

static ExprValue Drop(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    checkInt(args[0], "drop");
    juce::Array<ExprValue> all = items(args[1]);
    juce::Array<ExprValue> result;
    for (int i = (int)juce::jmax((juce::int64)0, args[0].getInt()) ; i < all.size() ; i++)
      result.add(all[i]);
    return makeList(result);
}

static ExprValue Reverse(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::Array<ExprValue> all = items(args[0]);
    juce::Array<ExprValue> result;
    for (int i = all.size() - 1 ; i >= 0 ; i--)
      result.add(all[i]);
    return makeList(result);
}

/**
 * Insertion sort, stable and more than fast enough for
 * the handful of items expressions deal with.
 */
static juce::Array<ExprValue> sortItems(ExprEvaluator* ev, const juce::Array<ExprValue>& all, const ExprValue& keyfn)
{
    juce::Array<ExprValue> keys;
    for (auto item : all)
      keys.add(keyfn.isNil() ? item : call1(ev, keyfn, item));

    juce::Array<ExprValue> sorted = all;
    for (int i = 1 ; i < sorted.size() ; i++) {
        ExprValue item = sorted[i];
        ExprValue key = keys[i];
        int j = i - 1;
        while (j >= 0 && ExprStandardLibrary::compare(keys[j], key) > 0) {
            sorted.set(j + 1, sorted[j]);
            keys.set(j + 1, keys[j]);
            j--;
        }
        sorted.set(j + 1, item);
        keys.set(j + 1, key);
    }
    return sorted;
}

static ExprValue Sort(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    return makeList(sortItems(ev, items(args[0]), ExprValue()));
}

static ExprValue SortBy(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    return makeList(sortItems(ev, items(args[1]), args[0]));
}

static ExprValue Distinct(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::Array<ExprValue> result;
    for (auto item : items(args[0])) {
        if (!result.contains(item))
          result.add(item);
    }
    return makeList(result);
}

static ExprValue Into(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    juce::Array<ExprValue> conjArgs;
    conjArgs.add(args[0]);
    conjArgs.addArray(items(args[1]));
    return Conj(ev, conjArgs);
}

//////////////////////////////////////////////////////////////////////
//
// Higher order
//
//////////////////////////////////////////////////////////////////////

/**
 * The functions that partial, comp, constantly and complement make.
 */
class ExprComposedFunction : public ExprFunction
{
  public:

    typedef enum {
        Partial,
        Compose,
        Constantly,
        Complement
    } Kind;

    ExprComposedFunction(Kind k, const juce::Array<ExprValue>& v) : kind(k), values(v) {
        name = "fn";
    }

    ExprValue call(ExprEvaluator* ev, const juce::Array<ExprValue>& args) override {
        ExprValue result;
        switch (kind) {
            case Partial: {
                juce::Array<ExprValue> all;
                for (int i = 1 ; i < values.size() ; i++)
                  all.add(values[i]);
                all.addArray(args);
                result = ev->apply(values[0], all);
            }
                break;
            case Compose: {
                if (values.size() == 0)
                  return args.size() > 0 ? args[0] : ExprValue();
                result = ev->apply(values.getLast(), args);
                for (int i = values.size() - 2 ; i >= 0 ; i--)
                  result = call1(ev, values[i], result);
            }
                break;
            case Constantly:
                result = values[0];
                break;
            case Complement:
                result = ExprValue::fromBool(!ev->apply(values[0], args).isTruthy());
                break;
        }
        return result;
    }

  private:

    Kind kind;
    juce::Array<ExprValue> values;
};

static ExprValue PartialFn(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::function(new ExprComposedFunction(ExprComposedFunction::Partial, args));
}

static ExprValue CompFn(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::function(new ExprComposedFunction(ExprComposedFunction::Compose, args));
}

static ExprValue ConstantlyFn(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::function(new ExprComposedFunction(ExprComposedFunction::Constantly, args));
}

static ExprValue ComplementFn(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::function(new ExprComposedFunction(ExprComposedFunction::Complement, args));
}

//////////////////////////////////////////////////////////////////////
//
// Atoms
//
//////////////////////////////////////////////////////////////////////

static ExprAtom* requireAtom(const ExprValue& v, const char* fname)
{
    ExprAtom* a = v.getAtom();
    if (a == nullptr)
      throw ExprException(juce::String(fname) + " requires an atom but got " + juce::String(v.getTypeName()));
    return a;
}

static ExprValue Atom(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return ExprValue::atom(args.size() > 0 ? args[0] : ExprValue());
}

static ExprValue Deref(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    return requireAtom(args[0], "deref")->deref();
}

static ExprValue Reset(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    requireAtom(args[0], "reset!")->reset(args[1]);
    return args[1];
}

/**
 * The update function runs outside the atom lock and is retried if
 * another thread changed the atom in the meantime, so it may be
 * called more than once.
 */
static ExprValue Swap(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    ExprAtom* a = requireAtom(args[0], "swap!");
    while (true) {
        juce::int64 version = 0;
        ExprValue current = a->deref(version);
        juce::Array<ExprValue> fargs;
        fargs.add(current);
        for (int i = 2 ; i < args.size() ; i++)
          fargs.add(args[i]);
        ExprValue updated = ev->apply(args[1], fargs);
        if (a->compareAndSet(version, updated))
          return updated;
    }
}

static ExprValue CompareAndSet(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    ExprAtom* a = requireAtom(args[0], "compare-and-set!");
    juce::int64 version = 0;
    ExprValue current = a->deref(version);
    bool set = false;
    if (current.equals(args[1]))
      set = a->compareAndSet(version, args[2]);
    return ExprValue::fromBool(set);
}

//////////////////////////////////////////////////////////////////////
//
// Exceptions
//
//////////////////////////////////////////////////////////////////////

/**
 * (ex-info message data) or (ex-info message data cause)
 */
static ExprValue ExInfo(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    if (!args[1].isMap() && !args[1].isNil())
      throw ExprException("ex-info requires a map of data");
    ExprThrowable* t = new ExprThrowable(args[0].toString(), args[1].isNil() ? ExprValue::map() : args[1]);
    ExprValue result = ExprValue::object(t);
    if (args.size() > 2) {
        ExprThrowable* cause = dynamic_cast<ExprThrowable*>(args[2].getObject());
        if (cause != nullptr) {
            t->causes.add(cause->message);
            t->causes.addArray(cause->causes);
        }
    }
    return result;
}

static ExprValue ExMessage(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    ExprThrowable* t = dynamic_cast<ExprThrowable*>(args[0].getObject());
    return (t != nullptr) ? ExprValue::fromString(t->message) : ExprValue();
}

static ExprValue ExData(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    ExprThrowable* t = dynamic_cast<ExprThrowable*>(args[0].getObject());
    return (t != nullptr) ? t->data : ExprValue();
}

//////////////////////////////////////////////////////////////////////
//
// Output and reflection
//
//////////////////////////////////////////////////////////////////////

static ExprValue Println(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::StringArray parts;
    for (auto a : args)
      parts.add(a.toString());
    Tracej(parts.joinIntoString(" "));
    return ExprValue();
}

static ExprValue Prn(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::StringArray parts;
    for (auto a : args)
      parts.add(a.print());
    Tracej(parts.joinIntoString(" "));
    return ExprValue();
}

static ExprValue Gensym(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    (void)ev;
    juce::String prefix = (args.size() > 0) ? args[0].toString() : juce::String("G");
    return ExprValue::symbol(ExprParser::gensym(prefix));
}

static ExprValue Macroexpand1(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    ExprExpander expander (ev->getWorkspace(), ev);
    ExprValue result;
    if (!expander.expandOnce(args[0], result))
      result = args[0];
    return result;
}

static ExprValue Macroexpand(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    ExprExpander expander (ev->getWorkspace(), ev);
    ExprValue form = args[0];
    ExprValue expanded;
    while (expander.expandOnce(form, expanded))
      form = expanded;
    return form;
}

static ExprValue MacroexpandAll(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    ExprExpander expander (ev->getWorkspace(), ev);
    return expander.expandAll(args[0]);
}

//////////////////////////////////////////////////////////////////////
//
// Definitions
//
//////////////////////////////////////////////////////////////////////

/**
 * Names beginning with str/ are also defined as clojure.string/
 */
ExprLibraryDefinition ExprLibraryDefinitions[] = {

    // arithmetic
    {"+", Add, 0, -1},
    {"-", Subtract, 1, -1},
    {"*", Multiply, 0, -1},
    {"/", Divide, 1, -1},
    {"quot", Quot, 2, 2},
    {"rem", Rem, 2, 2},
    {"mod", Mod, 2, 2},
    {"inc", Inc, 1, 1},
    {"dec", Dec, 1, 1},
    {"max", Max, 1, -1},
    {"min", Min, 1, -1},
    {"abs", Abs, 1, 1},
    {"double", ToDouble, 1, 1},
    {"float", ToDouble, 1, 1},
    {"long", ToLong, 1, 1},
    {"int", ToLong, 1, 1},
    {"parse-long", ParseLong, 1, 1},
    {"parse-double", ParseDouble, 1, 1},
    {"rand", Rand, 0, 1},
    {"rand-int", RandInt, 1, 1},
    {"Math/abs", Abs, 1, 1},
    {"Math/round", Round, 1, 1},
    {"Math/floor", Floor, 1, 1},
    {"Math/ceil", Ceil, 1, 1},
    {"Math/max", Max, 2, 2},
    {"Math/min", Min, 2, 2},
    {"System/currentTimeMillis", CurrentTimeMillis, 0, 0},

    // comparison
    {"=", Equal, 1, -1},
    {"not=", NotEqual, 1, -1},
    {"==", NumEqual, 1, -1},
    {"<", Less, 1, -1},
    {">", Greater, 1, -1},
    {"<=", LessEqual, 1, -1},
    {">=", GreaterEqual, 1, -1},
    {"compare", Compare, 2, 2},

    // predicates
    {"not", Not, 1, 1},
    {"nil?", IsNil, 1, 1},
    {"some?", IsSome, 1, 1},
    {"true?", IsTrue, 1, 1},
    {"false?", IsFalse, 1, 1},
    {"zero?", IsZero, 1, 1},
    {"pos?", IsPos, 1, 1},
    {"neg?", IsNeg, 1, 1},
    {"even?", IsEven, 1, 1},
    {"odd?", IsOdd, 1, 1},
    {"number?", IsNumber, 1, 1},
    {"integer?", IsInteger, 1, 1},
    {"int?", IsInteger, 1, 1},
    {"float?", IsFloat, 1, 1},
    {"double?", IsFloat, 1, 1},
    {"string?", IsString, 1, 1},
    {"keyword?", IsKeyword, 1, 1},
    {"symbol?", IsSymbol, 1, 1},
    {"boolean?", IsBoolean, 1, 1},
    {"fn?", IsFn, 1, 1},
    {"ifn?", IsFn, 1, 1},
    {"map?", IsMap, 1, 1},
    {"vector?", IsVector, 1, 1},
    {"list?", IsList, 1, 1},
    {"seq?", IsList, 1, 1},
    {"coll?", IsColl, 1, 1},
    {"empty?", IsEmpty, 1, 1},
    {"not-empty", NotEmpty, 1, 1},
    {"contains?", IsContains, 2, 2},
    {"instance?", IsInstance, 2, 2},
    {"identity", Identity, 1, 1},
    {"type", Type, 1, 1},
    {"class", Type, 1, 1},

    // strings
    {"str", Str, 0, -1},
    {"pr-str", PrStr, 0, -1},
    {"subs", Subs, 2, 3},
    {"name", Name, 1, 1},
    {"keyword", Keyword, 1, 1},
    {"symbol", Symbol, 1, 1},
    {"format", Format, 1, -1},
    {"str/join", StrJoin, 1, 2},
    {"str/upper-case", StrUpper, 1, 1},
    {"str/lower-case", StrLower, 1, 1},
    {"str/trim", StrTrim, 1, 1},
    {"str/blank?", StrBlank, 1, 1},
    {"str/includes?", StrIncludes, 2, 2},
    {"str/starts-with?", StrStartsWith, 2, 2},
    {"str/ends-with?", StrEndsWith, 2, 2},
    {"str/split", StrSplit, 2, 2},
    {"str/replace", StrReplace, 3, 3},

    // collections
    {"list", List, 0, -1},
    {"vector", Vector, 0, -1},
    {"vec", Vec, 1, 1},
    {"hash-map", HashMap, 0, -1},
    {"first", First, 1, 1},
    {"second", Second, 1, 1},
    {"last", Last, 1, 1},
    {"rest", Rest, 1, 1},
    {"next", Next, 1, 1},
    {"nth", Nth, 2, 3},
    {"count", Count, 1, 1},
    {"cons", Cons, 2, 2},
    {"conj", Conj, 1, -1},
    {"concat", Concat, 0, -1},
    {"seq", Seq, 1, 1},
    {"get", Get, 2, 3},
    {"get-in", GetIn, 2, 3},
    {"assoc", Assoc, 3, -1},
    {"dissoc", Dissoc, 1, -1},
    {"assoc-in", AssocIn, 3, 3},
    {"update", Update, 3, -1},
    {"update-in", UpdateIn, 3, -1},
    {"merge", Merge, 0, -1},
    {"select-keys", SelectKeys, 2, 2},
    {"keys", Keys, 1, 1},
    {"vals", Vals, 1, 1},
    {"zipmap", Zipmap, 2, 2},
    {"map", Map, 2, -1},
    {"mapv", Mapv, 2, -1},
    {"filter", Filter, 2, 2},
    {"remove", Remove, 2, 2},
    {"some", Some, 2, 2},
    {"every?", Every, 2, 2},
    {"reduce", Reduce, 2, 3},
    {"apply", Apply, 2, -1},
    {"range", Range, 1, 3},
    {"take", Take, 2, 2},
    {"drop", Drop, 2, 2},
    {"reverse", Reverse, 1, 1},
    {"sort", Sort, 1, 1},
    {"sort-by", SortBy, 2, 2},
    {"distinct", Distinct, 1, 1},
    {"into", Into, 2, 2},

    // higher order
    {"partial", PartialFn, 1, -1},
    {"comp", CompFn, 0, -1},
    {"constantly", ConstantlyFn, 1, 1},
    {"complement", ComplementFn, 1, 1},

    // atoms
    {"atom", Atom, 0, 1},
    {"deref", Deref, 1, 1},
    {"reset!", Reset, 2, 2},
    {"swap!", Swap, 2, -1},
    {"compare-and-set!", CompareAndSet, 3, 3},

    // exceptions
    {"ex-info", ExInfo, 2, 3},
    {"ex-message", ExMessage, 1, 1},
    {"ex-data", ExData, 1, 1},

    // output and reflection
    {"println", Println, 0, -1},
    {"print", Println, 0, -1},
    {"prn", Prn, 0, -1},
    {"gensym", Gensym, 0, 1},
    {"macroexpand-1", Macroexpand1, 1, 1},
    {"macroexpand", Macroexpand, 1, 1},
    {"macroexpand-all", MacroexpandAll, 1, 1},

    {nullptr, nullptr, 0, 0}
};

ExprLibraryDefinition* ExprStandardLibrary::find(juce::String name)
{
    ExprLibraryDefinition* def = nullptr;

    if (name.startsWith("clojure.string/"))
      name = "str/" + name.fromFirstOccurrenceOf("/", false, false);

    for (int i = 0 ; ExprLibraryDefinitions[i].name != nullptr ; i++) {
        if (strcmp(ExprLibraryDefinitions[i].name, name.toUTF8()) == 0) {
            def = &(ExprLibraryDefinitions[i]);
            break;
        }
    }
    return def;
}

void ExprStandardLibrary::install(ExprWorkspace* ws)
{
    int count = 0;
    for (int i = 0 ; ExprLibraryDefinitions[i].name != nullptr ; i++) {
        ExprLibraryDefinition* def = &(ExprLibraryDefinitions[i]);
        juce::String name (def->name);
        ws->define(name, ExprValue::function(new ExprNativeFunction(def)));
        if (name.startsWith("str/")) {
            juce::String alias = "clojure.string/" + name.fromFirstOccurrenceOf("/", false, false);
            ws->define(alias, ExprValue::function(new ExprNativeFunction(def)));
        }
        count++;
    }
    ws->define("Math/PI", ExprValue::fromFloat(juce::MathConstants<double>::pi));
    Trace(3, "ExprStandardLibrary: Installed %ld functions", (long)count);
}

//////////////////////////////////////////////////////////////////////
//
// ExprNativeFunction
//
//////////////////////////////////////////////////////////////////////

ExprNativeFunction::ExprNativeFunction(ExprLibraryDefinition* def)
{
    definition = def;
    name = def->name;
}

ExprValue ExprNativeFunction::call(ExprEvaluator* ev, const juce::Array<ExprValue>& args)
{
    if (args.size() < definition->minArgs ||
        (definition->maxArgs >= 0 && args.size() > definition->maxArgs)) {
        throw ExprException("Wrong number of args (" + juce::String(args.size()) + ") passed to: " + name);
    }
    return definition->function(ev, args);
}
