/**
 * The evaluator, the built in macros, and the standard library,
 * exercised through whole snippets.
 */

#include <JuceHeader.h>

#include "../expr/ExprValue.h"
#include "../expr/ExprStandardLibrary.h"

#include "ExprTestHarness.h"

class EvaluatorTest : public juce::UnitTest
{
  public:

    EvaluatorTest() : juce::UnitTest("Evaluator", "BeatTrigger") {}

    void check(ExprTestHarness& h, const char* source, const char* expected)
    {
        juce::String actual = h.print(source);
        expectEquals(actual, juce::String(expected), juce::String(source));
    }

    void checkError(ExprTestHarness& h, const char* source, const char* fragment)
    {
        ExprValue value = h.run(source);
        expect(value.isNil());
        expect(h.lastError.contains(fragment), juce::String(source) + " gave " + h.lastError);
    }

    void runTest() override
    {
        ExprTestHarness h;

        beginTest("Special forms");
        {
            check(h, "(if true 1 2)", "1");
            check(h, "(if nil 1 2)", "2");
            check(h, "(if false 1)", "nil");
            check(h, "(do 1 2 3)", "3");
            check(h, "(let [a 1 b (+ a 1)] (* a b))", "2");
            check(h, "'(a b)", "(a b)");
            check(h, "((fn [x] (* x x)) 5)", "25");
            check(h, "((fn ([] 0) ([x] x) ([x & more] (count more))) 1 2 3)", "2");
            check(h, "(loop [i 0 acc 0] (if (< i 5) (recur (inc i) (+ acc i)) acc))", "10");
            check(h, "((fn fact [n] (if (< n 2) 1 (* n (fact (dec n))))) 10)", "3628800");
        }

        beginTest("Destructuring");
        {
            check(h, "(let [[a b & more :as all] [1 2 3 4]] [a b more (count all)])", "[1 2 (3 4) 4]");
            check(h, "(let [{:keys [a b] :or {b 5}} {:a 1}] [a b])", "[1 5]");
            check(h, "(let [{x :x :as m} {:x 3}] [x (count m)])", "[3 1]");
            check(h, "((fn [{:keys [name]}] name) {:name \"CDJ\"})", "\"CDJ\"");
            check(h, "(let [[a [b c]] [1 [2 3]]] (+ a b c))", "6");
        }

        beginTest("Macros");
        {
            check(h, "(when (> 2 1) :yes)", ":yes");
            check(h, "(when-not (> 2 1) :yes)", "nil");
            check(h, "(cond (> 1 2) :a (> 2 1) :b :else :c)", ":b");
            check(h, "(case 2 1 :one 2 :two :other)", ":two");
            check(h, "(case \"USB_SLOT\" \"CD_SLOT\" :cd \"USB_SLOT\" :usb :unknown)", ":usb");
            check(h, "(case 9 (1 2) :low (8 9) :high :none)", ":high");
            check(h, "(and 1 2 3)", "3");
            check(h, "(and 1 nil 3)", "nil");
            check(h, "(or nil false 7)", "7");
            check(h, "(-> 1 inc (* 3))", "6");
            check(h, "(->> [1 2 3] (map inc) (reduce +))", "9");
            check(h, "(if-let [x (get {:a 1} :a)] x :none)", "1");
            check(h, "(when-let [x nil] :never)", "nil");
            check(h, "(let [a (atom 0)] (dotimes [i 4] (swap! a + i)) @a)", "6");
            check(h, "(comment anything at all)", "nil");
        }

        beginTest("Exceptions");
        {
            check(h, "(try (throw (ex-info \"boom\" {:a 1})) (catch Exception e (ex-message e)))", "\"boom\"");
            check(h, "(try (throw (ex-info \"boom\" {:a 1})) (catch Exception e (:a (ex-data e))))", "1");
            check(h, "(try (/ 1 0) (catch Exception e (.getMessage e)))", "\"Divide by zero\"");
            check(h, "(let [a (atom 0)] (try (+ 1 1) (finally (reset! a 9))) @a)", "9");
            checkError(h, "(throw (ex-info \"no handler\" {}))", "no handler");
            checkError(h, "(nth [1 2] 5)", "Index out of bounds");
        }

        beginTest("Arithmetic");
        {
            check(h, "(+ 1 2 3)", "6");
            check(h, "(+ 1 2.5)", "3.5");
            check(h, "(/ 6 3)", "2");
            check(h, "(/ 1 2)", "0.5");
            check(h, "(mod -7 3)", "2");
            check(h, "(rem -7 3)", "-1");
            check(h, "(max 1 9 4)", "9");
            check(h, "(< 1 2 3)", "true");
            check(h, "(= [1 2] '(1 2))", "true");
            check(h, "(= 1 1.0)", "false");
            check(h, "(== 1 1.0)", "true");
            checkError(h, "(+ 1 \"a\")", "");
        }

        beginTest("Integer limits");
        {
            expect(h.load("(def big 9223372036854775807) (def small (dec (- big)))"), h.lastError);
            check(h, "small", "-9223372036854775808");
            check(h, "(+ big 0)", "9223372036854775807");
            checkError(h, "(+ big 1)", "integer overflow");
            checkError(h, "(- small 1)", "integer overflow");
            checkError(h, "(- small)", "integer overflow");
            checkError(h, "(* big 2)", "integer overflow");
            checkError(h, "(* 4611686018427387904 2)", "integer overflow");
            checkError(h, "(* small -1)", "integer overflow");
            checkError(h, "(* -1 small)", "integer overflow");
            check(h, "(* -4611686018427387904 2)", "-9223372036854775808");
            checkError(h, "(inc big)", "integer overflow");
            checkError(h, "(dec small)", "integer overflow");
            checkError(h, "(Math/abs small)", "integer overflow");
            checkError(h, "(/ small -1)", "integer overflow");
            checkError(h, "(quot small -1)", "integer overflow");
            check(h, "(rem small -1)", "0");
            check(h, "(mod small -1)", "0");
            check(h, "(/ big -1)", "-9223372036854775807");
            check(h, "(quot small 2)", "-4611686018427387904");
            check(h, "(try (inc big) (catch Exception e (.getMessage e)))", "\"integer overflow\"");
        }

        beginTest("Strings");
        {
            check(h, "(str \"a\" 1 nil :k)", "\"a1:k\"");
            check(h, "(subs \"beatlink\" 4)", "\"link\"");
            check(h, "(str/join \", \" [1 2 3])", "\"1, 2, 3\"");
            check(h, "(str/upper-case \"cdj\")", "\"CDJ\"");
            check(h, "(format \"%d beats\" 4)", "\"4 beats\"");
            check(h, "(.toUpperCase \"abc\")", "\"ABC\"");
        }

        beginTest("Format");
        {
            check(h, "(format \"[%5s|%-5s]\" \"ab\" \"cd\")", "\"[   ab|cd   ]\"");
            check(h, "(format \"%.3s\" \"beatlink\")", "\"bea\"");
            check(h, "(format \"%05d %x %.2f\" 42 255 2.5)", "\"00042 ff 2.50\"");
            check(h, "(count (format \"%s\" (apply str (map (fn [_] \"a\") (range 300)))))", "300");
            check(h, "(count (format \"%400d\" 7))", "400");

            // width and precision count characters, not bytes
            juce::String artist = juce::String(juce::CharPointer_UTF8("Beyonc\xc3\xa9 \xc3\x9c" "ber"));
            juce::Array<ExprValue> args;
            args.add(ExprValue::fromString("%-14s|%.7s"));
            args.add(ExprValue::fromString(artist));
            args.add(ExprValue::fromString(artist));
            juce::String formatted = ExprStandardLibrary::format(args[0].toString(), args, 1);
            expectEquals(formatted, juce::String(juce::CharPointer_UTF8("Beyonc\xc3\xa9 \xc3\x9c" "ber  |Beyonc\xc3\xa9")));

            juce::String longName = juce::String::repeatedString(juce::String(juce::CharPointer_UTF8("\xc3\xa9")), 300);
            args.set(0, ExprValue::fromString("%s"));
            args.set(1, ExprValue::fromString(longName));
            expectEquals(ExprStandardLibrary::format("%s", args, 1), longName);
        }

        beginTest("Collections");
        {
            check(h, "(count {:a 1 :b 2})", "2");
            check(h, "(conj [1 2] 3)", "[1 2 3]");
            check(h, "(assoc {:a 1} :b 2)", "{:a 1, :b 2}");
            check(h, "(get-in {:a {:b 7}} [:a :b])", "7");
            check(h, "(update {:n 1} :n inc)", "{:n 2}");
            check(h, "(merge {:a 1} {:b 2} {:a 3})", "{:a 3, :b 2}");
            check(h, "(filter even? (range 6))", "(0 2 4)");
            check(h, "(reduce + 10 [1 2 3])", "16");
            check(h, "(apply + 1 [2 3])", "6");
            check(h, "(first nil)", "nil");
            check(h, "(:b {:a 1 :b 2})", "2");
            check(h, "({:a 1} :a)", "1");
            check(h, "([10 20 30] 1)", "20");
            check(h, "(into [] '(1 2))", "[1 2]");
            check(h, "((comp inc inc) 1)", "3");
            check(h, "((partial + 10) 5)", "15");
        }

        beginTest("Definitions");
        {
            expect(h.load("(defn triple [n] (* 3 n)) (def answer 42)"), h.lastError);
            check(h, "(triple answer)", "126");
            expect(h.load("(defmacro unless [c & body] `(if ~c nil (do ~@body)))"), h.lastError);
            check(h, "(unless false :ran)", ":ran");
            check(h, "(unless true :ran)", "nil");
            check(h, "(macroexpand '(unless x y))", "(if x nil (do y))");
        }

        beginTest("Definition names");
        {
            expect(h.load("(def named (fn [] 1)) (def alias named)"), h.lastError);
            check(h, "named", "#function[named]");
            check(h, "alias", "#function[named]");

            // a function reached through another value keeps its own name
            expect(h.load("(def handlers [(fn [] 2)]) (def picked (first handlers))"), h.lastError);
            check(h, "picked", "#function[fn]");
            check(h, "(first handlers)", "#function[fn]");
            check(h, "(picked)", "2");
            expect(h.load("(def maker (fn [] (fn [] :made))) (def made (maker))"), h.lastError);
            check(h, "made", "#function[fn]");
            check(h, "(defn triple-again [n] (* 3 n))", "#'triple-again");
            check(h, "triple-again", "#function[triple-again]");
        }

        beginTest("Unresolved symbols");
        {
            checkError(h, "(no-such-function 1)", "Unable to resolve symbol: no-such-function");
            checkError(h, "(if false undefined-thing 1)", "Unable to resolve symbol: undefined-thing");
        }

        beginTest("Recur placement");
        {
            checkError(h, "(do (recur 1) 2)", "Can only recur from tail position");
            checkError(h, "(loop [i 0] (+ 1 (recur i)))", "Can only recur from tail position");
        }
    }
};

static EvaluatorTest evaluatorTest;
