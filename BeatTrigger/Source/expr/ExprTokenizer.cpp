
#include <JuceHeader.h>

#include "ExprTokenizer.h"

void ExprTokenizer::setContent(juce::String s)
{
    chars.clear();
    for (auto p = s.getCharPointer() ; !p.isEmpty() ; )
      chars.add(p.getAndAdvance());
    position = 0;
    line = 1;
    column = 1;
}

juce::juce_wchar ExprTokenizer::peek(int offset)
{
    int index = position + offset;
    return (index < chars.size()) ? chars[index] : 0;
}

juce::juce_wchar ExprTokenizer::advance()
{
    juce::juce_wchar ch = 0;
    if (position < chars.size()) {
        ch = chars[position++];
        if (ch == '\n') {
            line++;
            column = 1;
        }
        else {
            column++;
        }
    }
    return ch;
}

/**
 * Commas are whitespace.
 */
void ExprTokenizer::skipWhitespace()
{
    while (position < chars.size()) {
        juce::juce_wchar ch = peek();
        if (ch == ';') {
            while (position < chars.size() && peek() != '\n')
              advance();
        }
        else if (juce::CharacterFunctions::isWhitespace(ch) || ch == ',') {
            advance();
        }
        else {
            break;
        }
    }
}

bool ExprTokenizer::hasNext()
{
    skipWhitespace();
    return position < chars.size();
}

bool ExprTokenizer::isDelimiter(juce::juce_wchar ch)
{
    return (ch == 0 ||
            juce::CharacterFunctions::isWhitespace(ch) ||
            ch == ',' || ch == ';' ||
            ch == '(' || ch == ')' ||
            ch == '[' || ch == ']' ||
            ch == '{' || ch == '}' ||
            ch == '"' || ch == '\'' ||
            ch == '`' || ch == '~' ||
            ch == '^' || ch == '@');
}

ExprToken ExprTokenizer::next()
{
    skipWhitespace();

    ExprToken token;
    token.line = line;
    token.column = column;

    if (position >= chars.size()) {
        token.type = ExprToken::End;
        return token;
    }

    juce::juce_wchar ch = advance();
    switch (ch) {
        case '(': case '[': case '{':
            token.type = ExprToken::Open;
            token.value = juce::String::charToString(ch);
            break;
        case ')': case ']': case '}':
            token.type = ExprToken::Close;
            token.value = juce::String::charToString(ch);
            break;
        case '"':
            readString(token);
            break;
        case '\\':
            readChar(token);
            break;
        case '\'':
            token.type = ExprToken::Quote;
            break;
        case '`':
            token.type = ExprToken::SyntaxQuote;
            break;
        case '~':
            if (peek() == '@') {
                advance();
                token.type = ExprToken::UnquoteSplicing;
            }
            else {
                token.type = ExprToken::Unquote;
            }
            break;
        case '@':
            token.type = ExprToken::Deref;
            break;
        case '^':
            token.type = ExprToken::Meta;
            break;
        case '#': {
            juce::juce_wchar dispatch = peek();
            if (dispatch == '_') {
                advance();
                token.type = ExprToken::Discard;
            }
            else if (dispatch == '(') {
                advance();
                token.type = ExprToken::Open;
                token.value = "#(";
            }
            else if (dispatch == '{') {
                token.type = ExprToken::Error;
                token.value = "Set literals are not supported";
            }
            else if (dispatch == '"') {
                token.type = ExprToken::Error;
                token.value = "Regular expression literals are not supported";
            }
            else if (dispatch == '\'') {
                // var quote, #'foo reads as foo
                advance();
                token.type = ExprToken::Quote;
                token.value = "var";
            }
            else {
                token.type = ExprToken::Error;
                token.value = "Unsupported reader dispatch #" + juce::String::charToString(dispatch);
            }
        }
            break;
        default:
            token.value = juce::String::charToString(ch);
            readAtom(token);
            break;
    }
    return token;
}

void ExprTokenizer::readString(ExprToken& token)
{
    token.type = ExprToken::String;
    juce::String s;
    bool closed = false;
    while (position < chars.size()) {
        juce::juce_wchar ch = advance();
        if (ch == '"') {
            closed = true;
            break;
        }
        else if (ch == '\\') {
            juce::juce_wchar esc = advance();
            switch (esc) {
                case 'n': s += "\n"; break;
                case 't': s += "\t"; break;
                case 'r': s += "\r"; break;
                case '"': s += "\""; break;
                case '\\': s += "\\"; break;
                case 0:
                    break;
                default:
                    token.type = ExprToken::Error;
                    token.value = "Unsupported escape character: \\" + juce::String::charToString(esc);
                    return;
            }
        }
        else {
            s += juce::String::charToString(ch);
        }
    }

    if (!closed) {
        token.type = ExprToken::Error;
        token.value = "Unexpected end of input while reading string";
    }
    else {
        token.value = s;
    }
}

/**
 * Character literals read as single character strings.
 */
void ExprTokenizer::readChar(ExprToken& token)
{
    token.type = ExprToken::Char;
    juce::String name;
    if (position < chars.size())
      name = juce::String::charToString(advance());
    while (!isDelimiter(peek()))
      name += juce::String::charToString(advance());

    if (name == "newline") token.value = "\n";
    else if (name == "space") token.value = " ";
    else if (name == "tab") token.value = "\t";
    else if (name == "return") token.value = "\r";
    else if (name.length() == 1) token.value = name;
    else {
        token.type = ExprToken::Error;
        token.value = "Unsupported character: \\" + name;
    }
}

/**
 * Symbols, keywords, and numbers.  The first character is already
 * in the token value.
 */
void ExprTokenizer::readAtom(ExprToken& token)
{
    while (!isDelimiter(peek()))
      token.value += juce::String::charToString(advance());

    juce::String text = token.value;
    juce::juce_wchar first = text[0];
    juce::juce_wchar second = (text.length() > 1) ? text[1] : 0;

    if (first == ':') {
        token.type = ExprToken::Keyword;
        // auto-resolved keywords have nowhere to resolve to
        token.value = text.trimCharactersAtStart(":");
        if (token.value.length() == 0) {
            token.type = ExprToken::Error;
            token.value = "Invalid token: " + text;
        }
    }
    else if (juce::CharacterFunctions::isDigit(first) ||
             ((first == '-' || first == '+') && juce::CharacterFunctions::isDigit(second))) {
        classifyNumber(token);
    }
    else {
        token.type = ExprToken::Symbol;
    }
}

void ExprTokenizer::classifyNumber(ExprToken& token)
{
    juce::String text = token.value;
    juce::String digits = text;
    bool negative = false;
    if (digits.startsWithChar('-') || digits.startsWithChar('+')) {
        negative = digits.startsWithChar('-');
        digits = digits.substring(1);
    }

    if (digits.containsChar('/')) {
        token.type = ExprToken::Error;
        token.value = "Ratios are not supported: " + text;
    }
    else if (digits.startsWithIgnoreCase("0x") && digits.length() > 2 &&
             digits.substring(2).containsOnly("0123456789abcdefABCDEF")) {
        token.type = ExprToken::Int;
        juce::int64 value = digits.substring(2).getHexValue64();
        token.value = juce::String(negative ? -value : value);
    }
    else if (digits.containsOnly("0123456789")) {
        token.type = ExprToken::Int;
        token.value = text.trimCharactersAtStart("+");
    }
    else if (digits.containsOnly("0123456789.eE-+") &&
             juce::CharacterFunctions::isDigit(digits[0])) {
        token.type = ExprToken::Float;
        token.value = text.trimCharactersAtStart("+");
    }
    else if (digits.endsWithChar('M') && digits.dropLastCharacters(1).containsOnly("0123456789.")) {
        token.type = ExprToken::Float;
        token.value = text.dropLastCharacters(1).trimCharactersAtStart("+");
    }
    else {
        token.type = ExprToken::Error;
        token.value = "Invalid number: " + text;
    }
}
