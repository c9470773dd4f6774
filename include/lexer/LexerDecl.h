/**
 * Name: pytgen::lex::Lexer
 * Purpose: Tokenize one or more in-memory sources (LIFO) into a single token stream.
 * Theory of Operation:
 *   Tokenization is eager: the first peek/next/tokens call scans every pushed
 *   source into a buffer. Physical lines are joined inside brackets and after a
 *   trailing backslash; blank and comment-only lines produce no tokens.
 *   Malformed input throws exceptions::ParseError.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "lexer/ITokenStream.h"

namespace pytgen::lex {

class Lexer : public ITokenStream {
public:
    Lexer() = default;

    void pushString(const std::string& text, const std::string& name);

    // ITokenStream
    const Token& peek(size_t lookahead = 0) override;

    Token next() override;

    std::vector<Token> tokens();

private:
    bool finalized_{false};
    std::vector<Token> tokens_{};
    size_t pos_{0};

    struct Source {
        std::string text;
        std::string name;
    };

    struct State {
        const std::string* text{nullptr};
        std::string name;
        size_t index{0};
        size_t lineStart{0};
        int lineNo{1};
        std::vector<size_t> indentStack{0};
        std::vector<Token> openBrackets{}; // unmatched (, [, {
        bool atLineStart{true};
    };

    std::vector<Source> stack_{}; // LIFO of inputs

    // helpers
    void tokenizeSource(State& state);
    bool skipBlankLine(State& state, size_t& width); // true if line had no tokens
    void emitIndentTokens(State& state, size_t width);
    Token scanOne(State& state); // scan a single token at state.index
    Token scanString(State& state, size_t start, size_t quotePos, bool isBytes);
    Token scanIdentifier(State& state);
    void trackBracket(State& state, const Token& tok);
    Token makeToken(const State& state, TokenKind kind, size_t start, size_t endExclusive) const;
    [[noreturn]] void fail(const State& state, size_t at, const std::string& msg) const;

    void buildAll(); // build tokens_ from all inputs (LIFO)
};

} // namespace pytgen::lex
