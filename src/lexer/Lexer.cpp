/***
 * Name: pytgen::lex::Lexer
 * Purpose: Tokenize in-memory Python source(s) into a single token stream (LIFO inputs).
 */
#include "lexer/Lexer.h"
#include "pytgen/exceptions/parse_error.h"

#include <unicode/uchar.h>
#include <unicode/unorm2.h>
#include <unicode/ustring.h>
#include <unicode/utf8.h>

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace pytgen::lex {

static bool isIdentStart(char chr) { return (std::isalpha(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
static bool isIdentChar(char chr) { return (std::isalnum(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
static bool isNonAscii(char chr) { return (static_cast<unsigned char>(chr) & 0x80U) != 0; }

// Decode one code point at idx; returns the code point (negative on malformed UTF-8) and advances idx.
static UChar32 decodeAt(const std::string& text, size_t& idx) {
  auto i = static_cast<int32_t>(idx);
  UChar32 cp = 0;
  U8_NEXT(reinterpret_cast<const uint8_t*>(text.data()), i, static_cast<int32_t>(text.size()), cp);
  idx = static_cast<size_t>(i);
  return cp;
}

// NFKC-normalize an identifier (PEP 3131); the input is valid UTF-8 at this point.
static bool nfkcNormalize(const std::string& in, std::string& out) {
  UErrorCode status = U_ZERO_ERROR;
  const UNormalizer2* norm = unorm2_getNFKCInstance(&status);
  if (U_FAILURE(status)) { return false; }
  const auto nb = static_cast<int32_t>(in.size());
  int32_t uLen = 0; u_strFromUTF8(nullptr, 0, &uLen, in.data(), nb, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return false; }
  status = U_ZERO_ERROR; std::vector<UChar> ustr(static_cast<size_t>(uLen) + 1);
  u_strFromUTF8(ustr.data(), uLen + 1, nullptr, in.data(), nb, &status);
  if (U_FAILURE(status)) { return false; }
  int32_t nLen = unorm2_normalize(norm, ustr.data(), uLen, nullptr, 0, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return false; }
  status = U_ZERO_ERROR; std::vector<UChar> normBuf(static_cast<size_t>(nLen) + 1);
  unorm2_normalize(norm, ustr.data(), uLen, normBuf.data(), nLen + 1, &status);
  if (U_FAILURE(status)) { return false; }
  int32_t outLen = 0; u_strToUTF8(nullptr, 0, &outLen, normBuf.data(), nLen, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return false; }
  status = U_ZERO_ERROR; std::vector<char> buf(static_cast<size_t>(outLen) + 1);
  u_strToUTF8(buf.data(), outLen + 1, nullptr, normBuf.data(), nLen, &status);
  if (U_FAILURE(status)) { return false; }
  out.assign(buf.data(), static_cast<size_t>(outLen));
  return true;
}

static bool isStringPrefix(const std::string& ident) {
  if (ident.empty() || ident.size() > 2) { return false; }
  std::string lower;
  for (const char c : ident) { lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c)))); }
  return lower == "r" || lower == "u" || lower == "b" || lower == "f" || lower == "br" || lower == "rb" ||
         lower == "fr" || lower == "rf";
}

static TokenKind keywordKind(const std::string& ident) {
  if (ident == "def") { return TokenKind::Def; }
  if (ident == "return") { return TokenKind::Return; }
  if (ident == "del") { return TokenKind::Del; }
  if (ident == "if") { return TokenKind::If; }
  if (ident == "else") { return TokenKind::Else; }
  if (ident == "elif") { return TokenKind::Elif; }
  if (ident == "while") { return TokenKind::While; }
  if (ident == "for") { return TokenKind::For; }
  if (ident == "in") { return TokenKind::In; }
  if (ident == "break") { return TokenKind::Break; }
  if (ident == "continue") { return TokenKind::Continue; }
  if (ident == "pass") { return TokenKind::Pass; }
  if (ident == "try") { return TokenKind::Try; }
  if (ident == "except") { return TokenKind::Except; }
  if (ident == "finally") { return TokenKind::Finally; }
  if (ident == "with") { return TokenKind::With; }
  if (ident == "as") { return TokenKind::As; }
  if (ident == "import") { return TokenKind::Import; }
  if (ident == "from") { return TokenKind::From; }
  if (ident == "class") { return TokenKind::Class; }
  if (ident == "async") { return TokenKind::Async; }
  if (ident == "assert") { return TokenKind::Assert; }
  if (ident == "raise") { return TokenKind::Raise; }
  if (ident == "global") { return TokenKind::Global; }
  if (ident == "nonlocal") { return TokenKind::Nonlocal; }
  if (ident == "yield") { return TokenKind::Yield; }
  if (ident == "await") { return TokenKind::Await; }
  if (ident == "and") { return TokenKind::And; }
  if (ident == "or") { return TokenKind::Or; }
  if (ident == "not") { return TokenKind::Not; }
  if (ident == "lambda") { return TokenKind::Lambda; }
  if (ident == "is") { return TokenKind::Is; }
  if (ident == "True" || ident == "False") { return TokenKind::BoolLit; }
  if (ident == "None") { return TokenKind::NoneLit; }
  return TokenKind::Ident;
}

void Lexer::pushString(const std::string& text, const std::string& name) {
  stack_.push_back(Source{text, name});
}

void Lexer::fail(const State& state, size_t at, const std::string& msg) const {
  throw exceptions::ParseError(state.name, state.lineNo, static_cast<int>(at - state.lineStart + 1), msg);
}

Token Lexer::makeToken(const State& state, TokenKind kind, size_t start, size_t endExclusive) const {
  Token tok;
  tok.kind = kind;
  tok.text = state.text->substr(start, endExclusive - start);
  tok.file = state.name;
  tok.line = state.lineNo;
  tok.endLine = state.lineNo;
  tok.col = static_cast<int>(start - state.lineStart + 1);
  return tok;
}

// Measure indentation of the physical line at state.index. Blank and comment-only lines are consumed entirely.
bool Lexer::skipBlankLine(State& state, size_t& width) {
  const std::string& text = *state.text;
  size_t& idx = state.index;
  width = 0;
  while (idx < text.size()) {
    const char c = text[idx];
    if (c == ' ') { ++width; }
    else if (c == '\t') { width = (width / 8 + 1) * 8; }
    else if (c == '\f') { width = 0; }
    else { break; }
    ++idx;
  }
  if (idx >= text.size()) { return true; }
  if (text[idx] == '#') {
    while (idx < text.size() && text[idx] != '\n' && text[idx] != '\r') { ++idx; }
  }
  if (idx >= text.size()) { return true; }
  if (text[idx] == '\n' || text[idx] == '\r') {
    if (text[idx] == '\r' && idx + 1 < text.size() && text[idx + 1] == '\n') { ++idx; }
    ++idx;
    ++state.lineNo;
    state.lineStart = idx;
    return true;
  }
  return false;
}

void Lexer::emitIndentTokens(State& state, size_t width) {
  auto indentTok = [&](TokenKind kind, const char* text) {
    Token tok; tok.kind = kind; tok.text = text; tok.file = state.name; tok.line = state.lineNo; tok.endLine = state.lineNo;
    tok.col = static_cast<int>(state.index - state.lineStart + 1);
    tokens_.push_back(std::move(tok));
  };
  if (width > state.indentStack.back()) {
    state.indentStack.push_back(width);
    indentTok(TokenKind::Indent, "<INDENT>");
    return;
  }
  while (width < state.indentStack.back()) {
    state.indentStack.pop_back();
    indentTok(TokenKind::Dedent, "<DEDENT>");
  }
  if (width != state.indentStack.back()) {
    fail(state, state.index, "unindent does not match any outer indentation level");
  }
}

void Lexer::trackBracket(State& state, const Token& tok) {
  switch (tok.kind) {
    case TokenKind::LParen: case TokenKind::LBracket: case TokenKind::LBrace:
      state.openBrackets.push_back(tok);
      return;
    case TokenKind::RParen: case TokenKind::RBracket: case TokenKind::RBrace: {
      if (state.openBrackets.empty()) {
        throw exceptions::ParseError(tok.file, tok.line, tok.col, "unmatched '" + tok.text + "'");
      }
      const Token& open = state.openBrackets.back();
      const bool ok = (open.kind == TokenKind::LParen && tok.kind == TokenKind::RParen) ||
                      (open.kind == TokenKind::LBracket && tok.kind == TokenKind::RBracket) ||
                      (open.kind == TokenKind::LBrace && tok.kind == TokenKind::RBrace);
      if (!ok) {
        std::string msg = "closing parenthesis '" + tok.text + "' does not match opening parenthesis '" + open.text + "'";
        if (open.line != tok.line) { msg += " on line " + std::to_string(open.line); }
        throw exceptions::ParseError(tok.file, tok.line, tok.col, msg);
      }
      state.openBrackets.pop_back();
      return;
    }
    default:
      return;
  }
}

// Scan a string literal. start is the first prefix char (or the quote), quotePos the opening quote.
// NOLINTNEXTLINE(readability-function-cognitive-complexity)
Token Lexer::scanString(State& state, size_t start, size_t quotePos, bool isBytes) {
  const std::string& text = *state.text;
  const int startLine = state.lineNo;
  const int startCol = static_cast<int>(start - state.lineStart + 1);
  const char quote = text[quotePos];
  const bool triple = quotePos + 2 < text.size() && text[quotePos + 1] == quote && text[quotePos + 2] == quote;
  size_t idx = quotePos + (triple ? 3 : 1);

  auto newlineAt = [&](size_t& p) {
    if (text[p] == '\r' && p + 1 < text.size() && text[p + 1] == '\n') { ++p; }
    ++p;
    ++state.lineNo;
    state.lineStart = p;
  };
  auto unterminated = [&]() {
    const std::string what = triple ? "unterminated triple-quoted string literal" : "unterminated string literal";
    throw exceptions::ParseError(state.name, startLine, startCol,
                                 what + " (detected at line " + std::to_string(state.lineNo) + ")");
  };

  while (true) {
    if (idx >= text.size()) { unterminated(); }
    const char c = text[idx];
    if (c == '\\') {
      if (idx + 1 >= text.size()) { unterminated(); }
      ++idx;
      if (text[idx] == '\n' || text[idx] == '\r') { newlineAt(idx); } else { ++idx; }
      continue;
    }
    if (c == '\n' || c == '\r') {
      if (!triple) { unterminated(); }
      newlineAt(idx);
      continue;
    }
    if (c == quote) {
      if (!triple) { ++idx; break; }
      if (idx + 2 < text.size() && text[idx + 1] == quote && text[idx + 2] == quote) { idx += 3; break; }
    }
    ++idx;
  }

  Token tok;
  tok.kind = isBytes ? TokenKind::Bytes : TokenKind::String;
  tok.text = text.substr(start, idx - start);
  tok.file = state.name;
  tok.line = startLine;
  tok.col = startCol;
  tok.endLine = state.lineNo;
  state.index = idx;
  return tok;
}

Token Lexer::scanIdentifier(State& state) {
  const std::string& text = *state.text;
  const size_t start = state.index;
  size_t idx = start;
  bool ascii = true;
  bool first = true;
  while (idx < text.size()) {
    const char c = text[idx];
    if (!isNonAscii(c)) {
      if (first ? !isIdentStart(c) : !isIdentChar(c)) { break; }
      ++idx; first = false;
      continue;
    }
    size_t nextIdx = idx;
    const UChar32 cp = decodeAt(text, nextIdx);
    if (cp < 0) { fail(state, idx, "invalid UTF-8 sequence in source"); }
    const bool ok = first ? (u_hasBinaryProperty(cp, UCHAR_XID_START) != 0)
                          : (u_hasBinaryProperty(cp, UCHAR_XID_CONTINUE) != 0);
    if (!ok) {
      if (first) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(cp));
        fail(state, idx, "invalid character '" + text.substr(idx, nextIdx - idx) + "' (" + buf + ")");
      }
      break;
    }
    ascii = false; first = false;
    idx = nextIdx;
  }
  std::string ident = text.substr(start, idx - start);
  if (idx < text.size() && (text[idx] == '\'' || text[idx] == '"') && isStringPrefix(ident)) {
    const bool isBytes = ident.find_first_of("bB") != std::string::npos;
    return scanString(state, start, idx, isBytes);
  }
  Token tok = makeToken(state, TokenKind::Ident, start, idx);
  if (!ascii) {
    std::string normalized;
    if (!nfkcNormalize(ident, normalized)) { fail(state, start, "cannot normalize identifier '" + ident + "'"); }
    tok.text = normalized;
  }
  tok.kind = keywordKind(tok.text);
  state.index = idx;
  return tok;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanOne(State& state) {
  const std::string& line = *state.text;
  size_t& idx = state.index;
  auto makeTok = [&](TokenKind kind, size_t start, size_t endExclusive) {
    return makeToken(state, kind, start, endExclusive);
  };
  auto nextIs = [&](size_t off, char c) { return idx + off < line.size() && line[idx + off] == c; };

  const char chr = line[idx];
  if (chr == '(') { ++idx; return makeTok(TokenKind::LParen, idx-1, idx); }
  if (chr == ')') { ++idx; return makeTok(TokenKind::RParen, idx-1, idx); }
  if (chr == '[') { ++idx; return makeTok(TokenKind::LBracket, idx-1, idx); }
  if (chr == ']') { ++idx; return makeTok(TokenKind::RBracket, idx-1, idx); }
  if (chr == '{') { ++idx; return makeTok(TokenKind::LBrace, idx-1, idx); }
  if (chr == '}') { ++idx; return makeTok(TokenKind::RBrace, idx-1, idx); }
  if (chr == ':') {
    if (nextIs(1, '=')) { idx += 2; return makeTok(TokenKind::ColonEqual, idx-2, idx); }
    ++idx; return makeTok(TokenKind::Colon, idx-1, idx);
  }
  if (chr == ';') { ++idx; return makeTok(TokenKind::Semicolon, idx-1, idx); }
  if (chr == ',') { ++idx; return makeTok(TokenKind::Comma, idx-1, idx); }
  if (chr == '@') {
    if (nextIs(1, '=')) { idx += 2; return makeTok(TokenKind::AtEqual, idx-2, idx); }
    ++idx; return makeTok(TokenKind::At, idx-1, idx);
  }
  if (chr == '+') {
    if (nextIs(1, '=')) { idx += 2; return makeTok(TokenKind::PlusEqual, idx-2, idx); }
    ++idx; return makeTok(TokenKind::Plus, idx-1, idx);
  }
  if (chr == '"' || chr == '\'') { return scanString(state, idx, idx, /*isBytes=*/false); }
  if (chr == '-') {
    if (nextIs(1, '>')) { idx += 2; return makeTok(TokenKind::Arrow, idx-2, idx); }
    if (nextIs(1, '=')) { idx += 2; return makeTok(TokenKind::MinusEqual, idx-2, idx); }
    ++idx; return makeTok(TokenKind::Minus, idx-1, idx);
  }
  if (chr == '*') {
    if (nextIs(1, '*')) {
      if (nextIs(2, '=')) { idx += 3; return makeTok(TokenKind::StarStarEqual, idx-3, idx); }
      idx += 2; return makeTok(TokenKind::StarStar, idx-2, idx);
    }
    if (nextIs(1, '=')) { idx += 2; return makeTok(TokenKind::StarEqual, idx-2, idx); }
    ++idx; return makeTok(TokenKind::Star, idx-1, idx);
  }
  if (chr == '/') {
    if (nextIs(1, '/')) {
      if (nextIs(2, '=')) { idx += 3; return makeTok(TokenKind::SlashSlashEqual, idx-3, idx); }
      idx += 2; return makeTok(TokenKind::SlashSlash, idx-2, idx);
    }
    if (nextIs(1, '=')) { idx += 2; return makeTok(TokenKind::SlashEqual, idx-2, idx); }
    ++idx; return makeTok(TokenKind::Slash, idx-1, idx);
  }
  if (chr == '%') { if (nextIs(1, '=')) { idx += 2; return makeTok(TokenKind::PercentEqual, idx-2, idx); } ++idx; return makeTok(TokenKind::Percent, idx-1, idx); }
  if (chr == '=') { if (nextIs(1, '=')) { idx += 2; return makeTok(TokenKind::EqEq, idx-2, idx); } ++idx; return makeTok(TokenKind::Equal, idx-1, idx); }
  if (chr == '!') {
    if (nextIs(1, '=')) { idx += 2; return makeTok(TokenKind::NotEq, idx-2, idx); }
    fail(state, idx, "invalid syntax");
  }
  if (chr == '<') {
    if (nextIs(1, '<')) {
      if (nextIs(2, '=')) { idx += 3; return makeTok(TokenKind::LShiftEqual, idx-3, idx); }
      idx += 2; return makeTok(TokenKind::LShift, idx-2, idx);
    }
    if (nextIs(1, '=')) { idx += 2; return makeTok(TokenKind::Le, idx-2, idx); }
    ++idx; return makeTok(TokenKind::Lt, idx-1, idx);
  }
  if (chr == '>') {
    if (nextIs(1, '>')) {
      if (nextIs(2, '=')) { idx += 3; return makeTok(TokenKind::RShiftEqual, idx-3, idx); }
      idx += 2; return makeTok(TokenKind::RShift, idx-2, idx);
    }
    if (nextIs(1, '=')) { idx += 2; return makeTok(TokenKind::Ge, idx-2, idx); }
    ++idx; return makeTok(TokenKind::Gt, idx-1, idx);
  }
  if (chr == '|') { if (nextIs(1, '=')) { idx += 2; return makeTok(TokenKind::PipeEqual, idx-2, idx); } ++idx; return makeTok(TokenKind::Pipe, idx-1, idx); }
  if (chr == '&') { if (nextIs(1, '=')) { idx += 2; return makeTok(TokenKind::AmpEqual, idx-2, idx); } ++idx; return makeTok(TokenKind::Amp, idx-1, idx); }
  if (chr == '^') { if (nextIs(1, '=')) { idx += 2; return makeTok(TokenKind::CaretEqual, idx-2, idx); } ++idx; return makeTok(TokenKind::Caret, idx-1, idx); }
  if (chr == '~') { ++idx; return makeTok(TokenKind::Tilde, idx-1, idx); }

  auto scanExponent = [&](size_t pos) -> size_t {
    size_t i = pos;
    if (i < line.size() && (line[i] == 'e' || line[i] == 'E')) {
      ++i;
      if (i < line.size() && (line[i] == '+' || line[i] == '-')) { ++i; }
      const size_t startIdx = i;
      bool prevUnderscore = false; size_t digits = 0;
      while (i < line.size()) {
        const char d = line[i];
        if (std::isdigit(static_cast<unsigned char>(d)) != 0) { prevUnderscore = false; ++digits; ++i; continue; }
        if (d == '_' && digits > 0 && !prevUnderscore) { prevUnderscore = true; ++i; continue; }
        break;
      }
      if (prevUnderscore) { --i; }
      if (i == startIdx) { return pos; } // back out if no digits
      return i;
    }
    return pos;
  };
  auto isDecDigit = [](char c){ return std::isdigit(static_cast<unsigned char>(c)) != 0; };
  auto isHexDigit = [](char c){ return std::isxdigit(static_cast<unsigned char>(c)) != 0; };
  auto isBinDigit = [](char c){ return c=='0'||c=='1'; };
  auto isOctDigit = [](char c){ return c>='0'&&c<='7'; };
  // afterPrefix lets one '_' directly follow 0b/0o/0x.
  auto scanDigitsUnderscore = [&](size_t pos, auto isOk, bool afterPrefix = false) {
    size_t i = pos; bool have = afterPrefix; bool prevUnderscore = false;
    while (i < line.size()) {
      const char c = line[i];
      if (isOk(c)) { have = true; prevUnderscore = false; ++i; continue; }
      if (c == '_' && have && !prevUnderscore) { prevUnderscore = true; ++i; continue; }
      break;
    }
    if (prevUnderscore) { --i; } // trim trailing underscore
    return i;
  };
  auto finishNumber = [&](TokenKind kind, size_t from, size_t end) {
    if (end < line.size() && (line[end] == 'j' || line[end] == 'J')) { ++end; kind = TokenKind::Imag; }
    Token tok = makeTok(kind, from, end); idx = end; return tok;
  };
  if (isDecDigit(chr)) {
    const size_t i0 = idx;
    if (line[idx] == '0' && idx + 1 < line.size()) {
      const char p1 = line[idx+1];
      if (p1=='b'||p1=='B'||p1=='o'||p1=='O'||p1=='x'||p1=='X') {
        size_t p = idx + 2;
        if (p1=='b'||p1=='B') { p = scanDigitsUnderscore(p, isBinDigit, true); }
        else if (p1=='o'||p1=='O') { p = scanDigitsUnderscore(p, isOctDigit, true); }
        else { p = scanDigitsUnderscore(p, isHexDigit, true); }
        if (p == idx + 2) { fail(state, idx, "invalid numeric literal"); }
        Token tok = makeTok(TokenKind::Int, i0, p); idx = p; return tok;
      }
    }
    const size_t p = scanDigitsUnderscore(idx, isDecDigit);
    if (p < line.size() && line[p] == '.') {
      const size_t fracEnd = scanDigitsUnderscore(p + 1, isDecDigit);
      return finishNumber(TokenKind::Float, i0, scanExponent(fracEnd));
    }
    const size_t epos = scanExponent(p);
    if (epos != p) { return finishNumber(TokenKind::Float, i0, epos); }
    const bool imaginary = p < line.size() && (line[p] == 'j' || line[p] == 'J');
    if (!imaginary && line[i0] == '0' && line.find_first_of("123456789", i0) < p) {
      fail(state, i0, "leading zeros in decimal integer literals are not permitted; use an 0o prefix for octal integers");
    }
    return finishNumber(TokenKind::Int, i0, p);
  }
  if (chr == '.') {
    if (nextIs(1, '.') && nextIs(2, '.')) { idx += 3; return makeTok(TokenKind::Ellipsis, idx-3, idx); }
    if (idx + 1 < line.size() && isDecDigit(line[idx+1])) {
      const size_t mpos = scanDigitsUnderscore(idx + 1, isDecDigit);
      return finishNumber(TokenKind::Float, idx, scanExponent(mpos));
    }
    ++idx; return makeTok(TokenKind::Dot, idx-1, idx);
  }

  if (isIdentStart(chr) || isNonAscii(chr)) { return scanIdentifier(state); }

  char buf[16];
  std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(static_cast<unsigned char>(chr)));
  fail(state, idx, std::string("invalid character '") + chr + "' (" + buf + ")");
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void Lexer::tokenizeSource(State& state) {
  const std::string& text = *state.text;
  const size_t firstTok = tokens_.size();
  // UTF-8 byte order mark
  if (text.rfind("\xEF\xBB\xBF", 0) == 0) { state.index = 3; state.lineStart = 3; }

  while (true) {
    if (state.atLineStart && state.openBrackets.empty()) {
      size_t width = 0;
      if (skipBlankLine(state, width)) {
        if (state.index >= text.size()) { break; }
        continue;
      }
      emitIndentTokens(state, width);
      state.atLineStart = false;
    }
    if (state.index >= text.size()) { break; }
    const char c = text[state.index];
    if (c == ' ' || c == '\t' || c == '\f') { ++state.index; continue; }
    if (c == '#') {
      while (state.index < text.size() && text[state.index] != '\n' && text[state.index] != '\r') { ++state.index; }
      continue;
    }
    if (c == '\n' || c == '\r') {
      if (state.openBrackets.empty()) {
        Token nl = makeToken(state, TokenKind::Newline, state.index, state.index);
        nl.text = "\n";
        tokens_.push_back(std::move(nl));
        state.atLineStart = true;
      }
      if (c == '\r' && state.index + 1 < text.size() && text[state.index + 1] == '\n') { ++state.index; }
      ++state.index;
      ++state.lineNo;
      state.lineStart = state.index;
      continue;
    }
    if (c == '\\') {
      size_t p = state.index + 1;
      if (p < text.size() && text[p] == '\r') { ++p; }
      if (p < text.size() && text[p] == '\n') { ++p; }
      if (p == state.index + 1) {
        fail(state, state.index + 1, "unexpected character after line continuation character");
      }
      state.index = p;
      ++state.lineNo;
      state.lineStart = p;
      if (p >= text.size()) { fail(state, p, "unexpected EOF while parsing"); }
      continue;
    }
    Token tok = scanOne(state);
    trackBracket(state, tok);
    tokens_.push_back(std::move(tok));
  }

  if (!state.openBrackets.empty()) {
    const Token& open = state.openBrackets.back();
    throw exceptions::ParseError(open.file, open.line, open.col, "'" + open.text + "' was never closed");
  }
  if (tokens_.size() > firstTok && tokens_.back().kind != TokenKind::Newline) {
    Token nl = makeToken(state, TokenKind::Newline, state.index, state.index);
    nl.text = "\n";
    tokens_.push_back(std::move(nl));
  }
  while (state.indentStack.size() > 1) {
    state.indentStack.pop_back();
    Token ded; ded.kind = TokenKind::Dedent; ded.text = "<DEDENT>"; ded.file = state.name;
    ded.line = state.lineNo; ded.endLine = state.lineNo; ded.col = 1;
    tokens_.push_back(std::move(ded));
  }
}

void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  // Process stack in LIFO order
  std::string lastName;
  int lastLine = 1;
  while (!stack_.empty()) {
    const Source src = std::move(stack_.back());
    stack_.pop_back();
    State state;
    state.text = &src.text;
    state.name = src.name;
    tokenizeSource(state);
    lastName = src.name;
    lastLine = state.lineNo;
  }
  Token eof; eof.kind = TokenKind::End; eof.text = "<EOF>"; eof.file = lastName; eof.line = lastLine; eof.endLine = lastLine; eof.col = 1;
  tokens_.push_back(eof);
}

const Token& Lexer::peek(size_t lookahead) {
  if (!finalized_) { buildAll(); }
  if (pos_ + lookahead < tokens_.size()) {
    return tokens_[pos_ + lookahead];
  }
  return tokens_.back();
}

Token Lexer::next() {
  if (!finalized_) { buildAll(); }
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

std::vector<Token> Lexer::tokens() {
  if (!finalized_) { buildAll(); }
  return tokens_;
}

} // namespace pytgen::lex
