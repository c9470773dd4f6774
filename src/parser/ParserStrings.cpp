/***
 * Name: pytgen::parse::Parser (string literals)
 * Purpose: Decode string/bytes tokens, concatenate adjacent literals and
 *   parse f-string replacement fields.
 * Theory of Operation:
 *   Escapes follow Python: \N{NAME} is resolved through ICU character names,
 *   unknown escapes keep their backslash. F-string fields are cut out of the
 *   literal body and parsed by a nested Lexer/Parser pair.
 */
#include "parser/Parser.h"
#include "parser/ParserSupport.h"
#include "pytgen/exceptions/parse_error.h"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <cctype>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace pytgen::parse {

using TK = lex::TokenKind;
using detail::failAt;
using detail::makeAt;

namespace {

struct StringParts {
  bool raw{false};
  bool bytes{false};
  bool fstring{false};
  std::string body; // text between the quotes
};

StringParts splitStringToken(const std::string& text) {
  StringParts parts;
  size_t q = 0;
  while (q < text.size() && text[q] != '\'' && text[q] != '"') {
    const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(text[q])));
    if (c == 'r') parts.raw = true;
    if (c == 'b') parts.bytes = true;
    if (c == 'f') parts.fstring = true;
    ++q;
  }
  if (q >= text.size()) return parts;
  const char quote = text[q];
  const bool triple = text.size() >= q + 6 && text[q + 1] == quote && text[q + 2] == quote;
  const size_t qlen = triple ? 3 : 1;
  if (text.size() >= q + 2 * qlen) parts.body = text.substr(q + qlen, text.size() - q - 2 * qlen);
  return parts;
}

void appendUtf8(std::string& out, const UChar32 cp) {
  uint8_t buf[U8_MAX_LENGTH];
  int32_t len = 0;
  U8_APPEND_UNSAFE(buf, len, cp);
  out.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(len));
}

int hexValue(const char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool readHex(const std::string& s, size_t at, const int digits, uint32_t& value) {
  if (at + static_cast<size_t>(digits) > s.size()) return false;
  value = 0;
  for (int k = 0; k < digits; ++k) {
    const int h = hexValue(s[at + static_cast<size_t>(k)]);
    if (h < 0) return false;
    value = value * 16 + static_cast<uint32_t>(h);
  }
  return true;
}

UChar32 lookupCharName(const std::string& name) {
  UErrorCode status = U_ZERO_ERROR;
  UChar32 cp = u_charFromName(U_UNICODE_CHAR_NAME, name.c_str(), &status);
  if (U_SUCCESS(status)) return cp;
  status = U_ZERO_ERROR;
  cp = u_charFromName(U_CHAR_NAME_ALIAS, name.c_str(), &status);
  return U_SUCCESS(status) ? cp : -1;
}

std::unique_ptr<ast::Expr> parseFieldExpr(const lex::Token& tok, const std::string& expr) {
  lex::Lexer lexer;
  lexer.pushString("(" + expr + ")", tok.file);
  Parser sub(lexer);
  try {
    return sub.parseStandaloneExpr();
  } catch (const exceptions::ParseError& e) {
    failAt(tok, "f-string: " + e.detail());
  }
}

void scanFStringText(const lex::Token& tok, const std::string& body, size_t& i, bool inSpec,
                     std::vector<std::unique_ptr<ast::Expr>>& out);

// i points just past '{'; leaves i past the matching '}'.
void scanFStringField(const lex::Token& tok, const std::string& body, size_t& i,
                      std::vector<std::unique_ptr<ast::Expr>>& out) {
  const size_t start = i;
  int depth = 0;
  while (i < body.size()) {
    const char c = body[i];
    if (c == '\'' || c == '"') {
      const bool triple = i + 2 < body.size() && body[i + 1] == c && body[i + 2] == c;
      const std::string closer(triple ? 3 : 1, c);
      const size_t end = body.find(closer, i + closer.size());
      if (end == std::string::npos) failAt(tok, "f-string: unterminated string");
      i = end + closer.size();
      continue;
    }
    if (c == '(' || c == '[' || c == '{') {
      ++depth;
    } else if (c == ')' || c == ']' || c == '}') {
      if (depth == 0) {
        if (c == '}') break;
        failAt(tok, std::string("f-string: unmatched '") + c + "'");
      }
      --depth;
    } else if (depth == 0 && c == '!' && !(i + 1 < body.size() && body[i + 1] == '=')) {
      break;
    } else if (depth == 0 && c == ':') {
      break;
    } else if (c == '#') {
      failAt(tok, "f-string expression part cannot include '#'");
    }
    ++i;
  }
  if (i >= body.size()) failAt(tok, "f-string: expecting '}'");

  std::string expr = body.substr(start, i - start);
  size_t last = expr.find_last_not_of(" \t\r\n");
  // self-documenting 'expr=' keeps only the expression
  if (last != std::string::npos && expr[last] == '=' && last > 0 &&
      std::string("=!<>").find(expr[last - 1]) == std::string::npos) {
    expr.erase(last);
    last = expr.find_last_not_of(" \t\r\n");
  }
  if (last == std::string::npos) {
    failAt(tok, std::string("f-string: valid expression required before '") + body[i] + "'");
  }
  out.push_back(parseFieldExpr(tok, expr));

  if (body[i] == '!') {
    ++i;
    if (i >= body.size() || (body[i] != 's' && body[i] != 'r' && body[i] != 'a')) {
      failAt(tok, "f-string: invalid conversion character");
    }
    ++i;
  }
  if (i < body.size() && body[i] == ':') {
    ++i;
    scanFStringText(tok, body, i, true, out);
  }
  if (i >= body.size() || body[i] != '}') failAt(tok, "f-string: expecting '}'");
  ++i;
}

// Literal text and fields; inside a format spec stops at the closing '}'.
void scanFStringText(const lex::Token& tok, const std::string& body, size_t& i, const bool inSpec,
                     std::vector<std::unique_ptr<ast::Expr>>& out) {
  while (i < body.size()) {
    const char c = body[i];
    if (c == '{') {
      if (!inSpec && i + 1 < body.size() && body[i + 1] == '{') { i += 2; continue; }
      ++i;
      scanFStringField(tok, body, i, out);
      continue;
    }
    if (c == '}') {
      if (inSpec) return;
      if (i + 1 < body.size() && body[i + 1] == '}') { i += 2; continue; }
      failAt(tok, "f-string: single '}' is not allowed");
    }
    ++i;
  }
  if (inSpec) failAt(tok, "f-string: expecting '}'");
}

} // namespace

std::string Parser::decodeStringToken(const lex::Token& tok, bool& isBytes, bool& isFString) {
  const StringParts parts = splitStringToken(tok.text);
  isBytes = parts.bytes;
  isFString = parts.fstring;
  if (parts.fstring) return {};
  const std::string& body = parts.body;
  std::string out;
  out.reserve(body.size());
  for (size_t i = 0; i < body.size(); ++i) {
    const char c = body[i];
    if (c == '\r') {
      out += '\n';
      if (i + 1 < body.size() && body[i + 1] == '\n') ++i;
      continue;
    }
    if (parts.bytes && static_cast<unsigned char>(c) >= 0x80) {
      failAt(tok, "bytes can only contain ASCII literal characters");
    }
    if (c != '\\' || parts.raw || i + 1 >= body.size()) {
      out += c;
      continue;
    }
    const char e = body[++i];
    switch (e) {
      case '\n': break;
      case '\r': if (i + 1 < body.size() && body[i + 1] == '\n') ++i; break;
      case '\\': out += '\\'; break;
      case '\'': out += '\''; break;
      case '"': out += '"'; break;
      case 'a': out += '\a'; break;
      case 'b': out += '\b'; break;
      case 'f': out += '\f'; break;
      case 'n': out += '\n'; break;
      case 'r': out += '\r'; break;
      case 't': out += '\t'; break;
      case 'v': out += '\v'; break;
      case '0': case '1': case '2': case '3': case '4': case '5': case '6': case '7': {
        uint32_t value = static_cast<uint32_t>(e - '0');
        for (int k = 0; k < 2 && i + 1 < body.size() && body[i + 1] >= '0' && body[i + 1] <= '7'; ++k) {
          value = value * 8 + static_cast<uint32_t>(body[++i] - '0');
        }
        if (parts.bytes) out += static_cast<char>(value & 0xFFu);
        else appendUtf8(out, static_cast<UChar32>(value));
        break;
      }
      case 'x': {
        uint32_t value = 0;
        if (!readHex(body, i + 1, 2, value)) failAt(tok, "truncated \\xXX escape");
        i += 2;
        if (parts.bytes) out += static_cast<char>(value);
        else appendUtf8(out, static_cast<UChar32>(value));
        break;
      }
      case 'u':
      case 'U': {
        if (parts.bytes) { out += '\\'; out += e; break; }
        const int digits = e == 'u' ? 4 : 8;
        uint32_t value = 0;
        if (!readHex(body, i + 1, digits, value)) {
          failAt(tok, e == 'u' ? "truncated \\uXXXX escape" : "truncated \\UXXXXXXXX escape");
        }
        if (value > 0x10FFFFu) failAt(tok, "illegal Unicode character");
        i += static_cast<size_t>(digits);
        appendUtf8(out, static_cast<UChar32>(value));
        break;
      }
      case 'N': {
        if (parts.bytes) { out += "\\N"; break; }
        const size_t close = body.find('}', i + 1);
        if (i + 1 >= body.size() || body[i + 1] != '{' || close == std::string::npos || close == i + 2) {
          failAt(tok, "malformed \\N character escape");
        }
        const UChar32 cp = lookupCharName(body.substr(i + 2, close - i - 2));
        if (cp < 0) failAt(tok, "unknown Unicode character name");
        appendUtf8(out, cp);
        i = close;
        break;
      }
      default:
        out += '\\';
        out += e;
        break;
    }
  }
  return out;
}

void Parser::parseFStringFields(const lex::Token& tok, ExprList& out) {
  const StringParts parts = splitStringToken(tok.text);
  size_t i = 0;
  scanFStringText(tok, parts.body, i, false, out);
}

std::unique_ptr<ast::Expr> Parser::parseStringAtom(const lex::Token& first) {
  std::string decoded;
  std::string source;
  ExprList fields;
  bool anyBytes = false;
  bool anyText = false;
  bool anyFString = false;
  while (peek().kind == TK::String || peek().kind == TK::Bytes) {
    const lex::Token tok = get();
    bool isBytes = false;
    bool isFString = false;
    decoded += decodeStringToken(tok, isBytes, isFString);
    if (isBytes) anyBytes = true; else anyText = true;
    if (anyBytes && anyText) failAt(tok, "cannot mix bytes and nonbytes literals");
    if (isFString) {
      anyFString = true;
      parseFStringFields(tok, fields);
    }
    if (!source.empty()) source += ' ';
    source += tok.text;
  }
  if (anyFString) {
    auto fs = makeAt<ast::FStringLiteral>(first);
    fs->text = std::move(source);
    fs->values = std::move(fields);
    finish(*fs);
    return fs;
  }
  if (anyBytes) {
    auto b = makeAt<ast::BytesLiteral>(first, std::move(decoded));
    finish(*b);
    return b;
  }
  auto s = makeAt<ast::StringLiteral>(first, std::move(decoded));
  finish(*s);
  return s;
}

} // namespace pytgen::parse
