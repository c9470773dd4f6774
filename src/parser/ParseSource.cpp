#include "parser/ParseSource.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"

#include <memory>
#include <string>

namespace pytgen::parse {

std::unique_ptr<ast::Module> ParseSource(const std::string& text, const std::string& identifier) {
  lex::Lexer lexer;
  lexer.pushString(text, identifier);
  Parser parser(lexer);
  return parser.parseModule();
}

} // namespace pytgen::parse
