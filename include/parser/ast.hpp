//! # Abstract Syntax Tree
//!
//! Umbrella header for the Rust AST and the `SourceFile` that owns a parsed
//! file together with its source text and token vector.
//!
//! Nodes refer to tokens by index, and tokens refer to the source text by
//! `std::string_view`, so the three are kept together and the `Source` is
//! heap-allocated to keep its buffer stable when the file is moved.

#ifndef SEMDIFF_PARSER_AST_HPP
#define SEMDIFF_PARSER_AST_HPP

#include "lexer/source.hpp"
#include "parser/ast_common.hpp"
#include "parser/ast_decls.hpp"
#include "parser/ast_exprs.hpp"
#include "parser/ast_stmts.hpp"

namespace semdiff::parser {

/// A parsed Rust source file.
struct SourceFile {
    Box<lexer::Source> source;
    std::vector<lexer::Token> tokens; ///< Ends with `Eof`
    std::vector<Attribute> inner_attrs;
    std::vector<ItemPtr> items;
};

} // namespace semdiff::parser

#endif // SEMDIFF_PARSER_AST_HPP
