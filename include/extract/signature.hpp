//! # Signature Rendering
//!
//! Canonical text for declarations. The rendering depends only on the
//! token sequence, so reformatting or re-commenting a declaration never
//! changes its signature.
//!
//! ## Spacing
//!
//! Tokens are joined by one space, except:
//!
//! - no space after `(` `[` `&` `&&` `::` `#` `!` `<` `.` `$`
//! - no space before `)` `]` `,` `;` `.` `::` `?` `:` `<` `>`
//! - no space before `(`, `[` or `!` directly after a name, `>`, `)` or `]`
//!
//! A comma directly before a closing `)`, `]`, `}` or `>` is dropped and
//! `>>` is rendered as two `>`, so `Vec<Vec<u8>>` and `Vec<Vec<u8> >` agree.
//!
//! ```text
//! pub fn new ( cap : usize , ) -> Self     =>  pub fn new(cap: usize) -> Self
//! impl < T : Clone > Foo < T >             =>  impl<T: Clone> Foo<T>
//! ```

#ifndef SEMDIFF_EXTRACT_SIGNATURE_HPP
#define SEMDIFF_EXTRACT_SIGNATURE_HPP

#include "parser/ast.hpp"

#include <string>
#include <vector>

namespace semdiff::extract {

/// Renders `range` canonically, leaving out the tokens of `excluded`.
[[nodiscard]] auto render_canonical(const std::vector<lexer::Token>& tokens,
                                    parser::TokenRange range,
                                    const std::vector<parser::TokenRange>& excluded = {})
    -> std::string;

/// Ranges of the `#[doc ...]` attributes of an item.
[[nodiscard]] auto doc_attribute_ranges(const parser::Item& item)
    -> std::vector<parser::TokenRange>;

/// Signature of a function or method: everything before the body.
[[nodiscard]] auto function_signature(const parser::SourceFile& file, const parser::Item& item)
    -> std::string;

/// Signature of a struct, enum or type alias: the whole definition.
[[nodiscard]] auto type_signature(const parser::SourceFile& file, const parser::Item& item)
    -> std::string;

/// Signature of a trait: the header plus its associated types and consts.
[[nodiscard]] auto trait_signature(const parser::SourceFile& file, const parser::Item& item)
    -> std::string;

/// Owner name for the methods of an impl block.
///
/// Inherent impls use the last path segment of the self type (`Foo` for
/// `impl<T> a::Foo<T>`); trait impls use `<SelfType as Trait>` with both
/// parts rendered canonically.
[[nodiscard]] auto impl_owner(const parser::SourceFile& file, const parser::ImplDecl& impl)
    -> std::string;

} // namespace semdiff::extract

#endif // SEMDIFF_EXTRACT_SIGNATURE_HPP
