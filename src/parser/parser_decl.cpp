//! # Parser - Items
//!
//! Items are parsed far enough to find their names, their headers and
//! their members. Only function bodies are parsed into expressions; struct
//! and enum bodies, `use` trees and constant initializers are skipped.
//!
//! ## Item Forms
//!
//! ```text
//! item      = attr* vis? qualifier* item_kind
//! qualifier = 'default' | 'const' | 'async' | 'unsafe' | 'extern' STRING? | 'auto'
//! fn        = 'fn' NAME generics? '(' ... ')' ('->' type)? where? (block | ';')
//! adt       = ('struct' | 'enum' | 'union') NAME ... (';' | '{' ... '}')
//! trait     = 'trait' NAME generics? (':' bounds)? where? '{' item* '}'
//! impl      = 'impl' generics? '!'? type ('for' type)? where? '{' item* '}'
//! mod       = 'mod' NAME (';' | '{' item* '}')
//! ```

#include "parser/parser.hpp"

namespace semdiff::parser {

using lexer::TokenKind;

auto Parser::parse_file(std::vector<Attribute>& inner_attrs)
    -> Result<std::vector<ItemPtr>, ParseError> {
    auto attrs = parse_inner_attrs();
    if (is_err(attrs)) {
        return unwrap_err(attrs);
    }
    inner_attrs = std::move(unwrap(attrs));
    return parse_items_until(TokenKind::Eof);
}

auto Parser::parse_items_until(TokenKind end) -> Result<std::vector<ItemPtr>, ParseError> {
    std::vector<ItemPtr> items;
    while (!check(end)) {
        if (is_at_end()) {
            return error_here("expected '}'");
        }
        auto item = parse_item();
        if (is_err(item)) {
            return unwrap_err(item);
        }
        items.push_back(std::move(unwrap(item)));
    }
    return items;
}

// ============================================================================
// Attributes and Visibility
// ============================================================================

auto Parser::parse_attribute(bool inner) -> Result<Attribute, ParseError> {
    size_t start = pos_;
    advance(); // '#'
    if (inner) {
        advance(); // '!'
    }
    if (!check(TokenKind::LBracket)) {
        return error_here("expected '[' after '#'");
    }
    bool is_doc = check_at(1, TokenKind::Identifier) && peek_at(1).lexeme == "doc";
    auto body = skip_balanced();
    if (is_err(body)) {
        return unwrap_err(body);
    }
    return Attribute{.range = {start, pos_}, .inner = inner, .is_doc = is_doc};
}

auto Parser::parse_outer_attrs() -> Result<std::vector<Attribute>, ParseError> {
    std::vector<Attribute> attrs;
    while (check(TokenKind::Pound) && !check_at(1, TokenKind::Not)) {
        auto attr = parse_attribute(false);
        if (is_err(attr)) {
            return unwrap_err(attr);
        }
        attrs.push_back(unwrap(attr));
    }
    return attrs;
}

auto Parser::parse_inner_attrs() -> Result<std::vector<Attribute>, ParseError> {
    std::vector<Attribute> attrs;
    while (check(TokenKind::Pound) && check_at(1, TokenKind::Not) &&
           check_at(2, TokenKind::LBracket)) {
        auto attr = parse_attribute(true);
        if (is_err(attr)) {
            return unwrap_err(attr);
        }
        attrs.push_back(unwrap(attr));
    }
    return attrs;
}

auto Parser::parse_visibility() -> Result<TokenRange, ParseError> {
    size_t start = pos_;
    if (match(TokenKind::KwPub) && check(TokenKind::LParen)) {
        const auto& next = peek_at(1);
        if (next.is_one_of({TokenKind::KwCrate, TokenKind::KwSelfValue, TokenKind::KwSuper}) ||
            (next.is(TokenKind::Identifier) && next.lexeme == "in")) {
            auto r = skip_balanced();
            if (is_err(r)) {
                return unwrap_err(r);
            }
        }
    }
    return TokenRange{start, pos_};
}

void Parser::skip_item_qualifiers() {
    while (true) {
        const auto& next = peek_at(1);
        if (check_word("default") &&
            next.is_one_of({TokenKind::KwFn, TokenKind::KwUnsafe, TokenKind::KwAsync,
                            TokenKind::KwConst, TokenKind::KwType, TokenKind::KwImpl,
                            TokenKind::KwExtern})) {
            advance();
        } else if (check(TokenKind::KwConst) &&
                   next.is_one_of({TokenKind::KwFn, TokenKind::KwUnsafe, TokenKind::KwAsync,
                                   TokenKind::KwExtern})) {
            advance();
        } else if (check(TokenKind::KwAsync) &&
                   next.is_one_of({TokenKind::KwFn, TokenKind::KwUnsafe, TokenKind::KwExtern})) {
            advance();
        } else if (check(TokenKind::KwUnsafe) &&
                   next.is_one_of({TokenKind::KwFn, TokenKind::KwImpl, TokenKind::KwTrait,
                                   TokenKind::KwExtern, TokenKind::KwMod})) {
            advance();
        } else if (check(TokenKind::KwExtern) && next.is(TokenKind::KwFn)) {
            advance();
        } else if (check(TokenKind::KwExtern) && next.is(TokenKind::StringLiteral) &&
                   check_at(2, TokenKind::KwFn)) {
            advance();
            advance();
        } else if (check_word("auto") && next.is(TokenKind::KwTrait)) {
            advance();
        } else {
            return;
        }
    }
}

auto Parser::expect_name() -> Result<std::string, ParseError> {
    if (!check(TokenKind::Identifier)) {
        return error_here("expected identifier");
    }
    return std::string(advance().text());
}

auto Parser::is_item_start() const -> bool {
    const auto& next = peek_at(1);
    switch (peek().kind) {
    case TokenKind::KwFn:
    case TokenKind::KwStruct:
    case TokenKind::KwEnum:
    case TokenKind::KwTrait:
    case TokenKind::KwImpl:
    case TokenKind::KwMod:
    case TokenKind::KwUse:
    case TokenKind::KwType:
    case TokenKind::KwExtern:
    case TokenKind::KwPub:
        return true;
    case TokenKind::KwStatic:
        return !next.is_one_of({TokenKind::Or, TokenKind::OrOr, TokenKind::KwMove});
    case TokenKind::KwConst:
    case TokenKind::KwUnsafe:
        return !next.is(TokenKind::LBrace);
    case TokenKind::KwAsync:
        return next.is_one_of({TokenKind::KwFn, TokenKind::KwUnsafe});
    case TokenKind::Identifier:
        if (peek().lexeme == "macro_rules") {
            return next.is(TokenKind::Not);
        }
        if (peek().lexeme == "union") {
            return next.is(TokenKind::Identifier);
        }
        if (peek().lexeme == "auto") {
            return next.is(TokenKind::KwTrait);
        }
        return false;
    default:
        return false;
    }
}

// ============================================================================
// Item Dispatch
// ============================================================================

auto Parser::parse_item() -> Result<ItemPtr, ParseError> {
    size_t start = pos_;
    auto item = make_box<Item>();

    auto attrs = parse_outer_attrs();
    if (is_err(attrs)) {
        return unwrap_err(attrs);
    }
    item->attrs = std::move(unwrap(attrs));

    auto vis = parse_visibility();
    if (is_err(vis)) {
        return unwrap_err(vis);
    }
    item->visibility = unwrap(vis);

    skip_item_qualifiers();

    auto finish = [&](auto decl) -> Result<ItemPtr, ParseError> {
        if (is_err(decl)) {
            return unwrap_err(decl);
        }
        item->kind = std::move(unwrap(decl));
        item->range = {start, pos_};
        return std::move(item);
    };
    auto other = [&](OtherItemKind kind, std::string name) -> Result<OtherItem, ParseError> {
        return OtherItem{.kind = kind, .name = std::move(name)};
    };

    switch (peek().kind) {
    case TokenKind::KwFn:
        return finish(parse_fn(start));

    case TokenKind::KwStruct:
    case TokenKind::KwEnum: {
        auto kind = advance().is(TokenKind::KwStruct) ? TypeDeclKind::Struct : TypeDeclKind::Enum;
        auto name = expect_name();
        if (is_err(name)) {
            return unwrap_err(name);
        }
        auto body = parse_adt_body();
        if (is_err(body)) {
            return unwrap_err(body);
        }
        return finish(Result<TypeDecl, ParseError>(
            TypeDecl{.kind = kind, .name = std::move(unwrap(name))}));
    }

    case TokenKind::KwType: {
        advance();
        auto name = expect_name();
        if (is_err(name)) {
            return unwrap_err(name);
        }
        auto rest = skip_until({TokenKind::Semi}, true);
        if (is_err(rest)) {
            return unwrap_err(rest);
        }
        auto semi = expect(TokenKind::Semi, "expected ';' after type alias");
        if (is_err(semi)) {
            return unwrap_err(semi);
        }
        return finish(Result<TypeDecl, ParseError>(
            TypeDecl{.kind = TypeDeclKind::TypeAlias, .name = std::move(unwrap(name))}));
    }

    case TokenKind::KwTrait:
        return finish(parse_trait(start));

    case TokenKind::KwImpl:
        return finish(parse_impl());

    case TokenKind::KwMod:
        return finish(parse_mod());

    case TokenKind::KwUse: {
        advance();
        auto rest = skip_until({TokenKind::Semi}, false);
        if (is_err(rest)) {
            return unwrap_err(rest);
        }
        auto semi = expect(TokenKind::Semi, "expected ';' after use declaration");
        if (is_err(semi)) {
            return unwrap_err(semi);
        }
        return finish(other(OtherItemKind::Use, ""));
    }

    case TokenKind::KwConst:
    case TokenKind::KwStatic: {
        auto kind = advance().is(TokenKind::KwConst) ? OtherItemKind::Const : OtherItemKind::Static;
        match(TokenKind::KwMut);
        std::string name = "_";
        if (!match(TokenKind::Underscore)) {
            auto n = expect_name();
            if (is_err(n)) {
                return unwrap_err(n);
            }
            name = std::move(unwrap(n));
        }
        auto rest = skip_until({TokenKind::Semi}, false);
        if (is_err(rest)) {
            return unwrap_err(rest);
        }
        auto semi = expect(TokenKind::Semi, "expected ';' after item");
        if (is_err(semi)) {
            return unwrap_err(semi);
        }
        return finish(other(kind, std::move(name)));
    }

    case TokenKind::KwExtern: {
        advance();
        if (match(TokenKind::KwCrate)) {
            auto name = expect_name();
            if (is_err(name)) {
                return unwrap_err(name);
            }
            auto rest = skip_until({TokenKind::Semi}, false);
            if (is_err(rest)) {
                return unwrap_err(rest);
            }
            auto semi = expect(TokenKind::Semi, "expected ';' after extern crate");
            if (is_err(semi)) {
                return unwrap_err(semi);
            }
            return finish(other(OtherItemKind::ExternCrate, std::move(unwrap(name))));
        }
        match(TokenKind::StringLiteral);
        if (!check(TokenKind::LBrace)) {
            return error_here("expected '{' after extern");
        }
        auto block = skip_balanced();
        if (is_err(block)) {
            return unwrap_err(block);
        }
        return finish(other(OtherItemKind::ExternBlock, ""));
    }

    case TokenKind::Identifier:
        if (check_word("union") && check_at(1, TokenKind::Identifier)) {
            advance();
            auto name = expect_name();
            if (is_err(name)) {
                return unwrap_err(name);
            }
            auto body = parse_adt_body();
            if (is_err(body)) {
                return unwrap_err(body);
            }
            return finish(other(OtherItemKind::Union, std::move(unwrap(name))));
        }
        return finish(parse_macro_item());

    case TokenKind::PathSep:
    case TokenKind::KwSelfValue:
    case TokenKind::KwSuper:
    case TokenKind::KwCrate:
        return finish(parse_macro_item());

    default:
        return error_here("expected item");
    }
}

// ============================================================================
// Functions
// ============================================================================

auto Parser::parse_fn(size_t start) -> Result<FnDecl, ParseError> {
    advance(); // 'fn'
    FnDecl fn;

    auto name = expect_name();
    if (is_err(name)) {
        return unwrap_err(name);
    }
    fn.name = std::move(unwrap(name));

    if (check(TokenKind::Lt)) {
        auto generics = skip_angle_brackets();
        if (is_err(generics)) {
            return unwrap_err(generics);
        }
    }

    if (!check(TokenKind::LParen)) {
        return error_here("expected '(' after function name");
    }
    auto params = skip_balanced();
    if (is_err(params)) {
        return unwrap_err(params);
    }

    if (match(TokenKind::RArrow)) {
        auto ret = skip_until({TokenKind::KwWhere, TokenKind::LBrace, TokenKind::Semi}, true);
        if (is_err(ret)) {
            return unwrap_err(ret);
        }
    }
    if (match(TokenKind::KwWhere)) {
        auto where = skip_until({TokenKind::LBrace, TokenKind::Semi}, true);
        if (is_err(where)) {
            return unwrap_err(where);
        }
    }

    fn.header = {start, pos_};

    if (match(TokenKind::Semi)) {
        return fn;
    }
    if (!check(TokenKind::LBrace)) {
        return error_here("expected function body");
    }
    auto body = parse_block();
    if (is_err(body)) {
        return unwrap_err(body);
    }
    fn.body = std::move(unwrap(body));
    return fn;
}

// ============================================================================
// Types, Traits, Impls and Modules
// ============================================================================

auto Parser::parse_adt_body() -> Result<Unit, ParseError> {
    while (true) {
        if (match(TokenKind::Semi)) {
            return Unit{};
        }
        if (check(TokenKind::LBrace)) {
            auto body = skip_balanced();
            if (is_err(body)) {
                return unwrap_err(body);
            }
            return Unit{};
        }
        if (check(TokenKind::Lt)) {
            auto generics = skip_angle_brackets();
            if (is_err(generics)) {
                return unwrap_err(generics);
            }
            continue;
        }
        if (check(TokenKind::LParen) || check(TokenKind::LBracket)) {
            auto fields = skip_balanced();
            if (is_err(fields)) {
                return unwrap_err(fields);
            }
            continue;
        }
        if (is_at_end() || lexer::is_close_delim(peek().kind)) {
            return error_here("expected ';' or '{'");
        }
        advance();
    }
}

auto Parser::parse_trait(size_t start) -> Result<TraitDecl, ParseError> {
    advance(); // 'trait'
    TraitDecl trait;

    auto name = expect_name();
    if (is_err(name)) {
        return unwrap_err(name);
    }
    trait.name = std::move(unwrap(name));

    if (check(TokenKind::Lt)) {
        auto generics = skip_angle_brackets();
        if (is_err(generics)) {
            return unwrap_err(generics);
        }
    }
    auto bounds = skip_until({TokenKind::LBrace}, true);
    if (is_err(bounds)) {
        return unwrap_err(bounds);
    }
    trait.header = {start, pos_};

    auto open = expect(TokenKind::LBrace, "expected '{' after trait header");
    if (is_err(open)) {
        return unwrap_err(open);
    }
    auto inner = parse_inner_attrs();
    if (is_err(inner)) {
        return unwrap_err(inner);
    }
    auto items = parse_items_until(TokenKind::RBrace);
    if (is_err(items)) {
        return unwrap_err(items);
    }
    trait.items = std::move(unwrap(items));
    advance(); // '}'
    return trait;
}

auto Parser::parse_impl() -> Result<ImplDecl, ParseError> {
    advance(); // 'impl'
    ImplDecl impl;

    if (check(TokenKind::Lt)) {
        auto generics = skip_angle_brackets();
        if (is_err(generics)) {
            return unwrap_err(generics);
        }
        impl.generics = unwrap(generics);
    }
    impl.negative = match(TokenKind::Not);

    auto first = skip_until({TokenKind::KwFor, TokenKind::KwWhere, TokenKind::LBrace}, true);
    if (is_err(first)) {
        return unwrap_err(first);
    }
    if (unwrap(first).empty()) {
        return error_here("expected type after 'impl'");
    }

    if (match(TokenKind::KwFor)) {
        impl.trait_ref = unwrap(first);
        auto self_type = skip_until({TokenKind::KwWhere, TokenKind::LBrace}, true);
        if (is_err(self_type)) {
            return unwrap_err(self_type);
        }
        impl.self_type = unwrap(self_type);
    } else {
        impl.self_type = unwrap(first);
    }

    if (match(TokenKind::KwWhere)) {
        auto where = skip_until({TokenKind::LBrace}, true);
        if (is_err(where)) {
            return unwrap_err(where);
        }
    }

    auto open = expect(TokenKind::LBrace, "expected '{' after impl header");
    if (is_err(open)) {
        return unwrap_err(open);
    }
    auto inner = parse_inner_attrs();
    if (is_err(inner)) {
        return unwrap_err(inner);
    }
    auto items = parse_items_until(TokenKind::RBrace);
    if (is_err(items)) {
        return unwrap_err(items);
    }
    impl.items = std::move(unwrap(items));
    advance(); // '}'
    return impl;
}

auto Parser::parse_mod() -> Result<ModDecl, ParseError> {
    advance(); // 'mod'
    ModDecl mod;

    auto name = expect_name();
    if (is_err(name)) {
        return unwrap_err(name);
    }
    mod.name = std::move(unwrap(name));

    if (match(TokenKind::Semi)) {
        return mod;
    }

    auto open = expect(TokenKind::LBrace, "expected '{' or ';' after module name");
    if (is_err(open)) {
        return unwrap_err(open);
    }
    auto inner = parse_inner_attrs();
    if (is_err(inner)) {
        return unwrap_err(inner);
    }
    auto items = parse_items_until(TokenKind::RBrace);
    if (is_err(items)) {
        return unwrap_err(items);
    }
    mod.items = std::move(unwrap(items));
    mod.is_inline = true;
    advance(); // '}'
    return mod;
}

// ============================================================================
// Macro Items
// ============================================================================

auto Parser::parse_macro_item() -> Result<OtherItem, ParseError> {
    std::string path;
    if (match(TokenKind::PathSep)) {
        path = "::";
    }
    while (true) {
        if (!peek().is_one_of({TokenKind::Identifier, TokenKind::KwSelfValue, TokenKind::KwSuper,
                               TokenKind::KwCrate})) {
            return error_here("expected item");
        }
        path += advance().text();
        if (check(TokenKind::PathSep) && !check_at(1, TokenKind::Not)) {
            advance();
            path += "::";
            continue;
        }
        break;
    }

    auto bang = expect(TokenKind::Not, "expected item");
    if (is_err(bang)) {
        return unwrap_err(bang);
    }

    OtherItem item{.kind = OtherItemKind::MacroCall, .name = path};
    if (path == "macro_rules") {
        item.kind = OtherItemKind::MacroRules;
    }
    if (check(TokenKind::Identifier)) {
        item.name = std::string(advance().text());
    }

    bool braced = check(TokenKind::LBrace);
    auto body = skip_balanced();
    if (is_err(body)) {
        return unwrap_err(body);
    }
    if (!braced) {
        auto semi = expect(TokenKind::Semi, "expected ';' after macro invocation");
        if (is_err(semi)) {
            return unwrap_err(semi);
        }
    }
    return item;
}

} // namespace semdiff::parser
