//! # Signature Rendering
//!
//! See `extract/signature.hpp` for the spacing rules.

#include "extract/signature.hpp"

#include <algorithm>

namespace semdiff::extract {

using lexer::TokenKind;
using parser::TokenRange;

namespace {

struct Piece {
    TokenKind kind;
    std::string_view text;
};

auto is_closer(TokenKind kind) -> bool {
    return kind == TokenKind::RParen || kind == TokenKind::RBracket ||
           kind == TokenKind::RBrace || kind == TokenKind::Gt;
}

auto no_space_after(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::LParen:
    case TokenKind::LBracket:
    case TokenKind::And:
    case TokenKind::AndAnd:
    case TokenKind::PathSep:
    case TokenKind::Pound:
    case TokenKind::Not:
    case TokenKind::Lt:
    case TokenKind::Dot:
    case TokenKind::Dollar:
        return true;
    default:
        return false;
    }
}

auto no_space_before(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::RParen:
    case TokenKind::RBracket:
    case TokenKind::Comma:
    case TokenKind::Semi:
    case TokenKind::Dot:
    case TokenKind::PathSep:
    case TokenKind::Question:
    case TokenKind::Colon:
    case TokenKind::Lt:
    case TokenKind::Gt:
        return true;
    default:
        return false;
    }
}

auto is_name_like(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::Identifier:
    case TokenKind::KwSelfValue:
    case TokenKind::KwSelfType:
    case TokenKind::KwSuper:
    case TokenKind::KwCrate:
    case TokenKind::KwPub:
    case TokenKind::Gt:
    case TokenKind::RParen:
    case TokenKind::RBracket:
        return true;
    default:
        return false;
    }
}

auto needs_space(const Piece& left, const Piece& right) -> bool {
    if (no_space_after(left.kind) || no_space_before(right.kind)) {
        return false;
    }
    bool opens = right.kind == TokenKind::LParen || right.kind == TokenKind::LBracket ||
                 right.kind == TokenKind::Not;
    return !(opens && is_name_like(left.kind));
}

auto is_excluded(size_t index, const std::vector<TokenRange>& excluded) -> bool {
    return std::any_of(excluded.begin(), excluded.end(), [index](const TokenRange& r) {
        return index >= r.begin && index < r.end;
    });
}

auto collect_pieces(const std::vector<lexer::Token>& tokens, TokenRange range,
                    const std::vector<TokenRange>& excluded) -> std::vector<Piece> {
    std::vector<Piece> pieces;
    size_t end = std::min(range.end, tokens.size());
    for (size_t i = range.begin; i < end; ++i) {
        const auto& tok = tokens[i];
        if (tok.is_eof() || is_excluded(i, excluded)) {
            continue;
        }
        if (tok.kind == TokenKind::Shr) {
            pieces.push_back({TokenKind::Gt, tok.lexeme.substr(0, 1)});
            pieces.push_back({TokenKind::Gt, tok.lexeme.substr(1, 1)});
            continue;
        }
        pieces.push_back({tok.kind, tok.lexeme});
    }

    // Drop trailing commas before closers, except the one that makes `(T,)`
    // a one-element tuple. A `(` right after a name opens an argument or
    // parameter list, where the comma carries no meaning.
    struct Group {
        bool tuple = false;
        size_t commas = 0;
    };
    std::vector<Group> open;
    std::vector<Piece> kept;
    kept.reserve(pieces.size());
    for (size_t i = 0; i < pieces.size(); ++i) {
        auto kind = pieces[i].kind;
        if (kind == TokenKind::LParen || kind == TokenKind::LBracket ||
            kind == TokenKind::LBrace || kind == TokenKind::Lt) {
            bool after_name = i > 0 && is_name_like(pieces[i - 1].kind);
            open.push_back({.tuple = kind == TokenKind::LParen && !after_name});
        } else if (is_closer(kind) && !open.empty()) {
            open.pop_back();
        } else if (kind == TokenKind::Comma && !open.empty()) {
            ++open.back().commas;
        }
        if (kind == TokenKind::Comma && i + 1 < pieces.size() && is_closer(pieces[i + 1].kind)) {
            bool singleton = !open.empty() && open.back().tuple && open.back().commas == 1 &&
                             pieces[i + 1].kind == TokenKind::RParen;
            if (!singleton) {
                continue;
            }
        }
        kept.push_back(pieces[i]);
    }
    return kept;
}

} // namespace

auto render_canonical(const std::vector<lexer::Token>& tokens, TokenRange range,
                      const std::vector<TokenRange>& excluded) -> std::string {
    auto pieces = collect_pieces(tokens, range, excluded);
    std::string out;
    for (size_t i = 0; i < pieces.size(); ++i) {
        if (i > 0 && needs_space(pieces[i - 1], pieces[i])) {
            out += ' ';
        }
        out += pieces[i].text;
    }
    return out;
}

auto doc_attribute_ranges(const parser::Item& item) -> std::vector<TokenRange> {
    std::vector<TokenRange> ranges;
    for (const auto& attr : item.attrs) {
        if (attr.is_doc) {
            ranges.push_back(attr.range);
        }
    }
    return ranges;
}

auto function_signature(const parser::SourceFile& file, const parser::Item& item)
    -> std::string {
    const auto& fn = item.as<parser::FnDecl>();
    return render_canonical(file.tokens, fn.header, doc_attribute_ranges(item));
}

auto type_signature(const parser::SourceFile& file, const parser::Item& item) -> std::string {
    return render_canonical(file.tokens, item.range, doc_attribute_ranges(item));
}

auto trait_signature(const parser::SourceFile& file, const parser::Item& item) -> std::string {
    const auto& trait = item.as<parser::TraitDecl>();
    std::string out = render_canonical(file.tokens, trait.header, doc_attribute_ranges(item));

    std::vector<std::string> associated;
    for (const auto& member : trait.items) {
        if (member->is<parser::FnDecl>()) {
            continue;
        }
        associated.push_back(
            render_canonical(file.tokens, member->range, doc_attribute_ranges(*member)));
    }
    if (!associated.empty()) {
        out += " {";
        for (const auto& text : associated) {
            out += ' ';
            out += text;
        }
        out += " }";
    }
    return out;
}

auto impl_owner(const parser::SourceFile& file, const parser::ImplDecl& impl) -> std::string {
    if (!impl.trait_ref.empty()) {
        return "<" + render_canonical(file.tokens, impl.self_type) + " as " +
               render_canonical(file.tokens, impl.trait_ref) + ">";
    }

    // Last name at nesting depth zero: `a::Foo<T>` -> `Foo`
    std::string_view last;
    int depth = 0;
    for (size_t i = impl.self_type.begin; i < impl.self_type.end; ++i) {
        const auto& tok = file.tokens[i];
        switch (tok.kind) {
        case TokenKind::Lt:
        case TokenKind::LParen:
        case TokenKind::LBracket:
            ++depth;
            break;
        case TokenKind::Gt:
        case TokenKind::RParen:
        case TokenKind::RBracket:
            --depth;
            break;
        case TokenKind::Shr:
            depth -= 2;
            break;
        case TokenKind::Identifier:
        case TokenKind::KwSelfType:
            if (depth == 0) {
                last = tok.text();
            }
            break;
        default:
            break;
        }
    }
    if (last.empty()) {
        return render_canonical(file.tokens, impl.self_type);
    }
    return std::string(last);
}

} // namespace semdiff::extract
